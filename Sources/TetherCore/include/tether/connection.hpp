#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tether {

/// Store-specific collaborator of the entity core: value conversions for
/// write payloads, and the rows a manager stages for hydration.
class connection {
public:
    virtual ~connection() = default;

    /// Convert a boolean (or an array of booleans) into the representation
    /// the store uses. Non-boolean values are returned unchanged.
    virtual value_t convert_boolean(const value_t& value) const = 0;

    /// Rows matching `sql`. Throws db_error on failure.
    virtual std::vector<database::row_t> fetch_rows(const std::string& sql,
                                                    const std::vector<column_value_t>& params) const = 0;
};

/// SQLite has no boolean column type; booleans are stored as INTEGER 0/1.
/// A connection built from a path opens the database on its first read.
class sqlite_connection : public connection {
public:
    explicit sqlite_connection(std::string path);
    explicit sqlite_connection(std::shared_ptr<database> db);

    value_t convert_boolean(const value_t& value) const override;

    std::vector<database::row_t> fetch_rows(const std::string& sql,
                                            const std::vector<column_value_t>& params) const override;

    bool is_open() const;

private:
    database& open() const;

    std::string path_;
    mutable std::mutex mutex_;
    mutable std::shared_ptr<database> db_;
};

} // namespace tether

#endif // __cplusplus
