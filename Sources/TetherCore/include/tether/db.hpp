#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;

namespace tether {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// SQLite store the rows of a hydration come from. The entity core never
/// writes SQL; managers read rows here and stage them (see
/// basic_entity_manager::stage_query).
class database {
public:
    /// column name -> raw column value
    using row_t = std::unordered_map<std::string, column_value_t>;

    /// Opens read-write, creating the file if missing.
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// Every result row of `sql`, parameters bound positionally.
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Statement without result rows (schema setup, fixtures).
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

private:
    class statement;

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace tether

#endif // __cplusplus
