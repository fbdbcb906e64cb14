#include "tether/db.hpp"
#include "tether/log.hpp"
#include <sqlite3.h>
#include <type_traits>

namespace tether {

// ============================================================================
// statement - prepared statement, finalized on scope exit
// ============================================================================

class database::statement {
public:
    statement(sqlite3* db, const std::string& sql, const std::vector<column_value_t>& params)
        : db_(db), sql_(sql) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            fail("prepare");
        }
        stmt_.reset(raw);

        int index = 1;
        for (const auto& param : params) {
            bind(index++, param);
        }
    }

    /// True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW) return true;
        if (rc != SQLITE_DONE) fail("step");
        return false;
    }

    row_t row() const {
        row_t out;
        int count = sqlite3_column_count(stmt_.get());
        for (int i = 0; i < count; ++i) {
            out[sqlite3_column_name(stmt_.get(), i)] = column(i);
        }
        return out;
    }

private:
    struct finalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };

    [[noreturn]] void fail(const char* stage) const {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR(log_tag::db, "%s failed: %s in %s", stage, error.c_str(), sql_.c_str());
        throw db_error(std::string(stage) + " failed: " + error + " (SQL: " + sql_ + ")");
    }

    void bind(int index, const column_value_t& value) {
        sqlite3_stmt* stmt = stmt_.get();
        int rc = std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, index, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            } else if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                return sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);
        if (rc != SQLITE_OK) fail("bind");
    }

    column_value_t column(int index) const {
        sqlite3_stmt* stmt = stmt_.get();
        switch (sqlite3_column_type(stmt, index)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt, index);
            case SQLITE_TEXT: {
                auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
                if (!text) return std::string();
                return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
            }
            case SQLITE_BLOB: {
                auto bytes = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, index));
                return blob_t(bytes, bytes + sqlite3_column_bytes(stmt, index));
            }
            default:
                return nullptr;
        }
    }

    sqlite3* db_;
    std::string sql_;
    std::unique_ptr<sqlite3_stmt, finalizer> stmt_;
};

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR(log_tag::db, "Failed to open %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG(log_tag::db, "Opened %s", path.c_str());
}

database::~database() {
    sqlite3_close(db_);
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql, params);
    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    LOG_DEBUG(log_tag::db, "%zu rows from %s", rows.size(), path_.c_str());
    return rows;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql, params);
    while (stmt.step()) {
    }
}

} // namespace tether
