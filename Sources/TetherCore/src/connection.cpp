#include "tether/connection.hpp"

namespace tether {

namespace {

json convert_json_booleans(const json& j) {
    if (j.is_boolean()) {
        return j.get<bool>() ? 1 : 0;
    }
    if (j.is_array()) {
        json out = json::array();
        for (const auto& item : j) {
            out.push_back(convert_json_booleans(item));
        }
        return out;
    }
    return j;
}

} // namespace

sqlite_connection::sqlite_connection(std::string path)
    : path_(std::move(path)) {}

sqlite_connection::sqlite_connection(std::shared_ptr<database> db)
    : db_(std::move(db)) {}

value_t sqlite_connection::convert_boolean(const value_t& value) const {
    if (auto* b = std::get_if<bool>(&value)) {
        return static_cast<int64_t>(*b ? 1 : 0);
    }
    if (auto* j = std::get_if<json>(&value)) {
        if (j->is_boolean() || j->is_array()) {
            return convert_json_booleans(*j);
        }
    }
    return value;
}

std::vector<database::row_t> sqlite_connection::fetch_rows(const std::string& sql,
                                                           const std::vector<column_value_t>& params) const {
    return open().query(sql, params);
}

bool sqlite_connection::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

database& sqlite_connection::open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        db_ = std::make_shared<database>(path_);
    }
    return *db_;
}

} // namespace tether
