#include "tether/entity_manager.hpp"
#include "tether/entity.hpp"
#include "tether/codec.hpp"
#include "tether/errors.hpp"
#include "tether/log.hpp"
#include <algorithm>

namespace tether {

basic_entity_manager::basic_entity_manager(configuration config)
    : basic_entity_manager(config, std::make_shared<sqlite_connection>(config.path)) {}

basic_entity_manager::basic_entity_manager(configuration config, std::shared_ptr<connection> conn)
    : config_(std::move(config)), connection_(std::move(conn)) {
    if (!connection_) {
        throw entity_error("basic_entity_manager requires a connection");
    }
    if (config_.logging) {
        set_log_level(*config_.logging);
        LOG_INFO(log_tag::manager, "Log level set to %s", to_string(*config_.logging));
    }
}

basic_entity_manager::~basic_entity_manager() {
    entity_manager_factory::instance().unbind(this);
}

std::shared_ptr<const class_metadata> basic_entity_manager::register_class(class_metadata metadata) {
    std::string name = metadata.entity_name();
    auto shared = std::make_shared<const class_metadata>(std::move(metadata));
    metadata_[name] = shared;
    entity_manager_factory::instance().bind(name, this);
    LOG_DEBUG(log_tag::manager, "Registered %s", name.c_str());
    return shared;
}

void basic_entity_manager::set_relation_loader(const std::string& entity_name,
                                               const std::string& relation,
                                               relation_loader loader) {
    loaders_[{entity_name, relation}] = std::move(loader);
}

void basic_entity_manager::stage(const std::string& entity_name, data_t data) {
    staged_[entity_name] = std::move(data);
}

void basic_entity_manager::stage_row(const std::string& entity_name, const database::row_t& row) {
    auto meta = class_metadata_for(entity_name);
    data_t data;

    for (const auto& [column, raw] : row) {
        if (!meta->has_field(column)) {
            LOG_DEBUG(log_tag::manager, "Skipping column %s for %s", column.c_str(), entity_name.c_str());
            continue;
        }
        value_t value = to_value(raw);
        if (is_null(value)) {
            data[column] = nullptr;
            continue;
        }

        switch (meta->type_of_field(column)) {
            case field_type::boolean:
                data[column] = is_truthy(value);
                break;
            case field_type::array:
            case field_type::object:
                if (auto* text = std::get_if<std::string>(&value)) {
                    data[column] = codec::restore_structured(*text);
                } else {
                    data[column] = value;
                }
                break;
            case field_type::compressed_text:
                if (auto* bytes = std::get_if<blob_t>(&value)) {
                    data[column] = codec::decompress(*bytes);
                } else {
                    data[column] = value;
                }
                break;
            case field_type::enumerated:
                if (auto* code = std::get_if<int64_t>(&value)) {
                    data[column] = meta->enum_value_of(column, *code);
                } else {
                    data[column] = value;
                }
                break;
            case field_type::plain:
                data[column] = value;
                break;
        }
    }

    stage(entity_name, std::move(data));
}

entity_ptr basic_entity_manager::create(const std::string& entity_name) {
    auto e = entity::create(*this, entity_name);
    if (!e->is_new()) {
        manage(e);
    }
    return e;
}

bool basic_entity_manager::stage_query(const std::string& entity_name,
                                       const std::string& sql,
                                       const std::vector<column_value_t>& params) {
    auto rows = connection_->fetch_rows(sql, params);
    if (rows.empty()) {
        LOG_DEBUG(log_tag::manager, "No %s row for %s", entity_name.c_str(), sql.c_str());
        return false;
    }
    if (rows.size() > 1) {
        LOG_WARN(log_tag::manager, "%zu %s rows for %s, staging the first",
                 rows.size(), entity_name.c_str(), sql.c_str());
    }
    stage_row(entity_name, rows.front());
    return true;
}

void basic_entity_manager::manage(const entity_ptr& e) {
    if (!e) return;
    if (identity_map_.size() >= prune_threshold_) {
        prune();
        prune_threshold_ = std::max(min_prune_threshold, identity_map_.size() * 2);
    }
    identity_map_[e->oid()] = e;
}

size_t basic_entity_manager::prune() {
    size_t removed = 0;
    for (auto it = identity_map_.begin(); it != identity_map_.end();) {
        if (it->second.expired()) {
            it = identity_map_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG(log_tag::manager, "Pruned %zu destroyed entities", removed);
    }
    return removed;
}

bool basic_entity_manager::is_managed(const entity& e) const {
    auto it = identity_map_.find(e.oid());
    return it != identity_map_.end() && !it->second.expired();
}

size_t basic_entity_manager::managed_count() const {
    size_t count = 0;
    for (const auto& [_, weak] : identity_map_) {
        if (!weak.expired()) ++count;
    }
    return count;
}

std::optional<data_t> basic_entity_manager::take_staged_data(const std::string& entity_name) {
    auto it = staged_.find(entity_name);
    if (it == staged_.end()) {
        return std::nullopt;
    }
    data_t data = std::move(it->second);
    staged_.erase(it);
    return data;
}

std::shared_ptr<const class_metadata> basic_entity_manager::class_metadata_for(const std::string& entity_name) const {
    auto it = metadata_.find(entity_name);
    if (it == metadata_.end()) {
        throw entity_error("Unknown entity type: " + entity_name);
    }
    return it->second;
}

void basic_entity_manager::detach(entity& e) {
    identity_map_.erase(e.oid());
    if (e.state() == entity_state::managed) {
        e.set_state(entity_state::detached);
    }
}

value_t basic_entity_manager::load_relation(entity& e, const relation_descriptor& relation) {
    auto it = loaders_.find({e.entity_name(), relation.name});
    if (it == loaders_.end()) {
        LOG_WARN(log_tag::manager, "No loader for %s.%s", e.entity_name().c_str(), relation.name.c_str());
        return nullptr;
    }
    LOG_DEBUG(log_tag::manager, "Loading %s.%s", e.entity_name().c_str(), relation.name.c_str());
    return it->second(e, relation);
}

} // namespace tether
