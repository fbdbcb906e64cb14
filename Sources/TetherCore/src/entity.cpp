#include "tether/entity.hpp"
#include "tether/codec.hpp"
#include "tether/log.hpp"
#include <sstream>

namespace tether {

const char* to_string(entity_state state) {
    switch (state) {
        case entity_state::managed:  return "managed";
        case entity_state::new_:     return "new";
        case entity_state::detached: return "detached";
        case entity_state::deleted:  return "deleted";
        case entity_state::locked:   return "locked";
    }
    return "invalid";
}

namespace {

bool is_valid_state(entity_state state) {
    switch (state) {
        case entity_state::managed:
        case entity_state::new_:
        case entity_state::detached:
        case entity_state::deleted:
        case entity_state::locked:
            return true;
    }
    return false;
}

bool strictly_equal(const value_t& a, const value_t& b) {
    return a.index() == b.index() && a == b;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

entity::entity(entity_manager& em, std::string entity_name)
    : oid_(em.next_oid()),
      entity_name_(std::move(entity_name)),
      em_(&em),
      class_(em.class_metadata_for(entity_name_)) {
    auto staged = em.take_staged_data(entity_name_);
    if (staged && !staged->empty()) {
        data_ = std::move(*staged);
        state_ = entity_state::managed;
        extract_identifier();
        LOG_DEBUG(log_tag::entity, "Hydrated %s #%llu", entity_name_.c_str(),
                  static_cast<unsigned long long>(oid_));
    } else {
        state_ = entity_state::new_;
    }
}

entity::entity(entity_manager& em, std::string entity_name, restore_tag)
    : oid_(em.next_oid()),
      entity_name_(std::move(entity_name)),
      em_(&em),
      class_(em.class_metadata_for(entity_name_)) {}

entity_ptr entity::create(entity_manager& em, const std::string& entity_name) {
    return std::make_shared<entity>(em, entity_name);
}

entity_ptr entity::create(const std::string& entity_name) {
    return create(entity_manager_factory::instance().get_manager(entity_name), entity_name);
}

// ============================================================================
// Identity & state
// ============================================================================

void entity::set_state(entity_state state) {
    if (!is_valid_state(state)) {
        LOG_ERROR(log_tag::entity, "Invalid state %d for %s", static_cast<int>(state), entity_name_.c_str());
        throw invalid_state_error(static_cast<int>(state));
    }
    state_ = state;
}

void entity::extract_identifier() {
    const auto& names = class_->identifier_field_names();
    if (class_->is_identifier_composite()) {
        // every key part gets a slot, null when missing
        for (const auto& name : names) {
            auto it = data_.find(name);
            id_[name] = (it != data_.end() && !is_null(it->second)) ? it->second : value_t(nullptr);
        }
    } else if (!names.empty()) {
        auto it = data_.find(names.front());
        if (it != data_.end() && !is_null(it->second)) {
            id_[names.front()] = it->second;
        }
    }
}

void entity::mark_synchronized() {
    modified_.clear();
    if (state_ == entity_state::new_) {
        state_ = entity_state::managed;
    }
}

void entity::assign_identifier(const value_t& id) {
    if (class_->is_identifier_composite()) {
        throw invalid_identifier_error("Composite identifier of " + entity_name_ +
                                       " requires a field -> value mapping");
    }
    const auto& name = class_->single_identifier_field_name();
    id_[name] = id;
    data_[name] = id;
    mark_synchronized();
}

void entity::assign_identifier(const data_t& id) {
    for (const auto& [name, _] : id) {
        if (!class_->is_identifier(name)) {
            throw invalid_identifier_error("'" + name + "' is not an identifier field of " + entity_name_);
        }
    }
    for (const auto& [name, value] : id) {
        id_[name] = value;
        data_[name] = value;
    }
    mark_synchronized();
}

// ============================================================================
// Fields & references
// ============================================================================

value_t entity::get_value(const std::string& name) {
    if (const auto* accessor = class_->custom_accessor(name)) {
        return (*accessor)(*this);
    }

    auto field = data_.find(name);
    if (field != data_.end()) {
        return field->second;
    }
    auto ref = references_.find(name);
    if (ref != references_.end()) {
        return ref->second;
    }

    if (class_->has_field(name)) {
        return nullptr;
    }
    if (class_->has_relation(name)) {
        const auto& relation = class_->get_relation(name);
        if (!relation.lazily_loaded) {
            return nullptr;
        }
        value_t loaded = em_->load_relation(*this, relation);
        references_[name] = loaded;
        return loaded;
    }

    throw invalid_field_error(entity_name_, name);
}

void entity::set_value(const std::string& name, const value_t& value) {
    if (const auto* mutator = class_->custom_mutator(name)) {
        (*mutator)(*this, value);
        return;
    }
    set_field(name, value);
}

value_t entity::get_field(const std::string& name) const {
    auto field = data_.find(name);
    if (field != data_.end()) {
        return field->second;
    }
    auto ref = references_.find(name);
    if (ref != references_.end()) {
        return ref->second;
    }
    throw unknown_field_error(name);
}

void entity::set_field(const std::string& name, const value_t& value) {
    if (class_->has_field(name)) {
        auto it = data_.find(name);
        value_t old = it != data_.end() ? it->second : value_t(nullptr);

        bool unchanged = em_->config().strict_change_tracking
            ? strictly_equal(old, value)
            : loosely_equal(old, value);
        if (unchanged) {
            return;
        }

        data_[name] = value;
        modified_[name] = change_t(old, value);
        if (is_new() && class_->is_identifier(name)) {
            id_[name] = value;
        }
        return;
    }

    if (class_->has_relation(name)) {
        set_reference(name, value);
        return;
    }

    throw invalid_field_error(entity_name_, name);
}

void entity::set_reference(const std::string& name, const value_t& value) {
    const auto& relation = class_->get_relation(name);

    if (is_null(value)) {
        references_[name] = value;
        return;
    }

    switch (relation.shape) {
        case relation_shape::one_to_many: {
            auto* coll = std::get_if<collection_ptr>(&value);
            if (!coll || !*coll) {
                throw invalid_reference_error(reference_kind::one_to_many, name);
            }
            auto cached = references_.find(name);
            if (cached != references_.end()) {
                auto* existing = std::get_if<collection_ptr>(&cached->second);
                if (existing && *existing) {
                    if (existing->get() != coll->get()) {
                        (*existing)->set_data((*coll)->data());
                    }
                    return;
                }
            }
            break;
        }

        case relation_shape::many_to_many:
            if (!std::holds_alternative<collection_ptr>(value)) {
                throw invalid_reference_error(reference_kind::many_to_many, name);
            }
            break;

        case relation_shape::one_to_one: {
            auto* related = std::get_if<entity_ptr>(&value);
            if (!related || !*related) {
                throw invalid_reference_error(reference_kind::one_to_one, name);
            }

            if (relation.side == owning_side::local) {
                if (!relation.local_field.empty()) {
                    const auto& target_ids = (*related)->metadata().identifier_field_names();
                    bool keyed_by_identifier = relation.foreign_field.empty() ||
                        (!target_ids.empty() && target_ids.front() == relation.foreign_field);
                    if (keyed_by_identifier) {
                        set_value(relation.local_field, *related);
                    } else {
                        set_value(relation.local_field, (*related)->get_value(relation.foreign_field));
                    }
                }
            } else if (!relation.foreign_field.empty()) {
                // the related entity now owns this one and vice versa; free() breaks the cycle
                entity_ptr self = weak_from_this().lock();
                if (!self) {
                    throw entity_error("Entity " + entity_name_ + " is not owned by a shared_ptr");
                }
                (*related)->set_value(relation.foreign_field, self);
            }
            break;
        }
    }

    references_[name] = value;
}

bool entity::contains(const std::string& name) const {
    auto field = data_.find(name);
    if (field != data_.end() && !is_null(field->second)) {
        return true;
    }
    auto id = id_.find(name);
    if (id != id_.end() && !is_null(id->second)) {
        return true;
    }
    auto ref = references_.find(name);
    return ref != references_.end() && !is_null(ref->second);
}

void entity::remove(const std::string& name) {
    auto field = data_.find(name);
    if (field != data_.end()) {
        field->second = json::array();
        return;
    }

    auto ref = references_.find(name);
    if (ref == references_.end()) {
        return;
    }
    if (auto* coll = std::get_if<collection_ptr>(&ref->second)) {
        if (*coll) {
            (*coll)->clear();
        }
    } else {
        ref->second = nullptr;
    }
}

bool entity::has_reference(const std::string& name) const {
    return references_.count(name) > 0;
}

const value_t& entity::get_reference(const std::string& name) const {
    auto it = references_.find(name);
    if (it == references_.end()) {
        throw unknown_reference_error(name);
    }
    return it->second;
}

void entity::set_related(const std::string& alias, collection_ptr coll) {
    references_[alias] = std::move(coll);
}

// ============================================================================
// Change set
// ============================================================================

data_t entity::build_write_payload() {
    data_t payload;
    const auto& config = em_->config();

    for (const auto& [name, change] : modified_) {
        auto it = data_.find(name);
        const value_t& value = it != data_.end() ? it->second : change.second;

        if (is_null(value)) {
            payload[name] = nullptr;
            continue;
        }

        switch (class_->type_of_field(name)) {
            case field_type::array:
            case field_type::object:
                // related entities are resolved to keys by the persister
                if (std::holds_alternative<entity_ptr>(value)) {
                    payload[name] = value;
                } else {
                    payload[name] = codec::flatten(value);
                }
                break;
            case field_type::compressed_text:
                payload[name] = codec::compress(value, config.payload_compression_level);
                break;
            case field_type::boolean:
                payload[name] = em_->get_connection().convert_boolean(value);
                break;
            case field_type::enumerated:
                if (auto code = class_->enum_code_of(name, value)) {
                    payload[name] = *code;
                } else {
                    LOG_WARN(log_tag::entity, "%s.%s: '%s' is not an enumerated value",
                             entity_name_.c_str(), name.c_str(), to_display_string(value).c_str());
                    payload[name] = value;
                }
                break;
            case field_type::plain:
                payload[name] = value;
                break;
        }
    }

    if (class_->inheritance() != inheritance_kind::none) {
        const auto& column = class_->discriminator_column();
        auto discriminator = class_->discriminator_value_for(entity_name_);
        if (!discriminator) {
            LOG_WARN(log_tag::entity, "%s has no discriminator value", entity_name_.c_str());
        } else {
            auto current = data_.find(column);
            if (current == data_.end() || is_null(current->second) ||
                to_display_string(current->second) != *discriminator) {
                data_[column] = *discriminator;
                payload[column] = *discriminator;
            }
        }
    }

    return payload;
}

// ============================================================================
// Lifecycle
// ============================================================================

void entity::free(bool deep) {
    if (state_ == entity_state::locked) {
        return;
    }

    em_->detach(*this);
    data_.clear();
    id_.clear();
    modified_.clear();

    // Emptied before recursing so reference cycles terminate
    reference_map_t references = std::move(references_);
    references_.clear();

    if (!deep) {
        return;
    }
    for (auto& [_, ref] : references) {
        if (auto* related = std::get_if<entity_ptr>(&ref)) {
            if (*related) (*related)->free(deep);
        } else if (auto* coll = std::get_if<collection_ptr>(&ref)) {
            if (*coll) (*coll)->free(deep);
        }
    }
}

std::string entity::debug_description() const {
    std::ostringstream ss;
    ss << entity_name_ << " #" << oid_ << " (" << tether::to_string(state_) << ")\n";

    ss << "  id:";
    for (const auto& [name, value] : id_) {
        ss << " " << name << "=" << to_display_string(value);
    }
    ss << "\n";

    for (const auto& [name, value] : data_) {
        ss << "  " << name << ": " << to_display_string(value);
        if (modified_.count(name)) ss << " *";
        ss << "\n";
    }
    for (const auto& [name, value] : references_) {
        ss << "  -> " << name << ": " << value_kind_name(value) << "\n";
    }
    return ss.str();
}

// ============================================================================
// traversal_lock
// ============================================================================

traversal_lock::traversal_lock(entity& e) : entity_(e), previous_(e.state()) {
    entity_.set_state(entity_state::locked);
}

traversal_lock::~traversal_lock() {
    entity_.set_state(previous_);
}

} // namespace tether
