#include "tether/class_metadata.hpp"
#include "tether/errors.hpp"
#include <algorithm>

namespace tether {

class_metadata::class_metadata(std::string entity_name)
    : entity_name_(std::move(entity_name)) {}

class_metadata& class_metadata::add_field(const std::string& name, field_type type) {
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        field_order_.push_back(name);
        fields_.emplace(name, type);
    } else {
        it->second = type;
    }
    return *this;
}

class_metadata& class_metadata::set_identifier(std::vector<std::string> names) {
    for (const auto& name : names) {
        if (!has_field(name)) {
            add_field(name);
        }
    }
    identifier_ = std::move(names);
    return *this;
}

class_metadata& class_metadata::add_relation(relation_descriptor relation) {
    std::string name = relation.name;
    relations_[name] = std::move(relation);
    return *this;
}

class_metadata& class_metadata::set_enum_values(const std::string& field, std::vector<std::string> values) {
    add_field(field, field_type::enumerated);
    enum_values_[field] = std::move(values);
    return *this;
}

class_metadata& class_metadata::set_custom_accessor(const std::string& field, accessor_fn fn) {
    accessors_[field] = std::move(fn);
    return *this;
}

class_metadata& class_metadata::set_custom_mutator(const std::string& field, mutator_fn fn) {
    mutators_[field] = std::move(fn);
    return *this;
}

class_metadata& class_metadata::set_inheritance(inheritance_kind kind,
                                                const std::string& discriminator_column,
                                                std::map<std::string, std::string> discriminator_map) {
    inheritance_ = kind;
    discriminator_column_ = discriminator_column;
    discriminator_map_ = std::move(discriminator_map);
    if (kind != inheritance_kind::none && !discriminator_column_.empty() && !has_field(discriminator_column_)) {
        add_field(discriminator_column_);
    }
    return *this;
}

bool class_metadata::is_identifier(const std::string& name) const {
    return std::find(identifier_.begin(), identifier_.end(), name) != identifier_.end();
}

const std::string& class_metadata::single_identifier_field_name() const {
    if (identifier_.size() != 1) {
        throw invalid_identifier_error(entity_name_ + (identifier_.empty()
            ? " has no identifier"
            : " has a composite identifier"));
    }
    return identifier_.front();
}

bool class_metadata::has_field(const std::string& name) const {
    return fields_.count(name) > 0;
}

bool class_metadata::has_relation(const std::string& name) const {
    return relations_.count(name) > 0;
}

const relation_descriptor& class_metadata::get_relation(const std::string& name) const {
    auto it = relations_.find(name);
    if (it == relations_.end()) {
        throw invalid_field_error(entity_name_, name);
    }
    return it->second;
}

field_type class_metadata::type_of_field(const std::string& name) const {
    auto it = fields_.find(name);
    return it == fields_.end() ? field_type::plain : it->second;
}

std::optional<int64_t> class_metadata::enum_code_of(const std::string& field, const value_t& value) const {
    auto it = enum_values_.find(field);
    if (it == enum_values_.end()) {
        return std::nullopt;
    }
    const auto& values = it->second;
    for (size_t i = 0; i < values.size(); ++i) {
        if (loosely_equal(value, values[i])) {
            return static_cast<int64_t>(i);
        }
    }
    return std::nullopt;
}

value_t class_metadata::enum_value_of(const std::string& field, int64_t code) const {
    auto it = enum_values_.find(field);
    if (it == enum_values_.end() || code < 0 || static_cast<size_t>(code) >= it->second.size()) {
        return code;
    }
    return it->second[static_cast<size_t>(code)];
}

const accessor_fn* class_metadata::custom_accessor(const std::string& field) const {
    auto it = accessors_.find(field);
    return it == accessors_.end() ? nullptr : &it->second;
}

const mutator_fn* class_metadata::custom_mutator(const std::string& field) const {
    auto it = mutators_.find(field);
    return it == mutators_.end() ? nullptr : &it->second;
}

std::optional<std::string> class_metadata::discriminator_value_for(const std::string& entity_name) const {
    for (const auto& [value, name] : discriminator_map_) {
        if (name == entity_name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace tether
