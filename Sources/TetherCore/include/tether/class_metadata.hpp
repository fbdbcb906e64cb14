#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

// How a field value is converted on its way to storage / a snapshot
enum class field_type {
    plain,            // passed through unchanged
    array,            // structured, flattened to JSON text
    object,           // structured, flattened to JSON text (may hold an entity)
    compressed_text,  // zlib-compressed large text
    boolean,          // converted through the connection
    enumerated        // stored as the integer index of the value
};

enum class relation_shape {
    one_to_one,
    one_to_many,
    many_to_many     // via association table
};

// Which side holds the foreign key column
enum class owning_side {
    local,    // this entity's local_field points at the related entity
    foreign   // the related entity's foreign_field points back at this entity
};

enum class inheritance_kind {
    none,
    single_table,
    joined
};

struct relation_descriptor {
    std::string name;
    std::string target;                          // related entity name
    relation_shape shape = relation_shape::one_to_one;
    owning_side side = owning_side::local;
    bool lazily_loaded = true;
    std::string local_field;
    std::string foreign_field;
};

// Field override hooks, registered per (entity type, field)
using accessor_fn = std::function<value_t(entity&)>;
using mutator_fn = std::function<void(entity&, const value_t&)>;

/// Immutable schema description of one entity type.
///
/// Built once with the fluent setters, then registered with an entity manager
/// which shares it (as shared_ptr<const class_metadata>) with every instance.
class class_metadata {
public:
    explicit class_metadata(std::string entity_name);

    // ------------------------------------------------------------------------
    // Building
    // ------------------------------------------------------------------------

    class_metadata& add_field(const std::string& name, field_type type = field_type::plain);

    /// One name for a single-column key, several for a composite key. Every
    /// name is added as a plain field if not declared yet.
    class_metadata& set_identifier(std::vector<std::string> names);

    class_metadata& add_relation(relation_descriptor relation);

    /// Declares `field` as enumerated; the value's index is its storage code.
    class_metadata& set_enum_values(const std::string& field, std::vector<std::string> values);

    class_metadata& set_custom_accessor(const std::string& field, accessor_fn fn);
    class_metadata& set_custom_mutator(const std::string& field, mutator_fn fn);

    /// discriminator_map maps discriminator value -> entity name. The
    /// discriminator column is declared as a plain field if missing.
    class_metadata& set_inheritance(inheritance_kind kind,
                                    const std::string& discriminator_column,
                                    std::map<std::string, std::string> discriminator_map);

    // ------------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------------

    const std::string& entity_name() const { return entity_name_; }

    bool is_identifier_composite() const { return identifier_.size() > 1; }
    const std::vector<std::string>& identifier_field_names() const { return identifier_; }
    bool is_identifier(const std::string& name) const;

    /// Throws invalid_identifier_error for composite or missing identifiers.
    const std::string& single_identifier_field_name() const;

    bool has_field(const std::string& name) const;
    bool has_relation(const std::string& name) const;

    /// Throws invalid_field_error if no such relation.
    const relation_descriptor& get_relation(const std::string& name) const;

    /// plain for names that are not declared fields
    field_type type_of_field(const std::string& name) const;

    const std::vector<std::string>& field_names() const { return field_order_; }

    std::optional<int64_t> enum_code_of(const std::string& field, const value_t& value) const;
    value_t enum_value_of(const std::string& field, int64_t code) const;

    const accessor_fn* custom_accessor(const std::string& field) const;
    const mutator_fn* custom_mutator(const std::string& field) const;

    inheritance_kind inheritance() const { return inheritance_; }
    const std::string& discriminator_column() const { return discriminator_column_; }
    const std::map<std::string, std::string>& discriminator_map() const { return discriminator_map_; }

    /// Discriminator value under which `entity_name` is mapped, if any.
    std::optional<std::string> discriminator_value_for(const std::string& entity_name) const;

private:
    std::string entity_name_;
    std::vector<std::string> identifier_;
    std::vector<std::string> field_order_;
    std::unordered_map<std::string, field_type> fields_;
    std::map<std::string, relation_descriptor> relations_;
    std::unordered_map<std::string, std::vector<std::string>> enum_values_;
    std::unordered_map<std::string, accessor_fn> accessors_;
    std::unordered_map<std::string, mutator_fn> mutators_;
    inheritance_kind inheritance_ = inheritance_kind::none;
    std::string discriminator_column_;
    std::map<std::string, std::string> discriminator_map_;
};

} // namespace tether

#endif // __cplusplus
