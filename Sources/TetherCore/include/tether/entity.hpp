#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "class_metadata.hpp"
#include "collection.hpp"
#include "entity_manager.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tether {

// ============================================================================
// Lifecycle state
// ============================================================================

enum class entity_state : int {
    managed = 1,    // has an identifier and is tracked by its manager
    new_ = 2,       // no identifier yet, not tracked
    detached = 3,   // has an identifier, no longer tracked
    deleted = 4,    // removed, or scheduled for removal
    locked = 6      // temporarily locked during a save/delete traversal
};

const char* to_string(entity_state state);

// ============================================================================
// entity - object with persistent state in a relational store
//
// Entities must be owned by a std::shared_ptr (use entity::create or a
// manager's create); inverse-side association writes hand out `this` as an
// entity_ptr.
//
// Ownership: fields, references and the change set hold related entities
// strongly. A to-one assignment on the foreign side stores this entity in the
// related entity's foreign field while this entity references it, so the pair
// owns each other. Call free() on either side once the pair is no longer
// needed; otherwise neither is destroyed.
// ============================================================================

class entity : public std::enable_shared_from_this<entity> {
public:
    using change_t = std::pair<value_t, value_t>;          // (old, new)
    using change_set_t = std::map<std::string, change_t>;
    using reference_map_t = std::map<std::string, value_t>;

    /// Resolves metadata through `em` and consumes any data it staged for
    /// `entity_name`. With staged data the entity starts Managed, otherwise New.
    entity(entity_manager& em, std::string entity_name);
    virtual ~entity() = default;

    entity(const entity&) = delete;
    entity& operator=(const entity&) = delete;

    static entity_ptr create(entity_manager& em, const std::string& entity_name);

    /// Uses the manager bound to `entity_name` in entity_manager_factory.
    static entity_ptr create(const std::string& entity_name);

    oid_t oid() const { return oid_; }
    const std::string& entity_name() const { return entity_name_; }

    // ========================================================================
    // Identity & state
    // ========================================================================

    entity_state state() const { return state_; }

    /// Throws invalid_state_error for values outside the five states.
    void set_state(entity_state state);

    bool is_new() const { return state_ == entity_state::new_; }
    bool is_modified() const { return !modified_.empty(); }

    /// Assign a single-column identifier. Marks the entity synchronized:
    /// the change set is cleared and a New entity becomes Managed.
    void assign_identifier(const value_t& id);

    /// Assign a (composite) identifier, field -> value.
    void assign_identifier(const data_t& id);

    const data_t& identifier() const { return id_; }

    // ========================================================================
    // Fields & references
    // ========================================================================

    /// Public accessor. Runs the field's custom accessor if one is registered;
    /// otherwise returns the loaded value, lazy-loads a lazily loaded relation
    /// through the manager, or returns null for declared-but-unloaded names.
    /// Throws invalid_field_error for undeclared names.
    value_t get_value(const std::string& name);

    /// Public mutator. Runs the custom mutator if one is registered,
    /// otherwise set_field().
    void set_value(const std::string& name, const value_t& value);

    /// Loaded field or reference without loading anything. Throws
    /// unknown_field_error if neither is loaded.
    value_t get_field(const std::string& name) const;

    /// Hook-free mutator with change tracking. Relations are delegated to
    /// set_reference(). Throws invalid_field_error for undeclared names.
    void set_field(const std::string& name, const value_t& value);

    /// Store an association after checking the value against the relation
    /// shape. To-one assignments also write the foreign key: on the local
    /// side into this entity's local field, on the foreign side into the
    /// related entity's foreign field (pointing back at this entity).
    void set_reference(const std::string& name, const value_t& value);

    /// True for a non-null loaded field, a set identifier value, or a non-null
    /// loaded reference. Never loads.
    bool contains(const std::string& name) const;

    /// Empty a loaded field (to an empty array), null a single reference, or
    /// clear a loaded collection in place.
    void remove(const std::string& name);

    const data_t& data() const { return data_; }

    bool has_reference(const std::string& name) const;

    /// Throws unknown_reference_error if the reference was never loaded/set.
    const value_t& get_reference(const std::string& name) const;

    const reference_map_t& references() const { return references_; }

    void set_related(const std::string& alias, collection_ptr coll);

    // ========================================================================
    // Change set
    // ========================================================================

    const change_set_t& change_set() const { return modified_; }

    /// Storage-ready values for every changed field, plus the discriminator
    /// column for single-table / joined inheritance. Leaves the change set
    /// untouched.
    data_t build_write_payload();

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Snapshot of state, fields, identifier and change set (references and
    /// the manager are not included), CBOR encoded. An entity held in an
    /// object field is embedded; one that encloses it in the snapshot is
    /// written as a back reference, so cycles are preserved.
    blob_t to_bytes() const;

    /// Rebuild an entity from to_bytes() output. The result gets a fresh oid.
    /// With no manager given, the manager bound to the stored entity name is
    /// used. Throws serialization_error on malformed input.
    static entity_ptr from_bytes(const blob_t& bytes, entity_manager* em = nullptr);

    // ========================================================================
    // Collaborators
    // ========================================================================

    const class_metadata& metadata() const { return *class_; }
    entity_manager& manager() const { return *em_; }

    /// Detach from the manager and drop fields, identifier, change set and
    /// references, releasing every entity they held. With deep, referenced
    /// entities are freed as well. No-op while Locked. The entity must not be
    /// used afterwards.
    void free(bool deep = false);

    /// The oid as a string
    std::string to_string() const { return std::to_string(oid_); }

    std::string debug_description() const;

private:
    struct restore_tag {};
    entity(entity_manager& em, std::string entity_name, restore_tag);

    void extract_identifier();
    void mark_synchronized();

    // Entities being encoded / restored, outermost first
    using snapshot_path_t = std::vector<const entity*>;
    using restore_path_t = std::vector<entity_ptr>;

    json encode_snapshot(snapshot_path_t& path) const;
    static entity_ptr decode_snapshot(const json& doc, entity_manager* em, restore_path_t& path);

    json encode_value(const std::string& name, const value_t& value, snapshot_path_t& path) const;
    value_t decode_value(const std::string& name, const json& encoded, restore_path_t& path) const;
    json encode_field(const std::string& name, const value_t& value) const;
    value_t decode_field(const std::string& name, const json& encoded) const;

    oid_t oid_;
    std::string entity_name_;
    entity_manager* em_;
    std::shared_ptr<const class_metadata> class_;
    entity_state state_ = entity_state::new_;

    data_t id_;
    data_t data_;
    change_set_t modified_;
    reference_map_t references_;
};

// ============================================================================
// traversal_lock - RAII Locked state for cascading save/delete walks
// ============================================================================

class traversal_lock {
public:
    explicit traversal_lock(entity& e);
    ~traversal_lock();

    traversal_lock(const traversal_lock&) = delete;
    traversal_lock& operator=(const traversal_lock&) = delete;

    /// State to restore on scope exit
    entity_state previous_state() const { return previous_; }

private:
    entity& entity_;
    entity_state previous_;
};

} // namespace tether

#endif // __cplusplus
