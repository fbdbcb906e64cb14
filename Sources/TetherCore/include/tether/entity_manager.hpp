#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "class_metadata.hpp"
#include "configuration.hpp"
#include "connection.hpp"
#include "db.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether {

// ============================================================================
// entity_manager - the collaborator that owns an entity's persistence
// ============================================================================

class entity_manager {
public:
    virtual ~entity_manager() = default;

    /// Data fetched before construction of an entity of this type. Returns the
    /// staged row once, then nothing until something new is staged.
    virtual std::optional<data_t> take_staged_data(const std::string& entity_name) = 0;

    /// Throws entity_error if the type was never registered.
    virtual std::shared_ptr<const class_metadata> class_metadata_for(const std::string& entity_name) const = 0;

    /// Stop tracking the entity.
    virtual void detach(entity& e) = 0;

    /// Lazy-load an association. May block on the store.
    virtual value_t load_relation(entity& e, const relation_descriptor& relation) = 0;

    virtual const connection& get_connection() const = 0;

    virtual const configuration& config() const = 0;

    /// Next process-unique object id.
    virtual oid_t next_oid() = 0;
};

/// Process-wide oid source shared by every manager, defined in tether.cpp.
/// Ids start at 1 and only increase.
oid_t allocate_oid();

// ============================================================================
// entity_manager_factory - resolves the manager responsible for a type
// (used when an entity is rebuilt from bytes)
// ============================================================================

class entity_manager_factory {
public:
    // Singleton accessor - defined in tether.cpp to avoid ODR violations
    static entity_manager_factory& instance();

    void bind(const std::string& entity_name, entity_manager* em);
    void set_default(entity_manager* em);

    /// Remove every binding to `em` (including the default).
    void unbind(entity_manager* em);

    /// Throws entity_error if neither a binding nor a default exists.
    entity_manager& get_manager(const std::string& entity_name) const;

private:
    entity_manager_factory() = default;
    mutable std::mutex mutex_;
    std::map<std::string, entity_manager*> managers_;
    entity_manager* default_ = nullptr;
};

// ============================================================================
// basic_entity_manager - in-memory manager with an identity map
// ============================================================================

using relation_loader = std::function<value_t(entity&, const relation_descriptor&)>;

class basic_entity_manager : public entity_manager {
public:
    explicit basic_entity_manager(configuration config = {});
    basic_entity_manager(configuration config, std::shared_ptr<connection> conn);
    ~basic_entity_manager() override;

    // Non-copyable
    basic_entity_manager(const basic_entity_manager&) = delete;
    basic_entity_manager& operator=(const basic_entity_manager&) = delete;

    /// Register a type and bind it to this manager in the factory.
    std::shared_ptr<const class_metadata> register_class(class_metadata metadata);

    void set_relation_loader(const std::string& entity_name,
                             const std::string& relation,
                             relation_loader loader);

    /// Stage already-converted field values for the next construction of
    /// `entity_name`.
    void stage(const std::string& entity_name, data_t data);

    /// Stage a raw storage row, converting columns per field type (integer ->
    /// boolean, JSON text -> structured, compressed bytes -> text, index ->
    /// enum value). Columns that are not declared fields are skipped.
    void stage_row(const std::string& entity_name, const database::row_t& row);

    /// Read rows through the connection and stage the first one with
    /// stage_row(). Returns false when the query matched nothing.
    bool stage_query(const std::string& entity_name,
                     const std::string& sql,
                     const std::vector<column_value_t>& params = {});

    /// Construct an entity; entities hydrated from staged data are tracked.
    entity_ptr create(const std::string& entity_name);

    /// Track an entity in the identity map. Entries of destroyed entities
    /// are pruned once the map has doubled since the last prune.
    void manage(const entity_ptr& e);
    bool is_managed(const entity& e) const;
    size_t managed_count() const;

    /// Drop identity map entries of destroyed entities. Returns how many.
    size_t prune();

    // entity_manager
    std::optional<data_t> take_staged_data(const std::string& entity_name) override;
    std::shared_ptr<const class_metadata> class_metadata_for(const std::string& entity_name) const override;
    void detach(entity& e) override;
    value_t load_relation(entity& e, const relation_descriptor& relation) override;
    const connection& get_connection() const override { return *connection_; }
    const configuration& config() const override { return config_; }
    oid_t next_oid() override { return allocate_oid(); }

private:
    configuration config_;
    std::shared_ptr<connection> connection_;
    std::unordered_map<std::string, std::shared_ptr<const class_metadata>> metadata_;
    std::unordered_map<std::string, data_t> staged_;
    std::map<std::pair<std::string, std::string>, relation_loader> loaders_;
    static constexpr size_t min_prune_threshold = 64;

    std::unordered_map<oid_t, std::weak_ptr<entity>> identity_map_;
    size_t prune_threshold_ = min_prune_threshold;
};

} // namespace tether

#endif // __cplusplus
