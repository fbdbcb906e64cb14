#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>

namespace tether {

/// Ordered set of related entities backing a to-many association.
///
/// The collection object itself is what an entity caches; replacing its
/// contents with set_data() keeps every holder of the collection_ptr looking
/// at the same object.
class collection {
public:
    using iterator = std::vector<entity_ptr>::const_iterator;

    collection() = default;
    explicit collection(std::string entity_name) : entity_name_(std::move(entity_name)) {}
    collection(std::string entity_name, std::vector<entity_ptr> items)
        : entity_name_(std::move(entity_name)), items_(std::move(items)) {}

    static collection_ptr make(std::string entity_name, std::vector<entity_ptr> items = {}) {
        return std::make_shared<collection>(std::move(entity_name), std::move(items));
    }

    const std::string& entity_name() const { return entity_name_; }

    const std::vector<entity_ptr>& data() const { return items_; }

    /// Replace the contents in place.
    void set_data(std::vector<entity_ptr> items) { items_ = std::move(items); }

    void add(entity_ptr e) { items_.push_back(std::move(e)); }
    void clear() { items_.clear(); }

    bool contains(const entity& e) const;

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const entity_ptr& at(size_t index) const;

    iterator begin() const { return items_.begin(); }
    iterator end() const { return items_.end(); }

    /// Free every contained entity and empty the collection.
    void free(bool deep = false);

private:
    std::string entity_name_;
    std::vector<entity_ptr> items_;
};

} // namespace tether

#endif // __cplusplus
