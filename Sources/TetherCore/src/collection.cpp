#include "tether/collection.hpp"
#include "tether/entity.hpp"
#include <stdexcept>

namespace tether {

bool collection::contains(const entity& e) const {
    for (const auto& item : items_) {
        if (item.get() == &e) {
            return true;
        }
    }
    return false;
}

const entity_ptr& collection::at(size_t index) const {
    if (index >= items_.size()) {
        throw std::out_of_range("Index out of range");
    }
    return items_[index];
}

void collection::free(bool deep) {
    // Moved out first: freeing an item may reach back into this collection
    auto items = std::move(items_);
    items_.clear();
    for (const auto& item : items) {
        if (item) {
            item->free(deep);
        }
    }
}

} // namespace tether
