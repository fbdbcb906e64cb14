#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tether {

class entity;
class collection;

using json = nlohmann::json;

// Process-unique object identifier (debugging/identity only, never persisted)
using oid_t = uint64_t;

using entity_ptr = std::shared_ptr<entity>;
using collection_ptr = std::shared_ptr<collection>;
using blob_t = std::vector<uint8_t>;

// What a relational column holds
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    blob_t
>;

// In-memory value of a field or an association slot.
//
// A map key that is absent means "not loaded". A key that is present and holds
// nullptr means "loaded, and null".
using value_t = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    blob_t,
    json,            // structured value (array / object)
    entity_ptr,      // single related entity
    collection_ptr   // to-many association
>;

// Field name -> value. Used for entity data, identifiers, staged hydration
// rows and write payloads.
using data_t = std::map<std::string, value_t>;

// ============================================================================
// Value helpers
// ============================================================================

/// True for the null alternative and for null entity/collection pointers.
bool is_null(const value_t& v);

/// Truthiness of a value (empty strings, "0", 0, empty arrays are false).
bool is_truthy(const value_t& v);

/// Type-coercing comparison used for dirty tracking.
///
/// null == 0 == "" == false == [] ; 5 == "5" == 5.0 ; numeric strings compare
/// numerically; entities and collections compare by identity.
bool loosely_equal(const value_t& a, const value_t& b);

/// Short name of the active alternative ("null", "int", "entity", ...).
const char* value_kind_name(const value_t& v);

/// Human readable rendering (used for logs, debug output and discriminators).
std::string to_display_string(const value_t& v);

/// Widen a storage value into a field value.
value_t to_value(const column_value_t& v);

} // namespace tether

#endif // __cplusplus
