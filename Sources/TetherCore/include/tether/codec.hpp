#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>

namespace tether {
namespace codec {

// ============================================================================
// Structured values (array / object fields) - stored as JSON TEXT
// ============================================================================

/// Flatten a structured value to portable JSON text. Scalars are flattened as
/// their JSON literal. Entities and collections cannot be flattened.
std::string flatten(const value_t& v);

/// Parse JSON text produced by flatten().
json restore_structured(const std::string& text);

// ============================================================================
// Compressed text (zlib)
// ============================================================================

/// Compress a string or blob value. level is a zlib level (-1 = default).
blob_t compress(const value_t& v, int level);

/// Inflate bytes produced by compress().
std::string decompress(const blob_t& bytes);

// ============================================================================
// Type-preserving value <-> json mapping (snapshot documents)
// ============================================================================

/// Blob values are encoded as json binary with no subtype.
json to_json(const value_t& v);

/// Inverse of to_json for scalar, blob and structured values.
value_t from_json(const json& j);

} // namespace codec
} // namespace tether

#endif // __cplusplus
