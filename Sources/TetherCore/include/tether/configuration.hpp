#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <optional>
#include <string>

namespace tether {

struct configuration {
    /// Database file path for the default SQLite connection. Use ":memory:"
    /// for an in-memory database.
    std::string path = ":memory:";

    /// When false (default), a set that is loosely equal to the current value
    /// ("5" over 5, null over 0) is not recorded as a change. When true, any
    /// value that differs in type or content is recorded.
    bool strict_change_tracking = false;

    /// zlib level used for compressed-text fields in write payloads.
    int payload_compression_level = 5;

    /// zlib level used for compressed-text fields in serialized snapshots.
    /// -1 selects zlib's default.
    int snapshot_compression_level = -1;

    /// Process-wide log level applied when a manager is built with this
    /// configuration. Unset leaves the current level alone.
    std::optional<log_level> logging;

    // Default constructor - in-memory, loose change tracking
    configuration() = default;

    // Path only
    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, bool strict)
        : path(p), strict_change_tracking(strict) {}
};

} // namespace tether

#endif // __cplusplus
