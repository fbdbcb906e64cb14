#include "tether/log.hpp"
#include "tether/entity_manager.hpp"
#include "tether/errors.hpp"

namespace tether {

std::atomic<log_level> g_log_level{log_level::off};

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off:   return "off";
        case log_level::error: return "error";
        case log_level::warn:  return "warn";
        case log_level::info:  return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

std::optional<log_level> parse_log_level(const std::string& name) {
    for (auto level : {log_level::off, log_level::error, log_level::warn,
                       log_level::info, log_level::debug}) {
        if (name == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

namespace {
std::atomic<oid_t> g_next_oid{1};
}

oid_t allocate_oid() {
    return g_next_oid.fetch_add(1, std::memory_order_relaxed);
}

// ============================================================================
// entity_manager_factory
// ============================================================================

entity_manager_factory& entity_manager_factory::instance() {
    static entity_manager_factory factory;
    return factory;
}

void entity_manager_factory::bind(const std::string& entity_name, entity_manager* em) {
    std::lock_guard<std::mutex> lock(mutex_);
    managers_[entity_name] = em;
}

void entity_manager_factory::set_default(entity_manager* em) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_ = em;
}

void entity_manager_factory::unbind(entity_manager* em) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = managers_.begin(); it != managers_.end();) {
        if (it->second == em) {
            it = managers_.erase(it);
        } else {
            ++it;
        }
    }
    if (default_ == em) {
        default_ = nullptr;
    }
}

entity_manager& entity_manager_factory::get_manager(const std::string& entity_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = managers_.find(entity_name);
    if (it != managers_.end()) {
        return *it->second;
    }
    if (default_) {
        return *default_;
    }
    LOG_ERROR(log_tag::registry, "No entity manager bound for %s", entity_name.c_str());
    throw entity_error("No entity manager bound for " + entity_name);
}

} // namespace tether
