#include "tether/types.hpp"
#include "tether/entity.hpp"
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace tether {

namespace {

// Parses the whole string as a number (leading/trailing whitespace allowed).
bool parse_numeric(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r') ++end;
    return *end == '\0' && std::isfinite(out);
}

bool as_number(const value_t& v, double& out) {
    if (auto* i = std::get_if<int64_t>(&v)) { out = static_cast<double>(*i); return true; }
    if (auto* d = std::get_if<double>(&v)) { out = *d; return true; }
    return false;
}

// json primitives behave like the matching scalar
value_t unwrap_primitive(const json& j) {
    if (j.is_null()) return nullptr;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_unsigned()) return static_cast<int64_t>(j.get<uint64_t>());
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    return j;
}

bool is_primitive_json(const value_t& v) {
    auto* j = std::get_if<json>(&v);
    return j && !j->is_structured() && !j->is_binary();
}

} // namespace

bool is_null(const value_t& v) {
    if (std::holds_alternative<std::nullptr_t>(v)) return true;
    if (auto* e = std::get_if<entity_ptr>(&v)) return *e == nullptr;
    if (auto* c = std::get_if<collection_ptr>(&v)) return *c == nullptr;
    if (auto* j = std::get_if<json>(&v)) return j->is_null();
    return false;
}

bool is_truthy(const value_t& v) {
    return std::visit([](const auto& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return false;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return arg != 0;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return !arg.empty() && arg != "0";
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return !arg.empty();
        } else if constexpr (std::is_same_v<T, json>) {
            if (arg.is_structured() || arg.is_binary()) return !arg.empty();
            return is_truthy(unwrap_primitive(arg));
        } else {
            return arg != nullptr;
        }
    }, v);
}

bool loosely_equal(const value_t& a, const value_t& b) {
    if (is_primitive_json(a)) return loosely_equal(unwrap_primitive(std::get<json>(a)), b);
    if (is_primitive_json(b)) return loosely_equal(a, unwrap_primitive(std::get<json>(b)));

    // null and bool compare by truthiness against anything
    if (std::holds_alternative<std::nullptr_t>(a) || std::holds_alternative<std::nullptr_t>(b)) {
        return !is_truthy(a) && !is_truthy(b) &&
               !(std::holds_alternative<std::string>(a) && std::get<std::string>(a) == "0") &&
               !(std::holds_alternative<std::string>(b) && std::get<std::string>(b) == "0");
    }
    if (std::holds_alternative<bool>(a) || std::holds_alternative<bool>(b)) {
        return is_truthy(a) == is_truthy(b);
    }

    double na = 0, nb = 0;
    bool a_num = as_number(a, na);
    bool b_num = as_number(b, nb);
    if (a_num && b_num) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return std::get<int64_t>(a) == std::get<int64_t>(b);
        }
        return na == nb;
    }

    auto* sa = std::get_if<std::string>(&a);
    auto* sb = std::get_if<std::string>(&b);
    if (a_num && sb) {
        double parsed = 0;
        return parse_numeric(*sb, parsed) ? parsed == na : to_display_string(a) == *sb;
    }
    if (b_num && sa) {
        double parsed = 0;
        return parse_numeric(*sa, parsed) ? parsed == nb : to_display_string(b) == *sa;
    }
    if (sa && sb) {
        double pa = 0, pb = 0;
        if (parse_numeric(*sa, pa) && parse_numeric(*sb, pb)) return pa == pb;
        return *sa == *sb;
    }

    auto* ba = std::get_if<blob_t>(&a);
    auto* bb = std::get_if<blob_t>(&b);
    if (ba && bb) return *ba == *bb;
    if (ba && sb) return std::string(ba->begin(), ba->end()) == *sb;
    if (bb && sa) return std::string(bb->begin(), bb->end()) == *sa;

    auto* ja = std::get_if<json>(&a);
    auto* jb = std::get_if<json>(&b);
    if (ja && jb) return *ja == *jb;

    auto* ea = std::get_if<entity_ptr>(&a);
    auto* eb = std::get_if<entity_ptr>(&b);
    if (ea && eb) return *ea == *eb;

    auto* ca = std::get_if<collection_ptr>(&a);
    auto* cb = std::get_if<collection_ptr>(&b);
    if (ca && cb) return *ca == *cb;

    return false;
}

const char* value_kind_name(const value_t& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "blob";
        case 6: return "structured";
        case 7: return "entity";
        case 8: return "collection";
        default: return "unknown";
    }
}

std::string to_display_string(const value_t& v) {
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "1" : "";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << arg;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return "<blob " + std::to_string(arg.size()) + " bytes>";
        } else if constexpr (std::is_same_v<T, json>) {
            return arg.is_string() ? arg.template get<std::string>() : arg.dump();
        } else if constexpr (std::is_same_v<T, entity_ptr>) {
            return arg ? "<" + arg->entity_name() + " #" + arg->to_string() + ">" : "";
        } else {
            return arg ? "<collection of " + std::to_string(arg->size()) + ">" : "";
        }
    }, v);
}

value_t to_value(const column_value_t& v) {
    return std::visit([](const auto& arg) -> value_t { return arg; }, v);
}

} // namespace tether
