// diagnostics.hpp
// String helpers shared by the containers' validate_invariants / tree_dump output.

#ifndef DEEPDROP_DIAGNOSTICS_HPP
#define DEEPDROP_DIAGNOSTICS_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace deepdrop {
namespace detail {

// utility: convert pointer to hex string
inline std::string pointer_to_hex(const void* p) {
    std::ostringstream oss;
    oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(p) << std::dec;
    return oss.str();
}

// utility: escape string for JSON and wrap in quotes
inline std::string json_escape_and_quote(const std::string& s) {
    std::ostringstream o;
    o << "\"";
    for (char c : s) {
        switch (c) {
            case '\"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u00" << std::hex << (static_cast<int>(c) >> 4) << (static_cast<int>(c) & 0xf) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    o << "\"";
    return o.str();
}

inline std::string json_array(const std::vector<std::string>& items) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        out << json_escape_and_quote(items[i]);
        if (i + 1 < items.size()) out << ",";
    }
    out << "]";
    return out.str();
}

// helper: stream a value into a string (requires operator<<)
template <typename V>
std::string value_to_string(const V& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

// Human-readable wrapper around a JSON diagnostics object, plus an optional dump.
inline std::string readable_report(bool ok, const std::string& json, const std::string& dump) {
    std::ostringstream oss;
    oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
    oss << "JSON diagnostics:\n" << json << "\n";
    if (!dump.empty()) oss << "Tree dump:\n" << dump << "\n";
    return oss.str();
}

} // namespace detail
} // namespace deepdrop

#endif // DEEPDROP_DIAGNOSTICS_HPP
