#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cmath>
#include <charconv>
#include <limits>


namespace lcr {
namespace json {

// Appends `s` escaped for use inside a JSON string literal (quotes not included).
// Control characters are written as \uXXXX; UTF-8 sequences pass through.
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    escape(out, s);
    return out;
}

// Appends `"s"` (quoted, escaped)
inline void append_string(std::string& out, std::string_view s) {
    out += '"';
    escape(out, s);
    out += '"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        // two's complement safe negation
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// Double formatter.
// - Integral values within the exactly representable range are written without fraction ("42")
// - Everything else uses the shortest round-trip representation
// - NaN / Inf have no JSON representation and are written as null
inline void append(std::string& out, double value)
{
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    constexpr double max_exact = 9007199254740992.0; // 2^53
    if (value == std::trunc(value) && std::fabs(value) <= max_exact) {
        append(out, static_cast<std::int64_t>(value));
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf, ptr);
}

} // namespace json
} // namespace lcr
