#pragma once

#include <string>
#include <string_view>


namespace fluxwire::core::api::detail {

// RFC 3986 percent-encoding: everything outside the unreserved set
// (ALPHA / DIGIT / '-' / '.' / '_' / '~') is escaped, '/' included, so an
// entity id such as "home/sensor 1" stays a single path segment.
[[nodiscard]]
inline std::string percent_encode(std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (char ch : in) {
        const unsigned char c = static_cast<unsigned char>(ch);
        const bool unreserved =
            (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace fluxwire::core::api::detail
