#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <cstdlib>
#include <cstdio>
#include <cctype>

namespace fluxwire::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;


// ============================================================================
// Epoch milliseconds (wire timestamp of published events)
// ============================================================================
[[nodiscard]]
inline std::int64_t now_epoch_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

[[nodiscard]]
inline std::int64_t to_epoch_ms(Timestamp ts) noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(ts.time_since_epoch()).count();
}


// ============================================================================
// Helper: convert substring → integer safely
// ============================================================================
inline bool parse_int(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    out = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

inline bool parse_ll(std::string_view sv, long long& out) noexcept {
    if (sv.empty()) return false;
    out = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        out = out * 10 + (c - '0');
    }
    return true;
}


// ============================================================================
// RFC3339 parser
//
// Supports:
//   YYYY-MM-DDTHH:MM:SSZ
//   YYYY-MM-DDTHH:MM:SS.sssssssssZ
//   YYYY-MM-DDTHH:MM:SS[.fraction]+HH:MM   (numeric offset, also '-')
//
// Always returns Timestamp in UTC (sys_time).
// ============================================================================
[[nodiscard]] inline bool parse_rfc3339(std::string_view sv, Timestamp& out) noexcept {
    using namespace std::chrono;

    // Minimum length: "YYYY-MM-DDTHH:MM:SSZ" (20 chars)
    if (sv.size() < 20) return false;

    // ---- Parse date ----
    int year = 0, mon = 0, day = 0;

    if (!parse_int(sv.substr(0, 4), year)) return false;
    if (sv[4] != '-') return false;
    if (!parse_int(sv.substr(5, 2), mon)) return false;
    if (sv[7] != '-') return false;
    if (!parse_int(sv.substr(8, 2), day)) return false;

    // ---- Parse time ----
    if (sv[10] != 'T' && sv[10] != 't' && sv[10] != ' ') return false;

    int hour = 0, minute = 0, sec = 0;

    if (!parse_int(sv.substr(11, 2), hour)) return false;
    if (sv[13] != ':') return false;
    if (!parse_int(sv.substr(14, 2), minute)) return false;
    if (sv[16] != ':') return false;
    if (!parse_int(sv.substr(17, 2), sec)) return false;

    if (hour > 23 || minute > 59 || sec > 60) return false;

    // ---- Fractional seconds (optional) ----
    nanoseconds extra_ns{0};

    size_t pos = 19;
    if (pos < sv.size() && sv[pos] == '.') {
        size_t start = ++pos;
        while (pos < sv.size() && std::isdigit(static_cast<unsigned char>(sv[pos])))
            pos++;

        size_t digits = pos - start;
        if (digits == 0) return false;

        // Only the first 9 digits carry nanosecond precision
        long long frac = 0;
        if (!parse_ll(sv.substr(start, digits < 9 ? digits : 9), frac)) return false;
        for (size_t i = digits; i < 9; i++)
            frac *= 10;
        extra_ns = nanoseconds(frac);
    }

    // ---- Time-zone: Z or ±HH:MM ----
    if (pos >= sv.size()) return false;

    minutes offset{0};
    if (sv[pos] == 'Z' || sv[pos] == 'z') {
        ++pos;
    }
    else if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv.size() < pos + 6 || sv[pos + 3] != ':') return false;
        int off_h = 0, off_m = 0;
        if (!parse_int(sv.substr(pos + 1, 2), off_h)) return false;
        if (!parse_int(sv.substr(pos + 4, 2), off_m)) return false;
        if (off_h > 23 || off_m > 59) return false;
        offset = hours(off_h) + minutes(off_m);
        if (sv[pos] == '-') offset = -offset;
        pos += 6;
    }
    else {
        return false;
    }

    if (pos != sv.size()) return false;

    // =====================================================================
    // Build chrono date/time: **warning-free / narrowing-safe**
    // =====================================================================
    year_month_day ymd =
        std::chrono::year{year} /
        std::chrono::month{static_cast<unsigned>(mon)} /
        std::chrono::day{static_cast<unsigned>(day)};

    if (!ymd.ok()) return false;

    sys_days d{ymd};

    // Local time minus its offset gives UTC
    out = d +
          hours(hour) +
          minutes(minute) +
          seconds(sec) +
          extra_ns -
          offset;

    return true;
}

} // namespace fluxwire::core
