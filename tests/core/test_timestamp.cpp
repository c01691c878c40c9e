#include <chrono>
#include <iostream>

#include "fluxwire/core/timestamp.hpp"
#include "common/test_check.hpp"

using namespace fluxwire::core;

/*
================================================================================
RFC 3339 Timestamp Parser - Unit Tests
================================================================================

Entity timestamps arrive as RFC 3339 text ("lastUpdated") and are kept
verbatim; the parsed UTC value is an optional convenience. These tests pin
the accepted forms and the rejection of everything else.
================================================================================
*/

static std::int64_t ms(std::string_view text) {
    Timestamp ts;
    TEST_CHECK(parse_rfc3339(text, ts));
    return to_epoch_ms(ts);
}

void test_accepted_forms() {
    std::cout << "[TEST] RFC 3339 accepted forms\n";

    TEST_CHECK(ms("2024-01-01T00:00:00Z") == 1704067200000LL);
    TEST_CHECK(ms("2024-01-01T00:00:00.123Z") == 1704067200123LL);
    TEST_CHECK(ms("2024-01-01T00:00:00.123456789Z") == 1704067200123LL);
    TEST_CHECK(ms("2024-01-01t00:00:00z") == 1704067200000LL);
    TEST_CHECK(ms("2024-01-01 00:00:00Z") == 1704067200000LL);

    // Offsets are normalized to UTC
    TEST_CHECK(ms("2024-01-01T02:00:00+02:00") == 1704067200000LL);
    TEST_CHECK(ms("2023-12-31T19:00:00-05:00") == 1704067200000LL);

    // Sub-nanosecond digits are ignored
    Timestamp ts;
    TEST_CHECK(parse_rfc3339("2024-01-01T00:00:00.0000000019Z", ts));
    TEST_CHECK(ts.time_since_epoch().count() % 1000000000LL == 1);

    std::cout << "[TEST] OK\n";
}

void test_rejected_forms() {
    std::cout << "[TEST] RFC 3339 rejected forms\n";

    Timestamp ts;
    TEST_CHECK(!parse_rfc3339("", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01T00:00:00", ts));
    TEST_CHECK(!parse_rfc3339("2024-13-01T00:00:00Z", ts));
    TEST_CHECK(!parse_rfc3339("2024-02-30T00:00:00Z", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01T24:00:00Z", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01T00:00:00.Z", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01T00:00:00Zjunk", ts));
    TEST_CHECK(!parse_rfc3339("2024-01-01T00:00:00+0200", ts));
    TEST_CHECK(!parse_rfc3339("yesterday at noon, roughly", ts));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_accepted_forms();
    test_rejected_forms();

    std::cout << "\n[TIMESTAMP TESTS PASSED]\n";
    return 0;
}
