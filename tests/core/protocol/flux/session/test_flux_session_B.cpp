/*
===============================================================================
 protocol::flux::Session - Group B Unit Tests
===============================================================================

Scope:
------
Frame classification, ordered delivery and cache reconciliation.

This group ensures that:
- Every frame produces exactly one message, in arrival order
- Snapshot and Update fully replace the cached entity (last write wins)
- The cache already reflects a message when the consumer sees it
- Unrecognized frames are surfaced verbatim and never touch the cache

Covered Requirements:
---------------------
B1. [Snapshot(A), Update(A'), Snapshot(B)]
    - Three messages, in order
    - Cache = {A: A', B}

B2. Duplicate snapshot for the same entity
    - Second snapshot replaces the first entirely

B3. Update for an entity never seen in a snapshot
    - Inserted as-is

B4. Unrecognized frames
    - Not JSON, unknown type, missing or malformed entity
    - Raw text preserved, cache untouched, counted

B5. Cache consistency at delivery time (run() handler)

B6. Typed property values from inbound JSON

Non-Goals:
----------
- Transport failures and cancellation (Group C)
- Rendering of messages (formatter tests)

===============================================================================
*/

#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "common/harness/session.hpp"

using namespace fluxwire::core::protocol::flux::test;


// -----------------------------------------------------------------------------
// B1. Snapshot, Update, Snapshot
// -----------------------------------------------------------------------------
void test_snapshot_update_snapshot() {
    std::cout << "[TEST] Group B1: snapshot, update, snapshot reconcile in order\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());

    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));
    WebSocketUnderTest::push_message(harness::frame::update("A", R"({"v":2})"));
    WebSocketUnderTest::push_message(harness::frame::snapshot("B", R"({"v":10})"));

    const auto msgs = harness::take(session, 3);

    TEST_CHECK(schema::kind_of(msgs[0]) == schema::MessageKind::Snapshot);
    TEST_CHECK(schema::kind_of(msgs[1]) == schema::MessageKind::Update);
    TEST_CHECK(schema::kind_of(msgs[2]) == schema::MessageKind::Snapshot);
    TEST_CHECK(schema::entity_of(msgs[0])->id == "A");
    TEST_CHECK(schema::entity_of(msgs[1])->id == "A");
    TEST_CHECK(schema::entity_of(msgs[2])->id == "B");

    TEST_CHECK(session.cache().size() == 2);
    const Entity* a = session.find("A");
    const Entity* b = session.find("B");
    TEST_CHECK(a != nullptr && b != nullptr);
    TEST_CHECK(a->properties.find("v")->as_number() == 2.0);
    TEST_CHECK(a->last_updated == "2024-01-01T00:00:01Z");
    TEST_CHECK(*a == std::get<schema::Update>(msgs[1]).entity);
    TEST_CHECK(b->properties.find("v")->as_number() == 10.0);
    TEST_CHECK(session.find("C") == nullptr);

    TEST_CHECK(session.rx_frames() == 3);
    TEST_CHECK(session.unrecognized_frames() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2. Duplicate snapshot replaces the first entirely
// -----------------------------------------------------------------------------
void test_duplicate_snapshot() {
    std::cout << "[TEST] Group B2: duplicate snapshot replaces the cached entity\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());

    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"t":1,"h":50})"));
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"t":3})", "2024-01-02T00:00:00Z"));

    (void)harness::take(session, 2);

    TEST_CHECK(session.cache().size() == 1);
    const Entity* a = session.find("A");
    TEST_CHECK(a != nullptr);
    TEST_CHECK(a->properties.size() == 1);
    TEST_CHECK(a->properties.find("t")->as_number() == 3.0);
    TEST_CHECK(!a->properties.contains("h"));
    TEST_CHECK(a->last_updated == "2024-01-02T00:00:00Z");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3. Update for an unseen entity
// -----------------------------------------------------------------------------
void test_update_unseen_entity() {
    std::cout << "[TEST] Group B3: update for an unseen entity is inserted\n";
    WebSocketUnderTest::reset();

    auto cfg = harness::make_config();
    cfg.entity_id = std::string("sensor-9");
    SessionUnderTest session{cfg};
    TEST_CHECK(session.open().ok());

    WebSocketUnderTest::push_message(harness::frame::update("sensor-9", R"({"status":"online"})"));

    const auto msgs = harness::take(session, 1);
    TEST_CHECK(std::holds_alternative<schema::Update>(msgs[0]));

    const Entity* e = session.find("sensor-9");
    TEST_CHECK(e != nullptr);
    TEST_CHECK(e->properties.find("status")->as_string() == "online");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4. Unrecognized frames bypass the cache
// -----------------------------------------------------------------------------
void test_unrecognized_frames() {
    std::cout << "[TEST] Group B4: unrecognized frames are surfaced verbatim\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());

    const std::vector<std::string> frames = {
        "not json at all",
        R"({"type":"heartbeat","ts":1})",
        R"({"entity":{"id":"A"}})",
        R"({"type":"update"})",
        R"({"type":"snapshot","entity":{"properties":{"t":1}}})",
        R"({"type":"update","entity":{"id":"","properties":{}}})",
        R"({"type":"update","entity":{"id":"A","properties":[1,2]}})",
        R"([1,2,3])",
    };
    for (const auto& f : frames) {
        WebSocketUnderTest::push_message(f);
    }

    const auto msgs = harness::take(session, frames.size());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto* u = std::get_if<schema::Unrecognized>(&msgs[i]);
        TEST_CHECK(u != nullptr);
        TEST_CHECK(u->raw == frames[i]);
        TEST_CHECK(schema::entity_of(msgs[i]) == nullptr);
    }

    // Unrecognized frames still count as traffic
    TEST_CHECK(session.state() == session::State::Streaming);
    TEST_CHECK(session.cache().empty());
    TEST_CHECK(session.unrecognized_frames() == frames.size());
    TEST_CHECK(session.rx_frames() == frames.size());

    // A valid frame after garbage is still processed
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"t":1})"));
    const auto more = harness::take(session, 1);
    TEST_CHECK(std::holds_alternative<schema::Snapshot>(more[0]));
    TEST_CHECK(session.cache().size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5. Cache consistency at delivery time
// -----------------------------------------------------------------------------
void test_cache_updated_before_delivery() {
    std::cout << "[TEST] Group B5: cache reflects a message when it is delivered\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    WebSocketUnderTest::set_on_idle([&session]() { session.cancel(); });

    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));
    WebSocketUnderTest::push_message("garbage");
    WebSocketUnderTest::push_message(harness::frame::update("A", R"({"v":2})"));

    int delivered = 0;
    int consistent = 0;
    const Failure f = session.run([&](const schema::Message& msg) {
        ++delivered;
        if (const Entity* e = schema::entity_of(msg)) {
            const Entity* cached = session.find(e->id);
            if (cached && *cached == *e) {
                ++consistent;
            }
        } else {
            // Unrecognized leaves the previous state in place
            const Entity* cached = session.find("A");
            if (cached && cached->properties.find("v")->as_number() == 1.0) {
                ++consistent;
            }
        }
    });

    TEST_CHECK(f.ok());
    TEST_CHECK(delivered == 3);
    TEST_CHECK(consistent == 3);
    TEST_CHECK(session.state() == session::State::Closed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6. Typed property values from inbound JSON
// -----------------------------------------------------------------------------
void test_typed_properties() {
    std::cout << "[TEST] Group B6: inbound property values keep their JSON types\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());

    WebSocketUnderTest::push_message(harness::frame::snapshot(
        "sensor-1", R"({"temperature":22.5,"active":true,"status":"online","note":null,"loc":{"x":1}})",
        "2024-01-01T12:30:45.500Z"));

    const auto msgs = harness::take(session, 1);
    const Entity& e = std::get<schema::Snapshot>(msgs[0]).entity;

    TEST_CHECK(e.properties.size() == 5);
    TEST_CHECK(e.properties.find("temperature")->as_number() == 22.5);
    TEST_CHECK(e.properties.find("active")->as_boolean() == true);
    TEST_CHECK(e.properties.find("status")->as_string() == "online");
    TEST_CHECK(e.properties.find("note")->is_null());
    TEST_CHECK(e.properties.find("loc")->as_json() == R"({"x":1})");

    TEST_CHECK(e.last_updated == "2024-01-01T12:30:45.500Z");
    TEST_CHECK(e.updated_at.has());
    TEST_CHECK(to_epoch_ms(e.updated_at.value()) == 1704112245500LL);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_snapshot_update_snapshot();
    test_duplicate_snapshot();
    test_update_unseen_entity();
    test_unrecognized_frames();
    test_cache_updated_before_delivery();
    test_typed_properties();

    std::cout << "\n[GROUP B - RECONCILIATION TESTS PASSED]\n";
    return 0;
}
