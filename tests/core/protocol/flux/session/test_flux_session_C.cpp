/*
===============================================================================
 protocol::flux::Session - Group C Unit Tests
===============================================================================

Scope:
------
Termination paths of the subscription session: cancellation, connection
failures, dropped streams and reopening.

This group ensures that:
- cancel() ends the session cleanly (Closed, no failure reported)
- "service not running" (Unreachable) is distinguishable from
  "dropped after streaming" (Disconnected)
- Idle receive intervals are never surfaced as messages or errors
- Every open() starts from an empty cache with a fresh transport

Covered Requirements:
---------------------
C1. cancel() from inside the handler
    - run() returns no failure, state Closed, transport closed once

C2. cancel() from another thread
    - Observed at the next idle tick

C3. cancel() before any receive
    - next() returns false without touching the transport

C4. Connection failures while opening
    - Refused / handshake rejected → Unreachable
    - Deadline exceeded → Timeout
    - run() surfaces the open() failure

C5. Stream dropped by the peer
    - After N frames → Disconnected, frame count in the detail
    - Before any frame → Disconnected, distinct detail

C6. Idle intervals are silent

C7. Reopen after failure
    - Fresh transport, empty cache, subscribe sent again

Non-Goals:
----------
- Automatic reconnection (not provided)
- Real socket behavior (Beast transport tests)

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "common/harness/session.hpp"

using namespace fluxwire::core::protocol::flux::test;


// -----------------------------------------------------------------------------
// C1. cancel() from inside the handler
// -----------------------------------------------------------------------------
void test_cancel_from_handler() {
    std::cout << "[TEST] Group C1: cancel() from inside the handler\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};

    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));
    WebSocketUnderTest::push_message(harness::frame::update("A", R"({"v":2})"));
    WebSocketUnderTest::push_message(harness::frame::update("A", R"({"v":3})"));

    int delivered = 0;
    const Failure f = session.run([&](const schema::Message&) {
        ++delivered;
        if (delivered == 2) {
            session.cancel();
        }
    });

    TEST_CHECK(f.ok());
    TEST_CHECK(delivered == 2);
    TEST_CHECK(session.state() == session::State::Closed);
    TEST_CHECK(session.cache().empty());
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(WebSocketUnderTest::pending() == 1);

    // cancel() is idempotent and harmless once closed
    session.cancel();
    session.cancel();
    schema::Message msg;
    TEST_CHECK(session.next(msg) == false);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C2. cancel() from another thread
// -----------------------------------------------------------------------------
void test_cancel_from_other_thread() {
    std::cout << "[TEST] Group C2: cancel() from another thread\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));

    std::thread canceller([&session]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        session.cancel();
    });

    int delivered = 0;
    schema::Message msg;
    while (session.next(msg)) {
        ++delivered;
    }
    canceller.join();

    TEST_CHECK(delivered == 1);
    TEST_CHECK(session.state() == session::State::Closed);
    TEST_CHECK(session.last_failure().ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C3. cancel() before any receive
// -----------------------------------------------------------------------------
void test_cancel_before_receive() {
    std::cout << "[TEST] Group C3: cancel() before any receive\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));

    session.cancel();

    schema::Message msg;
    TEST_CHECK(session.next(msg) == false);
    TEST_CHECK(session.state() == session::State::Closed);
    TEST_CHECK(WebSocketUnderTest::receive_count() == 0);

    // A new open() clears a stale cancellation
    TEST_CHECK(session.open().ok());
    TEST_CHECK(session.next(msg));
    TEST_CHECK(std::holds_alternative<schema::Snapshot>(msg));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C4. Connection failures while opening
// -----------------------------------------------------------------------------
void test_open_failures() {
    std::cout << "[TEST] Group C4: connection failures while opening\n";
    WebSocketUnderTest::reset();

    {
        WebSocketUnderTest::set_connect_result(transport::Error::ConnectionFailed);
        SessionUnderTest session{harness::make_config("http://localhost:3999")};
        const Failure f = session.open();
        TEST_CHECK(f.code == Error::Unreachable);
        TEST_CHECK(f.detail.find("ws://localhost:3999/api/ws") != std::string::npos);
        TEST_CHECK(f.detail.find("is the service running") != std::string::npos);
        TEST_CHECK(session.state() == session::State::Failed);
        TEST_CHECK(session.last_failure().code == Error::Unreachable);
        TEST_CHECK(WebSocketUnderTest::sent().empty());

        schema::Message msg;
        TEST_CHECK(session.next(msg) == false);
    }
    {
        WebSocketUnderTest::set_connect_result(transport::Error::HandshakeFailed);
        SessionUnderTest session{harness::make_config()};
        TEST_CHECK(session.open().code == Error::Unreachable);
    }
    {
        WebSocketUnderTest::set_connect_result(transport::Error::Timeout);
        SessionUnderTest session{harness::make_config()};
        const Failure f = session.open();
        TEST_CHECK(f.code == Error::Timeout);
        TEST_CHECK(f.detail.find("no response from") != std::string::npos);
        TEST_CHECK(session.state() == session::State::Failed);
    }
    {
        WebSocketUnderTest::set_connect_result(transport::Error::ConnectionFailed);
        SessionUnderTest session{harness::make_config()};
        int delivered = 0;
        const Failure f = session.run([&](const schema::Message&) { ++delivered; });
        TEST_CHECK(f.code == Error::Unreachable);
        TEST_CHECK(delivered == 0);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C5. Stream dropped by the peer
// -----------------------------------------------------------------------------
void test_stream_dropped() {
    std::cout << "[TEST] Group C5: stream dropped by the peer\n";
    WebSocketUnderTest::reset();

    {
        SessionUnderTest session{harness::make_config()};
        WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));
        WebSocketUnderTest::push_message(harness::frame::update("A", R"({"v":2})"));
        WebSocketUnderTest::push_error(transport::Error::RemoteClosed);

        int delivered = 0;
        const Failure f = session.run([&](const schema::Message&) { ++delivered; });

        TEST_CHECK(delivered == 2);
        TEST_CHECK(f.code == Error::Disconnected);
        TEST_CHECK(f.detail.find("after 2 frame(s)") != std::string::npos);
        TEST_CHECK(session.state() == session::State::Failed);

        // The last known state stays readable until close() or open()
        TEST_CHECK(session.cache().size() == 1);
        TEST_CHECK(session.find("A")->properties.find("v")->as_number() == 2.0);
    }
    {
        WebSocketUnderTest::reset();
        SessionUnderTest session{harness::make_config()};
        TEST_CHECK(session.open().ok());
        WebSocketUnderTest::push_error(transport::Error::TransportFailure);

        schema::Message msg;
        TEST_CHECK(session.next(msg) == false);
        TEST_CHECK(session.last_failure().code == Error::Disconnected);
        TEST_CHECK(session.last_failure().detail.find("before sending any frame") != std::string::npos);
        TEST_CHECK(session.state() == session::State::Failed);

        session.close();
        TEST_CHECK(session.cache().empty());
        TEST_CHECK(session.state() == session::State::Failed);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C6. Idle intervals are silent
// -----------------------------------------------------------------------------
void test_idle_intervals_silent() {
    std::cout << "[TEST] Group C6: idle intervals are never surfaced\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());

    WebSocketUnderTest::push_idle();
    WebSocketUnderTest::push_idle();
    WebSocketUnderTest::push_idle();
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));

    schema::Message msg;
    TEST_CHECK(session.next(msg));
    TEST_CHECK(std::holds_alternative<schema::Snapshot>(msg));
    TEST_CHECK(WebSocketUnderTest::receive_count() == 4);
    TEST_CHECK(session.rx_frames() == 1);
    TEST_CHECK(session.state() == session::State::Streaming);
    TEST_CHECK(session.last_failure().ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C7. Reopen after failure
// -----------------------------------------------------------------------------
void test_reopen_after_failure() {
    std::cout << "[TEST] Group C7: reopen after failure starts clean\n";
    WebSocketUnderTest::reset();

    SessionUnderTest session{harness::make_config()};
    TEST_CHECK(session.open().ok());
    WebSocketUnderTest::push_message(harness::frame::snapshot("A", R"({"v":1})"));
    WebSocketUnderTest::push_message(harness::frame::snapshot("B", R"({"v":1})"));
    WebSocketUnderTest::push_error(transport::Error::RemoteClosed);

    const auto first = harness::drain(session);
    TEST_CHECK(first.size() == 2);
    TEST_CHECK(session.state() == session::State::Failed);
    TEST_CHECK(session.cache().size() == 2);

    TEST_CHECK(session.open().ok());
    TEST_CHECK(session.state() == session::State::Subscribing);
    TEST_CHECK(session.cache().empty());
    TEST_CHECK(session.rx_frames() == 0);
    TEST_CHECK(session.last_failure().ok());
    TEST_CHECK(WebSocketUnderTest::instances() == 2);
    TEST_CHECK(WebSocketUnderTest::sent().size() == 2);

    WebSocketUnderTest::push_message(harness::frame::snapshot("C", R"({"v":7})"));
    const auto second = harness::drain(session);
    TEST_CHECK(second.size() == 1);
    TEST_CHECK(session.state() == session::State::Closed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    // Idle ticks against the mock spin without waiting; keep trace output off
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_cancel_from_handler();
    test_cancel_from_other_thread();
    test_cancel_before_receive();
    test_open_failures();
    test_stream_dropped();
    test_idle_intervals_silent();
    test_reopen_after_failure();

    std::cout << "\n[GROUP C - TERMINATION TESTS PASSED]\n";
    return 0;
}
