/*
================================================================================
HTTP Transport Tests (Boost.Beast, loopback)
================================================================================

These tests exercise the real Beast HTTP client against a blocking peer on
127.0.0.1, then the query and publish APIs on top of it.

Key properties validated here:
  • Request line and headers are what the service expects
  • Any status code is returned as a response; interpretation is left to the
    API layer
  • Refused → ConnectionFailed, silent peer → Timeout, non-HTTP answer →
    ProtocolError
  • QueryClient / Publisher map those onto the client error taxonomy
================================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include "fluxwire/core/preset/api/http_default.hpp"
#include "fluxwire/core/transport/beast/http_client.hpp"
#include "common/loopback_server.hpp"
#include "common/test_check.hpp"

using namespace fluxwire::core;
using namespace std::chrono_literals;

using transport::test::LoopbackServer;
using tcp = boost::asio::ip::tcp;
namespace bhttp = boost::beast::http;


// What the peer saw
struct Captured {
    std::string method;
    std::string target;
    std::string host;
    std::string user_agent;
    std::string accept;
    std::string content_type;
    std::string body;
};

// Serve exactly one request with the given status and body
static void serve_one(LoopbackServer& server, Captured& seen, unsigned status, std::string body) {
    server.serve([&seen, status, body = std::move(body)](tcp::socket& socket) {
        boost::beast::flat_buffer buffer;
        bhttp::request<bhttp::string_body> req;
        bhttp::read(socket, buffer, req);

        seen.method       = std::string(req.method_string());
        seen.target       = std::string(req.target());
        seen.host         = std::string(req[bhttp::field::host]);
        seen.user_agent   = std::string(req[bhttp::field::user_agent]);
        seen.accept       = std::string(req[bhttp::field::accept]);
        seen.content_type = std::string(req[bhttp::field::content_type]);
        seen.body         = req.body();

        bhttp::response<bhttp::string_body> res{static_cast<bhttp::status>(status), 11};
        res.set(bhttp::field::content_type, "application/json");
        res.body() = body;
        res.prepare_payload();
        bhttp::write(socket, res);

        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_send, ignored);
    });
}

static transport::http::Request make_request(const LoopbackServer& server, std::string target) {
    transport::http::Request req;
    req.host    = "127.0.0.1";
    req.port    = server.port();
    req.target  = std::move(target);
    req.timeout = 2000ms;
    return req;
}


// -----------------------------------------------------------------------------
// Transport
// -----------------------------------------------------------------------------

void test_get() {
    std::cout << "[TEST] GET returns status and body\n";

    Captured seen;
    LoopbackServer server;
    serve_one(server, seen, 200, R"({"id":"sensor-1"})");

    transport::beast::HttpClient http;
    transport::http::Response res;
    const auto err = http.request(make_request(server, "/api/state/entities/sensor-1"), res);
    server.join();

    TEST_CHECK(err == transport::Error::None);
    TEST_CHECK(res.status == 200);
    TEST_CHECK(res.is_success());
    TEST_CHECK(res.body == R"({"id":"sensor-1"})");
    TEST_CHECK(res.content_type == "application/json");

    TEST_CHECK(seen.method == "GET");
    TEST_CHECK(seen.target == "/api/state/entities/sensor-1");
    TEST_CHECK(seen.host == "127.0.0.1:" + server.port());
    TEST_CHECK(seen.user_agent == "fluxwire/1.0");
    TEST_CHECK(seen.accept == "application/json");
    TEST_CHECK(seen.body.empty());

    std::cout << "[TEST] OK\n";
}

void test_post() {
    std::cout << "[TEST] POST sends the body\n";

    Captured seen;
    LoopbackServer server;
    serve_one(server, seen, 201, R"({"eventId":"e1","stream":"s"})");

    transport::http::Request req = make_request(server, "/api/events");
    req.method = transport::http::Method::Post;
    req.content_type = "application/json";
    req.body = R"({"stream":"s"})";

    transport::beast::HttpClient http;
    transport::http::Response res;
    TEST_CHECK(http.request(req, res) == transport::Error::None);
    server.join();

    TEST_CHECK(res.status == 201);
    TEST_CHECK(seen.method == "POST");
    TEST_CHECK(seen.content_type == "application/json");
    TEST_CHECK(seen.body == R"({"stream":"s"})");

    std::cout << "[TEST] OK\n";
}

void test_error_status_is_a_response() {
    std::cout << "[TEST] error statuses are returned, not interpreted\n";

    Captured seen;
    LoopbackServer server;
    serve_one(server, seen, 404, R"({"error":"Entity not found"})");

    transport::beast::HttpClient http;
    transport::http::Response res;
    TEST_CHECK(http.request(make_request(server, "/api/state/entities/ghost"), res) == transport::Error::None);
    server.join();

    TEST_CHECK(res.status == 404);
    TEST_CHECK(!res.is_success());
    TEST_CHECK(res.body == R"({"error":"Entity not found"})");

    std::cout << "[TEST] OK\n";
}

void test_transport_failures() {
    std::cout << "[TEST] refused, silent and non-HTTP peers\n";

    transport::beast::HttpClient http;
    transport::http::Response res;

    {
        transport::http::Request req;
        req.host = "127.0.0.1";
        req.port = LoopbackServer::closed_port();
        req.timeout = 2000ms;
        TEST_CHECK(http.request(req, res) == transport::Error::ConnectionFailed);
    }
    {
        LoopbackServer server; // listening, never accepting
        transport::http::Request req = make_request(server, "/");
        req.timeout = 200ms;
        const auto started = std::chrono::steady_clock::now();
        TEST_CHECK(http.request(req, res) == transport::Error::Timeout);
        TEST_CHECK(std::chrono::steady_clock::now() - started < 5s);
    }
    {
        LoopbackServer server;
        server.serve([](tcp::socket& socket) {
            boost::beast::flat_buffer buffer;
            bhttp::request<bhttp::string_body> req;
            bhttp::read(socket, buffer, req);
            const std::string reply = "THIS IS NOT HTTP\r\n\r\n";
            boost::asio::write(socket, boost::asio::buffer(reply));
            boost::system::error_code ignored;
            socket.shutdown(tcp::socket::shutdown_send, ignored);
        });
        TEST_CHECK(http.request(make_request(server, "/"), res) == transport::Error::ProtocolError);
        server.join();
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// APIs over the real transport
// -----------------------------------------------------------------------------

void test_query_client_over_loopback() {
    std::cout << "[TEST] QueryClient over loopback\n";

    {
        Captured seen;
        LoopbackServer server;
        serve_one(server, seen, 200,
                  R"({"id":"sensor-1","properties":{"t":22.5},"lastUpdated":"2024-01-01T00:00:00Z"})");

        preset::api::DefaultQueryClient client{api::Config{"http://127.0.0.1:" + server.port(), 2000ms}};
        Entity e;
        TEST_CHECK(client.query_one("sensor-1", e).ok());
        server.join();
        TEST_CHECK(e.properties.find("t")->as_number() == 22.5);
    }
    {
        Captured seen;
        LoopbackServer server;
        serve_one(server, seen, 404, R"({"error":"Entity not found"})");

        preset::api::DefaultQueryClient client{api::Config{"http://127.0.0.1:" + server.port(), 2000ms}};
        Entity e;
        const Failure f = client.query_one("ghost", e);
        server.join();
        TEST_CHECK(f.code == Error::NotFound);
    }
    {
        preset::api::DefaultQueryClient client{
            api::Config{"http://127.0.0.1:" + LoopbackServer::closed_port(), 2000ms}};
        std::vector<Entity> all;
        const Failure f = client.query_all(all);
        TEST_CHECK(f.code == Error::Unreachable);
        TEST_CHECK(f.detail.find("is the service running") != std::string::npos);
    }

    std::cout << "[TEST] OK\n";
}

void test_publisher_over_loopback() {
    std::cout << "[TEST] Publisher over loopback\n";

    Captured seen;
    LoopbackServer server;
    serve_one(server, seen, 201, R"({"eventId":"evt-42","stream":"sensors.temp"})");

    property::Map props;
    props.set("temperature", property::Value::number(22.5));
    event::Event ev;
    TEST_CHECK(event::build("sensors.temp", "tests", "sensor-1", props, ev) == Error::None);

    preset::api::DefaultPublisher publisher{api::Config{"http://127.0.0.1:" + server.port(), 2000ms}};
    api::PublishReceipt receipt;
    TEST_CHECK(publisher.publish(ev, receipt).ok());
    server.join();

    TEST_CHECK(receipt.event_id == "evt-42");
    TEST_CHECK(seen.target == "/api/events");
    TEST_CHECK(seen.body == ev.to_json());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_get();
    test_post();
    test_error_status_is_a_response();
    test_transport_failures();
    test_query_client_over_loopback();
    test_publisher_over_loopback();

    std::cout << "\n[BEAST HTTP CLIENT TESTS PASSED]\n";
    return 0;
}
