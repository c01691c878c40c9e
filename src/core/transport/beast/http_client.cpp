#include "fluxwire/core/transport/beast/http_client.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>

#include "fluxwire/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core {
namespace transport {
namespace beast {

namespace net = boost::asio;
namespace bst = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

[[nodiscard]]
inline bhttp::verb to_verb(http::Method m) noexcept {
    switch (m) {
        case http::Method::Post: return bhttp::verb::post;
        case http::Method::Get:
        default:                 return bhttp::verb::get;
    }
}

[[nodiscard]]
inline bool is_http_parse_error(const bst::error_code& ec) noexcept {
    return ec.category() == bhttp::make_error_code(bhttp::error::bad_version).category()
        && ec != bhttp::error::end_of_stream
        && ec != bhttp::error::partial_message;
}

} // namespace


Error HttpClient::request(const http::Request& req, http::Response& out) const noexcept {
    out = http::Response{};
    const auto deadline = std::chrono::steady_clock::now() + req.timeout;
    const std::string authority = transport::host_header(req.host, req.port);

    // Declared first: handlers capture the locals below by reference and must
    // be destroyed (never invoked) after them if the exchange is abandoned.
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    bst::tcp_stream stream(ioc);
    bst::error_code ec;

    FW_DEBUG("[HTTP] " << http::to_string(req.method) << " http://" << authority << req.target);

    // 1) Resolve
    tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(req.host, req.port,
        [&](const bst::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            resolved = true;
        });
    ioc.run_until(deadline);
    if (!resolved) {
        resolver.cancel();
        FW_ERROR("[HTTP] Resolving " << req.host << " timed out");
        return Error::Timeout;
    }
    if (ec) {
        FW_ERROR("[HTTP] Failed to resolve " << req.host << " (" << ec.message() << ")");
        return Error::ConnectionFailed;
    }

    // 2) Connect; the stream deadline now covers the rest of the exchange
    stream.expires_at(deadline);
    ioc.restart();
    stream.async_connect(endpoints,
        [&](const bst::error_code& e, const tcp::endpoint&) {
            ec = e;
        });
    ioc.run();
    if (ec == bst::error::timeout) {
        FW_ERROR("[HTTP] Connect to " << authority << " timed out");
        return Error::Timeout;
    }
    if (ec) {
        FW_ERROR("[HTTP] Connect to " << authority << " failed (" << ec.message() << ")");
        return Error::ConnectionFailed;
    }

    // 3) Write request
    bhttp::request<bhttp::string_body> message{to_verb(req.method), req.target, 11};
    message.set(bhttp::field::host, authority);
    message.set(bhttp::field::user_agent, "fluxwire/1.0");
    message.set(bhttp::field::accept, "application/json");
    if (req.method == http::Method::Post || !req.body.empty()) {
        message.set(bhttp::field::content_type, req.content_type.empty() ? "application/json" : req.content_type);
        message.body() = req.body;
    }
    message.prepare_payload();

    ioc.restart();
    bhttp::async_write(stream, message,
        [&](const bst::error_code& e, std::size_t) {
            ec = e;
        });
    ioc.run();
    if (ec == bst::error::timeout) {
        FW_ERROR("[HTTP] Sending request to " << authority << " timed out");
        return Error::Timeout;
    }
    if (ec) {
        FW_ERROR("[HTTP] Sending request to " << authority << " failed (" << ec.message() << ")");
        return Error::TransportFailure;
    }

    // 4) Read response
    bst::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);

    ioc.restart();
    bhttp::async_read(stream, buffer, parser,
        [&](const bst::error_code& e, std::size_t) {
            ec = e;
        });
    ioc.run();
    if (ec == bst::error::timeout) {
        FW_ERROR("[HTTP] Waiting for response from " << authority << " timed out");
        return Error::Timeout;
    }
    if (ec) {
        FW_ERROR("[HTTP] Reading response from " << authority << " failed (" << ec.message() << ")");
        return is_http_parse_error(ec) ? Error::ProtocolError : Error::TransportFailure;
    }

    auto response = parser.release();
    out.status       = response.result_int();
    out.content_type = std::string(response[bhttp::field::content_type]);
    out.body         = std::move(response.body());

    // 5) Graceful shutdown; a peer that already hung up is fine
    bst::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    FW_DEBUG("[HTTP] " << authority << " answered " << out.status << " (" << out.body.size() << " bytes)");
    return Error::None;
}

} // namespace beast
} // namespace transport
} // namespace fluxwire::core
