#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "fluxwire/core/config/timeouts.hpp"
#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/error.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast implementation)
================================================================================

Implements the fluxwire WebSocket transport on top of Boost.Beast, keeping a
strict separation between *transport mechanics* and *session policy*.

Design highlights:
  • Single-connection transport primitive: no retries, no reconnection logic
  • Poll-driven: the transport owns one io_context and runs it only inside
    connect() / send() / receive() / close(), on the caller's thread
  • Bounded waits: every call takes a deadline; no call blocks indefinitely
  • Resumable reads: a receive() that times out leaves its read pending, and
    the next receive() continues it, so an idle tick never loses or splits a
    frame and never needs to cancel a WebSocket read
  • Deterministic lifecycle: idempotent close() with bounded close handshake,
    after which every outstanding operation has completed

Plain ws:// only; TLS setup is out of this transport's scope.
================================================================================
*/

namespace fluxwire::core {
namespace transport {
namespace beast {

class WebSocket {
    using tcp_stream_t = boost::beast::tcp_stream;
    using ws_stream_t  = boost::beast::websocket::stream<tcp_stream_t>;

    struct ReadState;

public:
    // Upper bound for the close handshake
    static constexpr std::chrono::milliseconds CLOSE_TIMEOUT = config::CLOSE_TIMEOUT;

public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Resolve, connect and perform the WebSocket upgrade within `timeout`.
    //   ConnectionFailed → nothing listening / DNS failure / network unreachable
    //   Timeout          → deadline elapsed (e.g. peer accepts but never answers)
    //   HandshakeFailed  → peer answered but refused the upgrade
    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path,
                  std::chrono::milliseconds timeout) noexcept;

    // Send one text message. A Timeout leaves the connection unusable.
    [[nodiscard]]
    Error send(std::string_view msg, std::chrono::milliseconds timeout) noexcept;

    // Wait up to `timeout` for one complete message (see WebSocketConcept).
    [[nodiscard]]
    Error receive(std::string& out, std::chrono::milliseconds timeout) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool is_open() const noexcept;

private:
    template<class State>
    Error drive_(const std::shared_ptr<State>& state, std::chrono::steady_clock::time_point deadline) noexcept;

    void teardown_() noexcept;
    void drain_() noexcept;

    static Error classify_read_error_(const boost::beast::error_code& ec) noexcept;

private:
    boost::asio::io_context ioc_;
    std::unique_ptr<ws_stream_t> ws_;
    std::shared_ptr<ReadState> read_;   // pending read, survives idle timeouts
    bool open_{false};
};
// Defensive check that WebSocket conforms to the WebSocketConcept concept
static_assert(WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace transport
} // namespace fluxwire::core
