#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <concepts>

#include "fluxwire/core/transport/error.hpp"
#include "fluxwire/core/transport/http/message.hpp"

namespace fluxwire::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Defines the minimal contract required by the subscription session.
//
// The WebSocket implementation:
//
//   • Owns exactly one connection at a time (no retries, no reconnection)
//   • Performs all I/O on the calling thread (no background threads)
//   • Bounds every blocking call by an explicit timeout
//   • Delivers complete text messages, in arrival order
//
// receive() contract:
//
//   Error::None          → `out` holds one complete message
//   Error::Timeout       → nothing arrived within `timeout`; the connection is
//                          still usable and a partially received message is
//                          resumed by the next call
//   Error::RemoteClosed  → the peer closed the connection
//   anything else        → the connection is unusable
//
// close() is idempotent and bounded.
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view msg,
        std::string& out,
        std::chrono::milliseconds timeout
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, path, timeout) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;
    { ws.is_open() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Data plane
    // ---------------------------------------------------------------------

    { ws.send(msg, timeout) } noexcept -> std::same_as<Error>;
    { ws.receive(out, timeout) } noexcept -> std::same_as<Error>;
};


// -----------------------------------------------------------------------------
// HttpConcept
// -----------------------------------------------------------------------------
//
// One-shot request/response transport used by the query and publish APIs.
//
//   Error::None              → `out` holds the response (ANY status code)
//   Error::ConnectionFailed  → no connection could be established
//   Error::Timeout           → `req.timeout` elapsed before a full response
//   Error::ProtocolError     → the peer answered with something that is not HTTP
//
// Implementations hold no per-request state and are safe to call from
// several threads at once.
//
// -----------------------------------------------------------------------------

template<class H>
concept HttpConcept =
    requires(
        const H h,
        const http::Request& req,
        http::Response& out
    )
{
    { h.request(req, out) } noexcept -> std::same_as<Error>;
};

} // namespace fluxwire::core::transport
