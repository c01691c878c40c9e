#pragma once

#include <string_view>

#include "fluxwire/core/error.hpp"

namespace fluxwire::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Asio / Boost.Beast system errors).

It is intentionally:
- small
- stable
- policy-free

Higher layers (the subscription session, the HTTP APIs) map it onto the
client-level fluxwire::core::Error with to_client_error().
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Bounded wait elapsed (connect deadline, request deadline, idle receive)
    ConnectionFailed, // Connection attempt failed (DNS, refused, unreachable network)
    HandshakeFailed,  // TCP connectivity exists, but the WebSocket upgrade was rejected

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame, malformed HTTP response, protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified or unrecoverable transport failure
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Map a failure observed while ESTABLISHING a connection / request.
// A failed handshake still means the service could not be reached as a
// subscription endpoint, so it is reported as Unreachable.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr core::Error to_client_error(Error err) noexcept {
    switch (err) {
    case Error::None:              return core::Error::None;
    case Error::InvalidUrl:        return core::Error::InvalidUrl;
    case Error::InvalidState:      return core::Error::InvalidState;
    case Error::Timeout:           return core::Error::Timeout;
    case Error::ConnectionFailed:  return core::Error::Unreachable;
    case Error::HandshakeFailed:   return core::Error::Unreachable;
    case Error::ProtocolError:     return core::Error::ProtocolError;
    case Error::LocalShutdown:
    case Error::RemoteClosed:
    case Error::TransportFailure:
    default:                       return core::Error::Disconnected;
    }
}

} // namespace transport
} // namespace fluxwire::core
