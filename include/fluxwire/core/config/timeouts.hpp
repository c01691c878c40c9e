#pragma once

#include <chrono>


namespace fluxwire::core::config {

/*
===============================================================================
Timeouts
===============================================================================

Default bounds for every blocking wait in the client.

Design principles:
  - Every wait is bounded; nothing blocks on the network indefinitely
  - All defaults are compile-time constants, overridable per instance
    through session::Config / api::Config
  - No magic numbers scattered across the codebase
===============================================================================
*/

// -----------------------------------------------------------------------------
// Subscription session
// -----------------------------------------------------------------------------

// Opening sequence: resolve + TCP connect + WebSocket upgrade
inline constexpr static std::chrono::milliseconds CONNECT_TIMEOUT = std::chrono::seconds(10);

// Idle receive tick; the cancellation check point while streaming
inline constexpr static std::chrono::milliseconds RECEIVE_TIMEOUT = std::chrono::seconds(1);

// Subscribe frame transmission
inline constexpr static std::chrono::milliseconds SEND_TIMEOUT    = std::chrono::seconds(5);

// Close handshake; the connection is dropped hard once it elapses
inline constexpr static std::chrono::milliseconds CLOSE_TIMEOUT   = std::chrono::seconds(2);


// -----------------------------------------------------------------------------
// Query / publish APIs (whole request/response exchange)
// -----------------------------------------------------------------------------
inline constexpr static std::chrono::milliseconds REQUEST_TIMEOUT = std::chrono::seconds(10);


// -----------------------------------------------------------------------------
// Service defaults
// -----------------------------------------------------------------------------
inline constexpr static const char* DEFAULT_BASE_URL = "http://localhost:3000";
inline constexpr static const char* SUBSCRIPTION_PATH = "/api/ws";

} // namespace fluxwire::core::config
