#pragma once

#include <cstdint>
#include <string_view>


namespace fluxwire::core::protocol::flux::session {

// ===============================================================
// SUBSCRIPTION SESSION STATE ENUM
// ===============================================================
//
//   Disconnected ──open()──> Connecting ──connected──> Subscribing
//                                 │                         │ first frame
//                                 │                         v
//                                 │                     Streaming
//                                 │                         │ cancel() / close()
//                                 v                         v
//                              Failed <──transport error── Closing ──> Closed
//
// Failed is reachable from Connecting, Subscribing and Streaming.
// open() is accepted again from Closed and Failed.
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Subscribing,
    Streaming,
    Closing,
    Closed,
    Failed
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Subscribing:  return "Subscribing";
        case State::Streaming:    return "Streaming";
        case State::Closing:      return "Closing";
        case State::Closed:       return "Closed";
        case State::Failed:       return "Failed";
        default:                  return "Unknown";
    }
}

// Connected states: a transport is open and frames may arrive
[[nodiscard]]
inline constexpr bool is_active(State s) noexcept {
    return s == State::Subscribing || s == State::Streaming;
}

// States from which open() may start a new connection
[[nodiscard]]
inline constexpr bool can_open(State s) noexcept {
    return s == State::Disconnected || s == State::Closed || s == State::Failed;
}

} // namespace fluxwire::core::protocol::flux::session
