#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <utility>

namespace fluxwire::core {

/*
===============================================================================
 fluxwire::core::Error
===============================================================================

Client-level error classification, shared by the property codec, the event
builder, the HTTP APIs and the subscription session.

Transport-specific failures (transport::Error) are mapped onto this set at
the API boundary, so callers only ever branch on these values.

Operational meaning:

  FormatError      Malformed caller input (e.g. property token without '=').
                   Local, immediate, never retried.
  InvalidArgument  A required field is empty or a value is out of range.
  InvalidUrl       The configured service address cannot be parsed.
  InvalidState     Operation not allowed in the current session state.
  Unreachable      No connection could be established (refused, DNS, ...).
  Timeout          A bounded wait was exceeded (connect or request deadline).
                   The idle receive tick of a streaming session is NOT this.
  NotFound         The requested entity does not exist. An expected outcome.
  ServerError      Non-success HTTP status; detail holds the response body.
  ProtocolError    The peer answered with something that cannot be read.
  Disconnected     The peer dropped an established stream.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    FormatError,
    InvalidArgument,
    InvalidUrl,
    InvalidState,
    Unreachable,
    Timeout,
    NotFound,
    ServerError,
    ProtocolError,
    Disconnected
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:            return "None";
    case Error::FormatError:     return "FormatError";
    case Error::InvalidArgument: return "InvalidArgument";
    case Error::InvalidUrl:      return "InvalidUrl";
    case Error::InvalidState:    return "InvalidState";
    case Error::Unreachable:     return "Unreachable";
    case Error::Timeout:         return "Timeout";
    case Error::NotFound:        return "NotFound";
    case Error::ServerError:     return "ServerError";
    case Error::ProtocolError:   return "ProtocolError";
    case Error::Disconnected:    return "Disconnected";
    default:                     return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Failure
// -----------------------------------------------------------------------------
// Result of an operation that talks to the service.
// `status` is the HTTP status when one was received (0 otherwise).
// `detail` is a human-readable explanation or, for ServerError, the response
// body exactly as the service sent it.
struct Failure {
    Error code{Error::None};
    unsigned status{0};
    std::string detail{};

    [[nodiscard]]
    inline bool ok() const noexcept {
        return code == Error::None;
    }

    [[nodiscard]]
    static inline Failure none() {
        return Failure{};
    }

    [[nodiscard]]
    static inline Failure make(Error code, std::string detail, unsigned status = 0) {
        return Failure{code, status, std::move(detail)};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Failure& f) {
    os << to_string(f.code);
    if (f.status != 0) {
        os << " (HTTP " << f.status << ")";
    }
    if (!f.detail.empty()) {
        os << ": " << f.detail;
    }
    return os;
}

} // namespace fluxwire::core
