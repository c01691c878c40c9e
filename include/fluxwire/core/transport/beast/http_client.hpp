#pragma once

#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/error.hpp"
#include "fluxwire/core/transport/http/message.hpp"

namespace fluxwire::core {
namespace transport {
namespace beast {

// -----------------------------------------------------------------------------
// One-shot HTTP/1.1 client (Boost.Beast)
//
// Every request opens its own connection with its own io_context, runs to
// completion on the calling thread and closes the connection again. The whole
// exchange (connect, write, read) shares the single deadline `req.timeout`.
//
// The client keeps no state, so one instance may be shared across threads.
// -----------------------------------------------------------------------------
class HttpClient {
public:
    // Upper bound for a response body (query_all may return the whole store)
    static constexpr unsigned long long MAX_BODY_BYTES = 64ull * 1024 * 1024;

    [[nodiscard]]
    Error request(const http::Request& req, http::Response& out) const noexcept;
};
static_assert(HttpConcept<HttpClient>);

} // namespace beast
} // namespace transport
} // namespace fluxwire::core
