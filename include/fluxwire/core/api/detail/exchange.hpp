#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "fluxwire/core/api/config.hpp"
#include "fluxwire/core/error.hpp"
#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/error.hpp"
#include "fluxwire/core/transport/http/message.hpp"
#include "fluxwire/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace fluxwire::core::api::detail {

// -----------------------------------------------------------------------------
// Resolve the configured base address into a request skeleton.
// Only plain http:// is served by the bundled transport.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Failure make_request(const Config& cfg, transport::http::Method method, std::string_view api_path,
                            transport::http::Request& out) {
    transport::ParsedUrl base;
    if (transport::parse_url(cfg.base_url, base) != transport::Error::None ||
        (base.scheme != "http" && base.scheme != "https")) {
        return Failure::make(Error::InvalidUrl, "invalid service URL '" + cfg.base_url + "'");
    }
    if (base.secure) {
        return Failure::make(Error::InvalidUrl, "secure endpoint '" + cfg.base_url + "' is not supported");
    }
    out = transport::http::Request{};
    out.method  = method;
    out.host    = base.host;
    out.port    = base.port;
    out.target  = transport::join_path(base.path, api_path);
    out.timeout = cfg.timeout;
    return Failure::none();
}

// -----------------------------------------------------------------------------
// Perform one exchange and classify the outcome.
//
//   transport Timeout        → Timeout
//   transport ProtocolError  → ProtocolError
//   other transport failure  → Unreachable
//   non-2xx status           → ServerError{status, body verbatim}
//
// Single-entity lookups turn a 404 ServerError into NotFound themselves.
// -----------------------------------------------------------------------------
template<transport::HttpConcept Http>
[[nodiscard]]
inline Failure exchange(const Http& http, const transport::http::Request& req, transport::http::Response& res,
                        std::string_view tag) {
    const transport::Error err = http.request(req, res);
    const std::string where = std::string(transport::http::to_string(req.method)) + " " + req.target;
    switch (err) {
        case transport::Error::None:
            break;
        case transport::Error::Timeout:
            FW_ERROR(tag << " " << where << " timed out after " << req.timeout.count() << " ms");
            return Failure::make(Error::Timeout,
                                 "no response from " + req.host + ":" + req.port + " within "
                                 + std::to_string(req.timeout.count()) + " ms");
        case transport::Error::ProtocolError:
            FW_ERROR(tag << " " << where << " returned a malformed HTTP response");
            return Failure::make(Error::ProtocolError,
                                 "malformed HTTP response from " + req.host + ":" + req.port);
        default:
            FW_ERROR(tag << " " << where << " failed (" << transport::to_string(err) << ")");
            return Failure::make(Error::Unreachable,
                                 "cannot reach " + req.host + ":" + req.port + " ("
                                 + std::string(transport::to_string(err)) + "); is the service running?");
    }
    FW_DEBUG(tag << " " << where << " -> " << res.status);
    if (res.is_success()) {
        return Failure::none();
    }
    FW_WARN(tag << " " << where << " -> HTTP " << res.status << ": " << res.body);
    return Failure::make(Error::ServerError, res.body, res.status);
}

} // namespace fluxwire::core::api::detail
