#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>
#include <utility>

#include "fluxwire/core/transport/error.hpp"


namespace fluxwire::core::transport {

    // host[:port] as sent in the Host header (default ports omitted)
    [[nodiscard]]
    inline std::string host_header(std::string_view host, std::string_view port, bool secure = false) {
        const bool default_port = (secure && port == "443") || (!secure && port == "80");
        std::string out(host);
        if (!default_port) {
            out += ':';
            out += port;
        }
        return out;
    }

    // Contains parsed URL components
    struct ParsedUrl {
        std::string scheme;   // http | https | ws | wss
        bool secure{false};   // true = https / wss
        std::string host;
        std::string port;
        std::string path;     // never empty, starts with '/'

        [[nodiscard]]
        inline std::string host_header() const {
            return transport::host_header(host, port, secure);
        }
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser supporting http://, https://, ws:// and wss://
    // This is a minimal, invariant-validated URL parser for service BASE
    // addresses: API paths and query strings are appended by the library,
    // so a query or fragment in the input is rejected. It does not attempt
    // full RFC compliance (no userinfo, no IPv6 literals).
    //
    // Example inputs:
    //   http://localhost:3000
    //   https://flux.example.com/base
    //   ws://127.0.0.1:3000
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        struct SchemeInfo { std::string_view prefix; std::string_view name; bool secure; const char* port; };
        constexpr SchemeInfo schemes[] = {
            {"http://",  "http",  false, "80"},
            {"https://", "https", true,  "443"},
            {"ws://",    "ws",    false, "80"},
            {"wss://",   "wss",   true,  "443"},
        };
        std::size_t pos = 0;
        const char* default_port = nullptr;
        for (const auto& s : schemes) {
            if (url.substr(0, s.prefix.size()) == s.prefix) {
                out.scheme = std::string(s.name);
                out.secure = s.secure;
                default_port = s.port;
                pos = s.prefix.size();
                break;
            }
        }
        if (!default_port) {
            return Error::InvalidUrl;
        }
        // 2) Base addresses carry no query or fragment
        if (url.find_first_of("?#", pos) != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 3) Extract host[:port]
        std::size_t slash = url.find('/', pos);
        std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 4) Split host and port
        std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = default_port;
        }
        // 5) Path (default "/" if missing)
        if (slash == std::string_view::npos) {
            out.path = "/";
        } else {
            out.path = std::string(url.substr(slash));
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Validate port - must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }


    // ---------------------------------------------------------------------
    // Join a base path and an API path without doubling slashes.
    //   ("/", "/api/ws")      -> "/api/ws"
    //   ("/base/", "/api/ws") -> "/base/api/ws"
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline std::string join_path(std::string_view base, std::string_view suffix) {
        std::string out(base);
        while (!out.empty() && out.back() == '/') {
            out.pop_back();
        }
        if (suffix.empty() || suffix.front() != '/') {
            out += '/';
        }
        out += suffix;
        return out;
    }


    // ---------------------------------------------------------------------
    // Derive the subscription endpoint from the service base address:
    //   scheme http → ws, https → wss (ws / wss kept as-is)
    //   `suffix` appended to the base path
    //
    //   http://localhost:3000   →  ws://localhost:3000/api/ws
    //   https://flux.io         →  wss://flux.io:443/api/ws  (port made explicit)
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error to_websocket_url(std::string_view base_url, std::string_view suffix, ParsedUrl& out) noexcept {
        ParsedUrl parsed;
        Error err = parse_url(base_url, parsed);
        if (err != Error::None) {
            return err;
        }
        parsed.scheme = parsed.secure ? "wss" : "ws";
        parsed.path   = join_path(parsed.path, suffix);
        out = std::move(parsed);
        return Error::None;
    }

    [[nodiscard]]
    inline std::string to_string(const ParsedUrl& url) {
        return url.scheme + "://" + url.host + ":" + url.port + url.path;
    }

} // namespace fluxwire::core::transport
