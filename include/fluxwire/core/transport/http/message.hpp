#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace fluxwire::core::transport::http {

enum class Method : std::uint8_t {
    Get,
    Post
};

[[nodiscard]]
inline constexpr std::string_view to_string(Method m) noexcept {
    switch (m) {
        case Method::Get:  return "GET";
        case Method::Post: return "POST";
        default:           return "UNKNOWN";
    }
}

// One-shot HTTP/1.1 request against host:port.
// `target` is the origin-form request target (path + optional query).
struct Request {
    Method      method{Method::Get};
    std::string host;
    std::string port;
    std::string target{"/"};
    std::string body{};
    std::string content_type{};
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
};

struct Response {
    unsigned    status{0};
    std::string body{};
    std::string content_type{};

    [[nodiscard]]
    inline bool is_success() const noexcept {
        return status >= 200 && status < 300;
    }
};

} // namespace fluxwire::core::transport::http
