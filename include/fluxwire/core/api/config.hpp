#pragma once

#include <chrono>
#include <string>

#include "fluxwire/core/config/timeouts.hpp"


namespace fluxwire::core::api {

// HTTP API configuration (query and publish), passed by value at construction.
//
//   base_url  service base address, e.g. http://localhost:3000
//   timeout   deadline for one whole request/response exchange
struct Config {
    std::string base_url{config::DEFAULT_BASE_URL};
    std::chrono::milliseconds timeout{config::REQUEST_TIMEOUT};
};

} // namespace fluxwire::core::api
