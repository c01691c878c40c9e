#pragma once

#include <chrono>
#include <string>

#include "fluxwire/core/config/timeouts.hpp"
#include "lcr/optional.hpp"


namespace fluxwire::core::protocol::flux::session {

// Subscription session configuration (passed by value at construction).
//
//   url        service base address (http/https/ws/wss); the subscription
//              endpoint is derived from it (/api/ws appended)
//   entity_id  subscribe to a single entity; all entities when absent
struct Config {
    std::string url{config::DEFAULT_BASE_URL};
    lcr::optional<std::string> entity_id{};

    std::chrono::milliseconds connect_timeout{config::CONNECT_TIMEOUT};
    std::chrono::milliseconds receive_timeout{config::RECEIVE_TIMEOUT};
    std::chrono::milliseconds send_timeout{config::SEND_TIMEOUT};
};

} // namespace fluxwire::core::protocol::flux::session
