#pragma once

#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/beast/websocket.hpp"


namespace fluxwire::core::preset::transport {

    using DefaultWebSocket = fluxwire::core::transport::beast::WebSocket;

    // Assert that DefaultWebSocket conforms to transport::WebSocketConcept concept
    static_assert(fluxwire::core::transport::WebSocketConcept<DefaultWebSocket>);

} // namespace fluxwire::core::preset::transport
