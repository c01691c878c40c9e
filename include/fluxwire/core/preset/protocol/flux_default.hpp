#pragma once

#include "fluxwire/core/protocol/flux/session.hpp"

#include "fluxwire/core/preset/transport/websocket_default.hpp"


namespace fluxwire::core::preset::protocol::flux {

    using DefaultSession =
        fluxwire::core::protocol::flux::Session<
            transport::DefaultWebSocket
        >;

} // namespace fluxwire::core::preset::protocol::flux
