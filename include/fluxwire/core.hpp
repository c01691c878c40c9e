#pragma once

/*
================================================================================
fluxwire Core: Flux Client Architecture
================================================================================

This file is the entry point for the three client roles of a Flux service:

    publish    api::Publisher<Http>            POST /api/events[/batch]
    query      api::QueryClient<Http>          GET  /api/state/entities[/<id>]
    subscribe  protocol::flux::Session<WS>     WebSocket /api/ws

Each role is a thin, explicit composition of protocol logic and a concrete
transport bound at compile time (Boost.Beast here, mocks in tests).

-------------------------------------------------------------------------------
Execution Model
-------------------------------------------------------------------------------

There are no background threads.

  - HTTP roles perform one bounded request/response exchange per call on the
    calling thread, with a fresh connection each time.
  - The subscription session makes progress only inside open(), next() and
    run(), on the thread that owns it. Each receive waits at most one receive
    interval, which is where cancel() (the only cross-thread call) is
    observed.

If progress occurs, it is because the owner called into the library.

-------------------------------------------------------------------------------
Errors
-------------------------------------------------------------------------------

No exceptions cross the API. Operations that talk to the service return a
Failure { code, status, detail }; local operations return an Error code.
The library never terminates the process; mapping failures to messages and
exit codes belongs to the caller.

================================================================================
*/

#include "fluxwire/core/error.hpp"
#include "fluxwire/core/entity.hpp"
#include "fluxwire/core/property/codec.hpp"
#include "fluxwire/core/event/envelope.hpp"
#include "fluxwire/core/api/query_client.hpp"
#include "fluxwire/core/api/publisher.hpp"
#include "fluxwire/core/protocol/flux/session.hpp"
#include "fluxwire/core/format/formatter.hpp"
#include "fluxwire/core/preset/api/http_default.hpp"
#include "fluxwire/core/preset/protocol/flux_default.hpp"


namespace fluxwire::core {

    using QueryClientT = preset::api::DefaultQueryClient;
    using PublisherT   = preset::api::DefaultPublisher;

namespace protocol::flux {

    using SessionT     = preset::protocol::flux::DefaultSession;

} // namespace protocol::flux

} // namespace fluxwire::core
