#pragma once

#include "fluxwire/core/api/publisher.hpp"
#include "fluxwire/core/api/query_client.hpp"

#include "fluxwire/core/preset/transport/http_default.hpp"


namespace fluxwire::core::preset::api {

    using DefaultQueryClient = fluxwire::core::api::QueryClient<transport::DefaultHttp>;
    using DefaultPublisher   = fluxwire::core::api::Publisher<transport::DefaultHttp>;

} // namespace fluxwire::core::preset::api
