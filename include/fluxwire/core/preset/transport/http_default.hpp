#pragma once

#include "fluxwire/core/transport/concepts.hpp"
#include "fluxwire/core/transport/beast/http_client.hpp"


namespace fluxwire::core::preset::transport {

    using DefaultHttp = fluxwire::core::transport::beast::HttpClient;

    // Assert that DefaultHttp conforms to transport::HttpConcept concept
    static_assert(fluxwire::core::transport::HttpConcept<DefaultHttp>);

} // namespace fluxwire::core::preset::transport
