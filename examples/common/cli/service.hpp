#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "fluxwire/core/config/timeouts.hpp"


namespace fluxwire::examples::cli {

// Options shared by every example
struct ServiceParams {
    std::string url       = fluxwire::core::config::DEFAULT_BASE_URL;
    std::string log_level = "warn";
};

inline void add_service_options(CLI::App& app, ServiceParams& params) {
    app.add_option("--url", params.url, "Flux service URL")->check(service_url_validator)->default_val(params.url);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);
}

} // namespace fluxwire::examples::cli
