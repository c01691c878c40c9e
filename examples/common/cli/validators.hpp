#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "fluxwire/core/transport/parse_url.hpp"


namespace fluxwire::examples::cli {

// -------------------------------------------------------------
// Service URL validator
// -------------------------------------------------------------
inline auto service_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        fluxwire::core::transport::ParsedUrl parsed;
        if (fluxwire::core::transport::parse_url(value, parsed) != fluxwire::core::transport::Error::None) {
            return "URL must look like http://host[:port]";
        }
        if (parsed.secure) {
            return "Secure endpoints (https://, wss://) are not supported";
        }
        return {};
    },
    "Service URL validator"
);


// -------------------------------------------------------------
// Property token validator (key=value)
// -------------------------------------------------------------
inline auto property_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto sep = value.find('=');
        if (sep == std::string::npos || sep == 0) {
            return "Property must be in format key=value (e.g. temperature=22.5)";
        }
        return {};
    },
    "Property token validator"
);

} // namespace fluxwire::examples::cli
