// ============================================================================
// Publish one event
//
//   publish -s sensors -e sensor-1 temperature=22.5 active=true status=online
//
// Each key=value token is decoded with the property rule: valid JSON keeps
// its type (22.5 → number, true → boolean), anything else is a string.
// ============================================================================

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "fluxwire.hpp"

#include "common/cli/service.hpp"
#include "common/logger.hpp"


int main(int argc, char** argv) {
    using namespace fluxwire::core;

    CLI::App app{"Publish an event to a Flux service"};
    fluxwire::examples::cli::ServiceParams service;
    std::string stream;
    std::string source = "fluxwire-cli";
    std::string entity;
    std::string key;
    std::string schema;
    std::vector<std::string> tokens;
    unsigned timeout_s = 10;

    fluxwire::examples::cli::add_service_options(app, service);
    app.add_option("-s,--stream", stream, "Target stream (e.g. sensors)")->required();
    app.add_option("--source", source, "Producer identity")->default_val(source);
    app.add_option("-e,--entity", entity, "Entity id")->required();
    app.add_option("-k,--key", key, "Optional ordering / grouping key");
    app.add_option("--schema", schema, "Optional schema tag");
    app.add_option("--timeout", timeout_s, "Request timeout in seconds")->default_val(timeout_s);
    app.add_option("properties", tokens, "Properties as key=value")->check(fluxwire::examples::cli::property_validator);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }
    fluxwire::examples::set_log_level(service.log_level);

    // Properties
    property::Map properties;
    std::string bad_token;
    if (property::parse_tokens(tokens, properties, &bad_token) != Error::None) {
        std::cerr << "Error: Invalid property format '" << bad_token << "'. Use key=value\n";
        return 2;
    }

    // Envelope
    event::Event ev;
    lcr::optional<std::string> opt_key;
    lcr::optional<std::string> opt_schema;
    if (!key.empty()) {
        opt_key = key;
    }
    if (!schema.empty()) {
        opt_schema = schema;
    }
    if (event::build(stream, source, entity, properties, ev, opt_key, opt_schema) != Error::None) {
        std::cerr << "Error: stream, source and entity must not be empty\n";
        return 2;
    }

    // Publish
    PublisherT publisher{api::Config{service.url, std::chrono::seconds(timeout_s)}};
    api::PublishReceipt receipt;
    const Failure f = publisher.publish(ev, receipt);
    if (!f.ok()) {
        std::cerr << "Error: " << f << "\n";
        if (f.code == Error::Unreachable) {
            std::cerr << "Is Flux running at " << service.url << "?\n";
        }
        return EXIT_FAILURE;
    }

    std::cout << "Published to " << receipt.stream << "\n"
              << "  Entity: " << ev.entity_id << "\n"
              << "  Event ID: " << receipt.event_id << "\n"
              << "  Properties: " << format::properties_json(ev.properties) << "\n";
    return EXIT_SUCCESS;
}
