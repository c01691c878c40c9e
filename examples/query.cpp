// ============================================================================
// Query entity state
//
//   query                      all entities
//   query -e sensor-1          one entity
//   query --namespace home     entities whose id is "home/..."
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

    CLI::App app{"Query entity state from a Flux service"};
    fluxwire::examples::cli::ServiceParams service;
    std::string entity;
    std::string ns;
    std::string prefix;
    bool compact = false;
    unsigned timeout_s = 10;

    fluxwire::examples::cli::add_service_options(app, service);
    app.add_option("-e,--entity", entity, "Entity id (all entities when omitted)");
    app.add_option("--namespace", ns, "Only entities in this namespace");
    app.add_option("--prefix", prefix, "Only entities whose id starts with this prefix");
    app.add_flag("-c,--compact", compact, "One line per entity");
    app.add_option("--timeout", timeout_s, "Request timeout in seconds")->default_val(timeout_s);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }
    fluxwire::examples::set_log_level(service.log_level);

    const format::Style style = compact ? format::Style::Compact : format::Style::Multiline;
    QueryClientT client{api::Config{service.url, std::chrono::seconds(timeout_s)}};

    if (!entity.empty()) {
        Entity result;
        const Failure f = client.query_one(entity, result);
        if (f.code == Error::NotFound) {
            std::cerr << "Error: Entity '" << entity << "' not found\n";
            return EXIT_FAILURE;
        }
        if (!f.ok()) {
            std::cerr << "Error: " << f << "\n";
            return EXIT_FAILURE;
        }
        std::cout << format::format(result, style) << "\n";
        return EXIT_SUCCESS;
    }

    api::EntityFilter filter;
    if (!ns.empty()) {
        filter.namespace_name = ns;
    }
    if (!prefix.empty()) {
        filter.prefix = prefix;
    }

    std::vector<Entity> results;
    const Failure f = client.query_all(filter, results);
    if (!f.ok()) {
        std::cerr << "Error: " << f << "\n";
        return EXIT_FAILURE;
    }
    if (results.empty()) {
        std::cout << "No entities found\n";
        return EXIT_SUCCESS;
    }
    std::cout << "Found " << results.size() << " entities:\n\n";
    for (const auto& e : results) {
        std::cout << format::format(e, style) << "\n";
        if (!compact) {
            std::cout << "\n";
        }
    }
    return EXIT_SUCCESS;
}
