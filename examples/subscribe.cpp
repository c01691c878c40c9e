// ============================================================================
// Subscribe to live entity changes
//
//   subscribe                  all entities
//   subscribe -e sensor-1      one entity
//
// Ctrl+C cancels the session; it closes within one receive interval.
// ============================================================================

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include "fluxwire.hpp"

#include "common/cli/service.hpp"
#include "common/logger.hpp"


namespace {

std::atomic<fluxwire::core::protocol::flux::SessionT*> g_session{nullptr};

void on_signal(int) {
    if (auto* session = g_session.load()) {
        session->cancel();   // atomic store only
    }
}

} // namespace


int main(int argc, char** argv) {
    using namespace fluxwire::core;
    using namespace fluxwire::core::protocol::flux;

    CLI::App app{"Subscribe to live entity updates from a Flux service"};
    fluxwire::examples::cli::ServiceParams service;
    std::string entity;
    bool verbose = false;

    fluxwire::examples::cli::add_service_options(app, service);
    app.add_option("-e,--entity", entity, "Entity id (all entities when omitted)");
    app.add_flag("-v,--verbose", verbose, "Multi-line entity blocks");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }
    fluxwire::examples::set_log_level(service.log_level);

    session::Config cfg;
    cfg.url = service.url;
    if (!entity.empty()) {
        cfg.entity_id = entity;
    }

    SessionT session{cfg};
    g_session.store(&session);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "Connecting to Flux: " << service.url << "\n";
    if (!entity.empty()) {
        std::cout << "Subscribing to entity: " << entity << "\n";
    } else {
        std::cout << "Subscribing to all entities\n";
    }
    std::cout << "Press Ctrl+C to stop\n" << std::endl;

    const format::Style style = verbose ? format::Style::Multiline : format::Style::Compact;
    const Failure f = session.run([style](const schema::Message& msg) {
        std::cout << format::format(msg, style) << std::endl;
    });

    g_session.store(nullptr);
    if (!f.ok()) {
        std::cerr << "Error: " << f << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "\nDisconnected (" << session.rx_frames() << " messages, "
              << session.unrecognized_frames() << " unrecognized)\n";
    return EXIT_SUCCESS;
}
