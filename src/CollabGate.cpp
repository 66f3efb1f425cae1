#include "networking/WebSocketServer.h"
#include "gateway/Gateway.h"
#include "common/Config.h"
#include "common/EventLogger.h"
#include "common/IDGenerator.hpp"
#include "common/SessionIssuer.h"
#include "storage/FileContentsManager.h"
#include "storage/FileIdManager.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    using namespace collabgate;

    common::ServerConfig cfg;
    try {
        cfg = common::ServerConfig::from_args(argc, argv);
    } catch (const common::ConfigError& e) {
        std::cerr << "collabgate: " << e.what() << "\n";
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    boost::asio::io_context ioc;

    common::IDGenerator idgen;
    common::SessionIssuer sessions(idgen);
    common::EventLogger events;

    storage::FileContentsManager contents(cfg.root_dir);
    storage::LocalFileIdManager file_ids(contents, idgen, cfg.resolved_index_path());

    gateway::Gateway gateway(ioc, contents, file_ids, sessions, events, idgen,
                             gateway::GatewayOptions::from_config(cfg));

    std::unique_ptr<networking::WebSocketServer> server;
    try {
        server = std::make_unique<networking::WebSocketServer>(ioc, cfg, gateway);
    } catch (const boost::system::system_error& e) {
        spdlog::critical("Cannot listen on {}:{}: {}", cfg.bind_address, cfg.port, e.what());
        return 1;
    }
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        spdlog::info("Shutting down...");
        server->stop();
        gateway.shutdown();
        ioc.stop();
    });

    spdlog::info("Serving {} on {}:{}", contents.root().string(), cfg.bind_address, server->port());
    spdlog::info("Session id: {}", sessions.token());
    spdlog::info("Cleanup delay {}, save delay {}, poll interval {}",
                 common::format_delay(cfg.document_cleanup_delay),
                 common::format_delay(cfg.document_save_delay),
                 common::format_delay(cfg.file_poll_interval));

    ioc.run();
    spdlog::info("Exit.");
    return 0;
}
