#include "common/AsioTimerService.h"
#include "common/Config.h"
#include "networking/WebSocketServer.h"
#include "server/InMemoryDeviceStore.h"
#include "server/SignalingHub.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <optional>

int main(int argc, char* argv[]) {
    using namespace portal;

    std::optional<common::ServerConfig> config;
    try {
        config = common::load_server_config(argc, argv, [](const char* name) { return std::getenv(name); });
    } catch (const common::ConfigError& e) {
        spdlog::error("[Portal] configuration error: {}", e.what());
        return 1;
    }
    if (!config) return 0;

    spdlog::set_level(*common::parse_log_level(config->log_level));

    boost::asio::io_context ioc;
    common::AsioTimerService timers(ioc);
    server::InMemoryDeviceStore store;

    std::unique_ptr<networking::WebSocketServer> ws;
    try {
        ws = std::make_unique<networking::WebSocketServer>(ioc, config->bind_address, config->port);
    } catch (const boost::system::system_error& e) {
        spdlog::error("[Portal] cannot listen on {}:{}: {}", config->bind_address, config->port, e.what());
        return 1;
    }

    server::SignalingHub::Options options;
    options.presence_timeout = config->presence_timeout;
    options.announce_conferences = config->announce_conferences;

    server::SignalingHub hub(store, timers, options,
                             [&ws](networking::ConnectionId connection, const std::string& msg) {
                                 ws->send(connection, msg);
                             });

    ws->set_on_connect([&hub](networking::ConnectionId id) { hub.handle_connect(id); });
    ws->set_on_disconnect([&hub](networking::ConnectionId id) { hub.handle_disconnect(id); });
    ws->set_on_message([&hub](networking::ConnectionId id, const std::string& msg) {
        hub.handle_message(id, msg);
    });

    ws->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        spdlog::info("[Portal] shutting down...");
        hub.shutdown();
        ws->stop();
        ioc.stop();
    });

    spdlog::info("[Portal] signaling server running on {}:{} (presence timeout {} ms)",
                 config->bind_address, config->port, config->presence_timeout.count());
    ioc.run();
    spdlog::info("[Portal] exit.");
    return 0;
}
