#include "config.hpp"
#include "log.hpp"
#include "mods/chat_mod.hpp"
#include "network_server.hpp"
#include "server_runtime.hpp"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace {
std::atomic<bool> g_running{true};

void on_signal(int) { g_running = false; }
} // namespace

int main(int argc, char **argv) {
    ServerConfig config;
    std::string error;
    switch (parse_server_args(argc, argv, config, error)) {
    case ArgsResult::Help:
        std::cout << server_usage(argv[0]);
        return 0;
    case ArgsResult::Invalid:
        std::cerr << error << "\n" << server_usage(argv[0]);
        return 1;
    case ArgsResult::Ok:
        break;
    }

    auto logger = make_logger("server", config.log_level);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    NetworkServer network(logger);
    if (!network.start(config)) {
        shutdown_logging();
        return 1;
    }

    server_runtime runtime(config, network, logger);
    install_chat(runtime.game_world());

    const sf::Time frame = sf::seconds(1.0f / static_cast<float>(config.tick_rate));
    sf::Clock clock;
    while (g_running) {
        clock.restart();
        runtime.tick();

        sf::Time spent = clock.getElapsedTime();
        if (spent < frame)
            sf::sleep(frame - spent);
        else
            logger->debug("Tick {} took {} ms", runtime.game_world().tick_count(),
                          spent.asMilliseconds());
    }

    logger->info("Shutting down");
    runtime.shutdown("server shutting down");
    // Let the reliable channel carry the goodbyes before closing
    sf::sleep(sf::milliseconds(100));
    network.stop();
    shutdown_logging();
    return 0;
}
