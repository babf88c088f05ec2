#include "client/client_runtime.hpp"
#include "config.hpp"
#include "log.hpp"
#include "mods/chat_mod.hpp"
#include "network_client.hpp"
#include "packet_inbox.hpp"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void on_signal(int) { g_running = false; }

// Lines typed by the user, filled by a blocking reader thread
PacketInbox<std::string> g_input;
std::atomic<bool> g_input_closed{false};

void read_input() {
    std::string line;
    while (std::getline(std::cin, line)) {
        g_input.push(line);
    }
    g_input_closed = true;
}
} // namespace

int main(int argc, char **argv) {
    ClientConfig config;
    std::string error;
    switch (parse_client_args(argc, argv, config, error)) {
    case ArgsResult::Help:
        std::cout << client_usage(argv[0]);
        return 0;
    case ArgsResult::Invalid:
        std::cerr << error << "\n" << client_usage(argv[0]);
        return 1;
    case ArgsResult::Ok:
        break;
    }

    auto logger = make_logger("client", config.log_level);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    NetworkClient network(logger);
    if (!network.connect(config)) {
        shutdown_logging();
        return 1;
    }

    client_runtime runtime(network, logger);
    register_chat_handle(runtime, [](const std::string &line) { std::cout << line << std::endl; });
    runtime.send_register(config.client_version);
    runtime.login();

    // getline cannot be interrupted, so the reader is never joined
    std::thread(read_input).detach();

    const sf::Time frame = sf::seconds(1.0f / static_cast<float>(config.tick_rate));
    sf::Clock clock;
    while (g_running && runtime.state() != ConnectionState::Disconnected) {
        float dt = std::min(clock.restart().asSeconds(), 0.1f);
        runtime.tick(dt);

        for (auto &line : g_input.drain()) {
            auto *history = runtime.store().get<chat_log>();
            auto *chat = history ? runtime.messenger_for(history->entity) : nullptr;
            if (!chat) {
                logger->warn("Not in a chat yet, dropping: {}", line);
                continue;
            }
            chat->call_server_fn(CHAT_SAY, line);
        }
        if (g_input_closed && g_input.size() == 0)
            g_running = false;

        sf::Time spent = clock.getElapsedTime();
        if (spent < frame)
            sf::sleep(frame - spent);
    }

    if (runtime.state() == ConnectionState::Disconnected)
        logger->warn("Disconnected: {}", runtime.disconnect_reason());
    else
        runtime.logout();

    network.stop();
    shutdown_logging();
    return 0;
}
