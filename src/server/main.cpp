/*
 * ChatRelay server entry point
 */

#include "config.hpp"
#include "server.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace chatrelay;

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}
} // namespace

int main(int argc, char** argv) {
    ServerConfig config;
    std::string error;
    if (!load_server_config(argc, argv, config, error)) {
        std::cerr << error << "\n" << server_usage(argv[0]) << std::endl;
        return 2;
    }

    set_log_level(config.log_level);

    try {
        RelayServer server(config);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        server.start();
        std::cout << "ChatRelay server running on "
                  << (config.bind_address.empty() ? "0.0.0.0" : config.bind_address) << ":" << config.port
                  << std::endl;

        // Block until termination signal.
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        server.stop();
    } catch (const std::exception& ex) {
        log_error(std::string("Server error: ") + ex.what());
        return 1;
    }

    return 0;
}
