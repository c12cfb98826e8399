/*
 * ChatRelay - relay server start and stop tests
 */

#include <chrono>
#include <string>
#include <thread>

#include "config.hpp"
#include "server.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;

int main() {
    set_log_level(LogLevel::Error);

    ServerConfig config;
    config.port = 0; // any free port
    config.bind_address = "127.0.0.1";
    config.log_file.clear();

    // With a 300 s idle timeout the maintenance thread sleeps 30 s between
    // passes, so only a delivered wakeup lets stop() return quickly.
    for (int i = 0; i < 25; ++i) {
        RelayServer server(config);
        server.start();
        if (i % 2 == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        const auto begin = std::chrono::steady_clock::now();
        server.stop();
        const auto elapsed = std::chrono::steady_clock::now() - begin;
        if (elapsed > std::chrono::seconds(5)) {
            FAIL();
        }
        // A second stop is a no-op.
        server.stop();
    }
    return 0;
}
