/*
 * ChatRelay client entry point
 */

#include "client.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <chrono>
#include <iostream>

using namespace chatrelay;

int main(int argc, char** argv) {
    ClientConfig config;
    std::string error;
    if (!load_client_config(argc, argv, config, error)) {
        std::cerr << error << "\n" << client_usage(argv[0]) << std::endl;
        return 2;
    }

    set_log_level(config.log_level);

    try {
        ChatClient client(config);
        if (!client.start(std::chrono::seconds(10))) {
            std::cerr << "Could not connect to server.\n";
            return 1;
        }

        std::cout << "Connected to " << config.host << ":" << config.port << " as " << config.username
                  << std::endl;
        std::cout << "Type /help for commands.\n";
        client.run();
    } catch (const std::exception& ex) {
        log_error(std::string("Client error: ") + ex.what());
        return 1;
    }
    return 0;
}
