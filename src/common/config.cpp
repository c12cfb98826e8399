/*
 * ChatRelay - configuration loading
 */

#include "config.hpp"

#include <cstdlib>
#include <limits>
#include <vector>

namespace chatrelay {

namespace {

bool parse_unsigned(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

// Splits argv into flags and positional arguments; --debug is the only flag.
bool collect_arguments(int argc, char** argv, std::vector<std::string>& positional, bool& debug,
                       std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            debug = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            error = "Unknown option " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    return true;
}

} // namespace

bool parse_port(const std::string& text, uint16_t& port) {
    uint64_t value = 0;
    if (!parse_unsigned(text, std::numeric_limits<uint16_t>::max(), value) || value == 0) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

bool load_server_config(int argc, char** argv, ServerConfig& config, std::string& error) {
    std::vector<std::string> positional;
    bool debug = false;
    if (!collect_arguments(argc, argv, positional, debug, error)) {
        return false;
    }
    if (positional.size() > 4) {
        error = "Too many arguments";
        return false;
    }

    const std::string env_port = env_or_empty("CHAT_PORT");
    if (!env_port.empty() && !parse_port(env_port, config.port)) {
        error = "Invalid CHAT_PORT value '" + env_port + "'";
        return false;
    }
    if (positional.size() >= 1 && !parse_port(positional[0], config.port)) {
        error = "Invalid port '" + positional[0] + "'";
        return false;
    }
    if (positional.size() >= 2) {
        config.bind_address = positional[1];
    }
    if (positional.size() >= 3) {
        uint64_t capacity = 0;
        if (!parse_unsigned(positional[2], 1000000, capacity) || capacity == 0) {
            error = "Invalid history capacity '" + positional[2] + "'";
            return false;
        }
        config.history_capacity = static_cast<std::size_t>(capacity);
    }
    if (positional.size() >= 4) {
        uint64_t seconds = 0;
        if (!parse_unsigned(positional[3], 86400, seconds) || seconds == 0) {
            error = "Invalid idle timeout '" + positional[3] + "'";
            return false;
        }
        config.transfer_idle_timeout = std::chrono::seconds(seconds);
    }
    if (debug) {
        config.log_level = LogLevel::Debug;
    }
    return true;
}

bool load_client_config(int argc, char** argv, ClientConfig& config, std::string& error) {
    std::vector<std::string> positional;
    bool debug = false;
    if (!collect_arguments(argc, argv, positional, debug, error)) {
        return false;
    }
    if (positional.empty()) {
        error = "A username is required";
        return false;
    }
    if (positional.size() > 5) {
        error = "Too many arguments";
        return false;
    }

    const std::string env_host = env_or_empty("CHAT_HOST");
    if (!env_host.empty()) {
        config.host = env_host;
    }
    const std::string env_port = env_or_empty("CHAT_PORT");
    if (!env_port.empty() && !parse_port(env_port, config.port)) {
        error = "Invalid CHAT_PORT value '" + env_port + "'";
        return false;
    }

    config.username = trim(positional[0]);
    if (config.username.empty()) {
        error = "A username is required";
        return false;
    }
    if (positional.size() >= 2) {
        config.host = positional[1];
    }
    if (positional.size() >= 3 && !parse_port(positional[2], config.port)) {
        error = "Invalid port '" + positional[2] + "'";
        return false;
    }
    if (positional.size() >= 4) {
        uint64_t chunk = 0;
        if (!parse_unsigned(positional[3], 4ull * 1024ull * 1024ull, chunk) || chunk == 0) {
            error = "Invalid chunk size '" + positional[3] + "'";
            return false;
        }
        config.chunk_size = static_cast<std::size_t>(chunk);
    }
    if (positional.size() >= 5) {
        config.download_dir = positional[4];
    }
    if (debug) {
        config.log_level = LogLevel::Debug;
    }
    return true;
}

bool load_loadtest_config(int argc, char** argv, LoadTestConfig& config, std::string& error) {
    const std::string env_host = env_or_empty("CHAT_HOST");
    if (!env_host.empty()) {
        config.host = env_host;
    }
    const std::string env_port = env_or_empty("CHAT_PORT");
    if (!env_port.empty() && !parse_port(env_port, config.port)) {
        error = "Invalid CHAT_PORT value '" + env_port + "'";
        return false;
    }

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::size_t* target = nullptr;
        if (arg == "--debug") {
            config.log_level = LogLevel::Debug;
            continue;
        }
        if (arg == "-c" || arg == "--clients") {
            target = &config.clients;
        } else if (arg == "-m" || arg == "--messages") {
            target = &config.public_messages;
        } else if (arg == "-p" || arg == "--private-messages") {
            target = &config.private_messages;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option " + arg;
            return false;
        } else {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            error = "Missing value for " + arg;
            return false;
        }
        uint64_t value = 0;
        const std::string text = argv[++i];
        if (!parse_unsigned(text, 10000, value)) {
            error = "Invalid value '" + text + "' for " + arg;
            return false;
        }
        *target = static_cast<std::size_t>(value);
    }
    if (config.clients == 0) {
        error = "Must have at least 1 client";
        return false;
    }
    if (positional.size() > 2) {
        error = "Too many arguments";
        return false;
    }
    if (positional.size() >= 1) {
        config.host = positional[0];
    }
    if (positional.size() >= 2 && !parse_port(positional[1], config.port)) {
        error = "Invalid port '" + positional[1] + "'";
        return false;
    }
    return true;
}

std::string server_usage(const std::string& program) {
    return "Usage: " + program +
           " [--debug] [port] [bind_address] [history_capacity] [idle_timeout_seconds]";
}

std::string client_usage(const std::string& program) {
    return "Usage: " + program + " [--debug] <username> [host] [port] [chunk_size] [download_dir]";
}

std::string loadtest_usage(const std::string& program) {
    return "Usage: " + program + " [--debug] [-c clients] [-m public_messages] [-p private_messages] [host] [port]";
}

} // namespace chatrelay
