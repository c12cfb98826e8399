/*
 * ChatRelay - command line and environment configuration
 */

#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chatrelay {

constexpr uint16_t kDefaultPort = 5000;
constexpr std::size_t kDefaultChunkSize = 64 * 1024;

struct ServerConfig {
    std::string bind_address;
    uint16_t port = kDefaultPort;
    std::size_t history_capacity = 200;
    std::chrono::seconds transfer_idle_timeout{300};
    std::string log_file = "logs/server.log";
    LogLevel log_level = LogLevel::Info;
};

struct ClientConfig {
    std::string host = "127.0.0.1";
    uint16_t port = kDefaultPort;
    std::string username;
    std::size_t chunk_size = kDefaultChunkSize;
    std::string download_dir = "downloads";
    LogLevel log_level = LogLevel::Info;
    bool quiet = false; // no console output, for scripted clients
};

struct LoadTestConfig {
    std::string host = "127.0.0.1";
    uint16_t port = kDefaultPort;
    std::size_t clients = 5;
    std::size_t public_messages = 3;  // per client
    std::size_t private_messages = 2; // per client
    LogLevel log_level = LogLevel::Warn;
};

// chatrelay_server [--debug] [port] [bind_address] [history_capacity] [idle_timeout_seconds]
// CHAT_PORT overrides the default port; positional arguments override both.
bool load_server_config(int argc, char** argv, ServerConfig& config, std::string& error);

// chatrelay_client [--debug] <username> [host] [port] [chunk_size] [download_dir]
// CHAT_HOST and CHAT_PORT override the defaults.
bool load_client_config(int argc, char** argv, ClientConfig& config, std::string& error);

// chatrelay_loadtest [--debug] [-c clients] [-m public_messages] [-p private_messages] [host] [port]
// CHAT_HOST and CHAT_PORT override the defaults.
bool load_loadtest_config(int argc, char** argv, LoadTestConfig& config, std::string& error);

std::string server_usage(const std::string& program);
std::string client_usage(const std::string& program);
std::string loadtest_usage(const std::string& program);

bool parse_port(const std::string& text, uint16_t& port);

} // namespace chatrelay
