/*
 * ChatRelay - server logging helpers
 *
 * Server components log to stderr through log() and, once a log file is
 * configured, append the same line to it.
 */

#pragma once

#include "utils.hpp"

#include <string>

namespace chatrelay {

void set_server_log_file(const std::string& path);

void server_log(LogLevel level, const std::string& message);

inline void server_log_debug(const std::string& message) {
    server_log(LogLevel::Debug, message);
}

inline void server_log_info(const std::string& message) {
    server_log(LogLevel::Info, message);
}

inline void server_log_warn(const std::string& message) {
    server_log(LogLevel::Warn, message);
}

inline void server_log_error(const std::string& message) {
    server_log(LogLevel::Error, message);
}

} // namespace chatrelay
