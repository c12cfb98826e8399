/*
 * ChatRelay - server logging helpers implementation
 */

#include "server_log.hpp"

#include <stdexcept>

namespace chatrelay {

namespace {
FileLogger g_server_file_logger("");
} // namespace

void set_server_log_file(const std::string& path) {
    g_server_file_logger.set_path(path);
}

void server_log(LogLevel level, const std::string& message) {
    log(level, message);
    // Debug output stays on stderr.
    if (level == LogLevel::Debug) {
        return;
    }
    std::string prefix = "[" + level_to_string(level) + " " + timestamp_now() + "] ";
    try {
        g_server_file_logger.write(prefix + message);
    } catch (const std::exception& ex) {
        log_warn(ex.what());
    }
}

} // namespace chatrelay
