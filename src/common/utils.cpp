/*
 * ChatRelay - utility helpers implementation
 */

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace chatrelay {

namespace {
std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Info;

bool kv_safe_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' ||
           ch == '+' || ch == '/' || ch == ':' || ch == ',' || ch == '@';
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}
} // namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now {};
#if defined(_WIN32)
    localtime_s(&tm_now, &now_time);
#else
    localtime_r(&now_time, &tm_now);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

void log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }
    std::cerr << "[" << level_to_string(level) << " " << timestamp_now() << "] "
              << message << std::endl;
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }
    std::string output;
    output.resize(((data.size() + 2) / 3) * 4);
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                              data.data(),
                              static_cast<int>(data.size()));
    if (len < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    output.resize(static_cast<std::size_t>(len));
    return output;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>();
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> output;
    output.resize((encoded.size() / 4) * 3);
    int len = EVP_DecodeBlock(output.data(),
                              reinterpret_cast<const unsigned char*>(encoded.data()),
                              static_cast<int>(encoded.size()));
    if (len < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        padding++;
    }
    if (encoded[encoded.size() - 2] == '=') {
        padding++;
    }
    output.resize(static_cast<std::size_t>(len) - padding);
    return output;
}

uint64_t monotonic_millis() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string kv_escape(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char ch : value) {
        if (kv_safe_char(ch)) {
            out.push_back(static_cast<char>(ch));
        } else {
            out.push_back('%');
            out.push_back(kHex[ch >> 4]);
            out.push_back(kHex[ch & 0x0F]);
        }
    }
    return out;
}

std::string kv_unescape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::string kv_string(const std::map<std::string, std::string>& values) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) {
            oss << ';';
        }
        first = false;
        oss << kv_escape(key) << '=' << kv_escape(value);
    }
    return oss.str();
}

std::map<std::string, std::string> parse_kv_string(const std::string& input) {
    std::map<std::string, std::string> result;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, ';')) {
        auto pos = token.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = token.substr(0, pos);
        std::string value = token.substr(pos + 1);
        result[kv_unescape(trim(key))] = kv_unescape(trim(value));
    }
    return result;
}

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, delimiter)) {
        parts.push_back(token);
    }
    return parts;
}

FileLogger::FileLogger(std::string path) : path_(std::move(path)) {}

FileLogger::~FileLogger() = default;

void FileLogger::set_path(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = std::move(path);
}

void FileLogger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        return;
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open log file: " + path_);
    }
    out << line << '\n';
    out.flush();
}

} // namespace chatrelay
