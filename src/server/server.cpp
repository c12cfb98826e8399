/*
 * ChatRelay - relay server transport implementation
 */

#include "server.hpp"

#include "crypto.hpp"
#include "event_codec.hpp"
#include "protocol.hpp"
#include "server_log.hpp"
#include "utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace chatrelay {

namespace {
constexpr const char* kChannelInfo = "chatrelay-channel";

RelayServiceOptions service_options(const ServerConfig& config) {
    RelayServiceOptions options;
    options.history_capacity = config.history_capacity;
    options.transfer_idle_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config.transfer_idle_timeout);
    return options;
}

bool send_handshake(int fd, const std::map<std::string, std::string>& kv) {
    Frame frame;
    frame.kind = MessageKind::Handshake;
    std::string payload = kv_string(kv);
    frame.payload.assign(payload.begin(), payload.end());
    return send_frame(fd, frame);
}
} // namespace

RelayServer::RelayServer(ServerConfig config)
    : config_(std::move(config)), service_(*this, service_options(config_)) {}

RelayServer::~RelayServer() {
    stop();
}

void RelayServer::start() {
    if (running_) {
        return;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(std::strerror(errno)));
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bind_address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Invalid bind address: " + config_.bind_address);
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to bind: " + std::string(std::strerror(errno)));
    }

    if (::listen(listen_fd_, 16) < 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen: " + std::string(std::strerror(errno)));
    }

    if (!config_.log_file.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(config_.log_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        if (ec) {
            log_warn("Failed to create log directory: " + ec.message());
        } else {
            {
                std::ofstream server_log_stream(config_.log_file, std::ios::app);
                server_log_stream << "\n\n";
            }
            set_server_log_file(config_.log_file);
        }
    }

    server_log_info("ChatRelay server listening on port " + std::to_string(config_.port));
    running_ = true;

    accept_thread_ = std::thread(&RelayServer::accept_loop, this);
    maintenance_thread_ = std::thread(&RelayServer::maintenance_loop, this);
}

void RelayServer::stop() {
    {
        // Stored under the maintenance mutex so the maintenance thread cannot miss the wakeup.
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    std::vector<std::shared_ptr<Connection>> to_join;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [handle, connection] : connections_) {
            to_join.push_back(connection);
        }
    }

    for (auto& connection : to_join) {
        interrupt(connection);
    }
    for (auto& connection : to_join) {
        if (connection->reader.joinable()) {
            connection->reader.join();
        }
    }
    reap_retired();
    server_log_info("ChatRelay server stopped");
}

void RelayServer::accept_loop() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            server_log_warn("Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        auto connection = std::make_shared<Connection>();
        connection->socket_fd = client_fd;
        connection->active = true;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            if (!running_) {
                ::close(client_fd);
                break;
            }
            connection->handle = next_handle_++;
            connections_[connection->handle] = connection;
            connection->reader = std::thread(&RelayServer::handle_connection, this, connection);
        }
    }
}

void RelayServer::maintenance_loop() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.transfer_idle_timeout) / 4;
    interval = std::max(interval, std::chrono::milliseconds(1000));
    interval = std::min(interval, std::chrono::milliseconds(30000));

    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (running_) {
        maintenance_cv_.wait_for(lock, interval, [this] { return !running_; });
        if (!running_) {
            break;
        }
        lock.unlock();
        service_.transfers().reclaim_idle();
        reap_retired();
        lock.lock();
    }
}

void RelayServer::handle_connection(std::shared_ptr<Connection> connection) {
    const std::string tag = "#" + std::to_string(connection->handle);
    server_log_info("Client connected " + tag);
    try {
        if (!perform_handshake(connection)) {
            server_log_warn("Handshake failed, terminating client " + tag);
            shutdown_connection(connection);
            return;
        }
    } catch (const std::exception& ex) {
        server_log_error(std::string("Handshake exception: ") + ex.what());
        shutdown_connection(connection);
        return;
    }

    connection->writer = std::thread(&RelayServer::writer_loop, this, connection);
    connection->ready = true;
    service_.on_connect(connection->handle);

    const auto aad = channel_aad(true, connection->handle);
    while (connection->active) {
        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(connection->socket_mutex);
            fd = connection->socket_fd;
        }
        auto frame_opt = receive_frame(fd);
        if (!frame_opt.has_value()) {
            break;
        }
        const Frame& frame = frame_opt.value();
        if (frame.kind != MessageKind::Event) {
            server_log_warn("Unexpected frame kind from " + tag);
            continue;
        }

        std::vector<uint8_t> nonce;
        std::vector<uint8_t> ciphertext;
        std::vector<uint8_t> gcm_tag;
        if (!unpack_sealed_payload(frame.payload, nonce, ciphertext, gcm_tag)) {
            server_log_warn("Invalid event payload from " + tag);
            continue;
        }

        std::string text;
        try {
            auto plaintext = aes256_gcm_decrypt(connection->channel_key, Ciphertext{nonce, ciphertext, gcm_tag}, aad);
            text.assign(plaintext.begin(), plaintext.end());
        } catch (const std::exception& ex) {
            server_log_error("Event decrypt failed for " + tag + ": " + ex.what());
            continue;
        }

        std::string error;
        auto event = decode_event(text, EventDirection::ToServer, error);
        if (!event.has_value()) {
            service_.reject_malformed(connection->handle, error);
            continue;
        }
        server_log_debug(std::string("Event '") + event_name(event.value()) + "' from " + tag);
        service_.handle_event(connection->handle, event.value());
    }

    shutdown_connection(connection);
}

bool RelayServer::perform_handshake(const std::shared_ptr<Connection>& connection) {
    const int fd = connection->socket_fd;
    KeyPair server_keys = generate_x25519_keypair();
    if (!send_handshake(fd, {{"type", "server_hello"}, {"pub", base64_encode(server_keys.public_key)}})) {
        return false;
    }

    auto frame_opt = receive_frame(fd);
    if (!frame_opt.has_value() || frame_opt->kind != MessageKind::Handshake) {
        return false;
    }
    std::string client_msg(frame_opt->payload.begin(), frame_opt->payload.end());
    auto params = parse_kv_string(client_msg);
    if (params["type"] != "client_hello") {
        return false;
    }
    auto client_pub = base64_decode(params["pub"]);
    if (!client_pub.has_value()) {
        return false;
    }
    auto shared_secret = compute_x25519_shared(server_keys.private_key, client_pub.value());
    connection->channel_key = hkdf_sha256(shared_secret, kChannelInfo, kAes256KeySize);

    return send_handshake(fd, {{"type", "handshake_ack"}, {"id", std::to_string(connection->handle)}});
}

void RelayServer::emit(const Event& event, const EmitTarget& target) {
    const std::string encoded = encode_event(event);
    std::vector<std::shared_ptr<Connection>> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (target.kind == EmitTarget::Kind::One) {
            auto it = connections_.find(target.handle);
            if (it != connections_.end()) {
                targets.push_back(it->second);
            }
        } else {
            for (const auto& [handle, connection] : connections_) {
                if (target.kind == EmitTarget::Kind::AllExcept && handle == target.handle) {
                    continue;
                }
                targets.push_back(connection);
            }
        }
    }

    for (const auto& connection : targets) {
        if (!connection->ready || !connection->active) {
            continue;
        }
        enqueue(connection, encoded);
    }
}

void RelayServer::enqueue(const std::shared_ptr<Connection>& connection, const std::string& encoded) {
    if (connection->outbox.push(encoded)) {
        return;
    }
    // A closed outbox on a still active connection means this push overflowed it.
    if (connection->active.exchange(false)) {
        server_log_warn("Outbox limit exceeded, disconnecting client #" + std::to_string(connection->handle));
        interrupt(connection);
    }
}

void RelayServer::writer_loop(std::shared_ptr<Connection> connection) {
    std::string encoded;
    while (connection->outbox.pop(encoded)) {
        if (!send_sealed(connection, encoded)) {
            server_log_warn("Send failed for connection #" + std::to_string(connection->handle));
            connection->active = false;
            interrupt(connection);
            return;
        }
    }
}

bool RelayServer::send_sealed(const std::shared_ptr<Connection>& connection, const std::string& encoded) {
    std::vector<uint8_t> plain(encoded.begin(), encoded.end());
    Ciphertext sealed;
    try {
        sealed = aes256_gcm_encrypt(connection->channel_key, plain, channel_aad(false, connection->handle));
    } catch (const std::exception& ex) {
        server_log_error(std::string("Event encrypt failed: ") + ex.what());
        return false;
    }
    Frame frame;
    frame.kind = MessageKind::Event;
    frame.payload = pack_sealed_payload(sealed.nonce, sealed.data, sealed.tag);

    // Only the writer sends, and the descriptor is closed after the writer is joined.
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(connection->socket_mutex);
        fd = connection->socket_fd;
    }
    return fd >= 0 && send_frame(fd, frame);
}

void RelayServer::interrupt(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connection->socket_mutex);
    if (connection->socket_fd >= 0) {
        ::shutdown(connection->socket_fd, SHUT_RDWR);
    }
}

// Runs on the connection's reader thread.
void RelayServer::shutdown_connection(const std::shared_ptr<Connection>& connection) {
    connection->active = false;
    interrupt(connection);

    connection->outbox.close();
    if (connection->writer.joinable()) {
        connection->writer.join();
    }

    {
        std::lock_guard<std::mutex> lock(connection->socket_mutex);
        if (connection->socket_fd >= 0) {
            ::close(connection->socket_fd);
            connection->socket_fd = -1;
        }
    }

    if (connection->ready) {
        service_.on_disconnect(connection->handle);
    }

    // A live reader is always reachable from connections_ or retired_.
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection->handle);
        retired_.push_back(connection);
    }
    server_log_info("Client #" + std::to_string(connection->handle) + " disconnected");
}

// Joins reader threads of connections that already finished shutting down.
void RelayServer::reap_retired() {
    std::vector<std::shared_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        finished.swap(retired_);
    }
    for (auto& connection : finished) {
        if (connection->reader.joinable()) {
            connection->reader.join();
        }
    }
}

} // namespace chatrelay
