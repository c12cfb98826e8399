/*
 * ChatRelay - relay server transport
 */

#pragma once

#include "config.hpp"
#include "event_sink.hpp"
#include "outbox.hpp"
#include "relay_service.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chatrelay {

struct Connection {
    ConnectionHandle handle = 0;
    std::vector<uint8_t> channel_key;
    std::thread reader;
    std::thread writer;
    std::atomic<bool> active{false};
    std::atomic<bool> ready{false}; // handshake done, writer running

    std::mutex socket_mutex;
    int socket_fd = -1;

    Outbox outbox; // encoded events
};

// Accepts TCP connections, runs the channel handshake and feeds decrypted
// events to the RelayService. As the service's EventSink it queues encoded
// events on each target connection; a writer thread per connection seals and
// sends them so a slow peer only delays itself. A peer whose outbox overflows
// is disconnected.
class RelayServer : public EventSink {
public:
    explicit RelayServer(ServerConfig config);
    ~RelayServer() override;

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    void start();
    void stop();

    void emit(const Event& event, const EmitTarget& target) override;

    RelayService& service() { return service_; }

private:
    void accept_loop();
    void maintenance_loop();
    void handle_connection(std::shared_ptr<Connection> connection);
    void writer_loop(std::shared_ptr<Connection> connection);
    bool perform_handshake(const std::shared_ptr<Connection>& connection);
    bool send_sealed(const std::shared_ptr<Connection>& connection, const std::string& encoded);
    void enqueue(const std::shared_ptr<Connection>& connection, const std::string& encoded);
    void interrupt(const std::shared_ptr<Connection>& connection);
    void shutdown_connection(const std::shared_ptr<Connection>& connection);
    void reap_retired();

    ServerConfig config_;
    RelayService service_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;

    std::mutex connections_mutex_;
    std::map<ConnectionHandle, std::shared_ptr<Connection>> connections_;
    std::vector<std::shared_ptr<Connection>> retired_;
    ConnectionHandle next_handle_ = 1;
};

} // namespace chatrelay
