/*
 * ChatRelay - command line client
 */

#pragma once

#include "config.hpp"
#include "crypto.hpp"
#include "event_sink.hpp"
#include "events.hpp"
#include "latency.hpp"
#include "outbound_queue.hpp"
#include "peer_keys.hpp"
#include "transfer_assembler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chatrelay {

class ChatClient : public EventTransport {
public:
    using EventObserver = std::function<void(const Event&)>;

    explicit ChatClient(ClientConfig config);
    ~ChatClient() override;

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // Queues the registration and starts the background connect. Returns
    // false when no connection came up within `timeout`.
    bool start(std::chrono::milliseconds timeout);
    void run();
    void stop();

    bool send_event(const Event& event, std::string& error) override;

    void send_public_message(const std::string& text);
    void send_private_message(const std::string& recipient, const std::string& text);
    // Private files go encrypted when a key for the recipient is known and
    // as a plain attachment otherwise; public files always go plain.
    bool send_file(const std::string& path, const std::optional<std::string>& recipient, std::string& error);
    void offer_key(const std::string& username);
    void request_history();
    void indicate_typing(bool is_typing, const std::optional<std::string>& recipient);
    void register_username(const std::string& username);

    // Sees every decoded server event before the client handles it. Set before start().
    void set_event_observer(EventObserver observer);

    const LatencyStats& public_latency() const { return public_latency_; }
    const LatencyStats& private_latency() const { return private_latency_; }

private:
    void connection_loop();
    void request_connect();
    bool open_connection();
    bool perform_handshake(int fd);
    void reader_loop();
    void close_socket();

    void handle_event(const Event& event);
    void on_user_list(const UserListUpdate& update);
    void on_peer_key(const PeerPublicKey& offer);
    void show_file(const std::string& label, const FilePayload& file);
    std::string measure(LatencyStats& stats, const std::optional<double>& timestamp);
    std::optional<std::string> save_received_file(const std::string& filename,
                                                  const std::vector<uint8_t>& data,
                                                  std::string& error);

    void process_user_input(const std::string& line);
    void print_line(const std::string& line);
    void show_prompt();

    ClientConfig config_;
    PkeyHandle key_pair_;
    std::string public_pem_;

    OutboundQueue queue_;
    PeerKeyDirectory peer_keys_;
    TransferAssembler assembler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};

    std::thread connection_thread_;
    std::mutex connect_mutex_;
    std::condition_variable connect_cv_;
    bool connect_requested_ = false;
    uint64_t connect_attempts_ = 0;

    std::mutex socket_mutex_;
    int socket_fd_ = -1;
    uint64_t connection_id_ = 0;
    std::vector<uint8_t> channel_key_;

    std::mutex users_mutex_;
    std::vector<std::string> users_;

    EventObserver observer_;
    LatencyStats public_latency_;
    LatencyStats private_latency_;

    std::mutex io_mutex_;
};

} // namespace chatrelay
