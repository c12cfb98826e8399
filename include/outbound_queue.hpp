/*
 * ChatRelay - client outbound event queue
 */

#pragma once

#include "errors.hpp"
#include "event_sink.hpp"
#include "events.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

const char* connection_state_name(ConnectionState state);

// Remembers the last typing state sent per (context, peer).
class TypingDeduplicator {
public:
    // Returns false when `is_typing` equals the last state emitted for the
    // same context and peer; otherwise records it and returns true.
    bool should_emit(const std::string& context, const std::optional<std::string>& peer, bool is_typing);

    void reset();

private:
    bool public_typing_ = false;
    std::map<std::string, bool> private_typing_;
};

// Buffers events while the connection is not up and replays them, in order,
// once it is. A pending registration always goes first. Emitting and flushing
// hold the same mutex, so an emit that races a flush lands after it.
class OutboundQueue {
public:
    using ErrorCallback = std::function<void(const RelayError&)>;
    using ConnectRequest = std::function<void()>;

    explicit OutboundQueue(EventTransport& transport);

    void set_error_callback(ErrorCallback callback);
    void set_connect_request(ConnectRequest request);

    // Remembered across reconnects; a `register` emit updates it too.
    void set_desired_username(const std::string& username);
    std::string desired_username() const;

    // Forgets the desired username when the server's error is about the
    // username (quoted names in the text are ignored), so a reconnect does
    // not replay a rejected registration.
    // Returns true when it was cleared.
    bool on_error_notice(const std::string& message);

    void emit(const Event& event);

    // Emits a typing event unless it repeats the last state for that peer.
    // Returns true when the event was emitted or buffered.
    bool emit_typing(const TypingRequest& request);

    void on_connecting();
    void on_connected();
    // Drops the buffer and the typing states.
    void on_disconnected();

    ConnectionState state() const;
    std::size_t buffered_count() const;

private:
    // Caller holds mutex_.
    void send_locked(const Event& event, std::vector<RelayError>& failures);
    void report(const std::vector<RelayError>& failures);

    EventTransport& transport_;
    ErrorCallback on_error_;
    ConnectRequest connect_request_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::vector<Event> buffer_;
    std::string desired_username_;
    TypingDeduplicator typing_;
};

} // namespace chatrelay
