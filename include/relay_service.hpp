/*
 * ChatRelay - server event dispatch
 */

#pragma once

#include "delivery_tracker.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "events.hpp"
#include "session_registry.hpp"
#include "transfer_relay.hpp"
#include "typing_relay.hpp"

#include <chrono>
#include <string>

namespace chatrelay {

struct RelayServiceOptions {
    std::size_t history_capacity = kDefaultHistoryCapacity;
    std::chrono::milliseconds transfer_idle_timeout = kDefaultTransferIdleTimeout;
    TransferRelay::Clock clock;
};

// Owns the per-process service objects and routes every decoded client event
// to the one responsible for it. Component failures come back as RelayError
// and leave here as an `error` event addressed to the originator.
class RelayService {
public:
    explicit RelayService(EventSink& sink, RelayServiceOptions options = {});

    RelayService(const RelayService&) = delete;
    RelayService& operator=(const RelayService&) = delete;

    void on_connect(ConnectionHandle handle);
    void on_disconnect(ConnectionHandle handle);

    void handle_event(ConnectionHandle origin, const Event& event);

    // Called by the transport when a frame could not be decoded.
    void reject_malformed(ConnectionHandle origin, const std::string& reason);

    SessionRegistry& registry() { return registry_; }
    DeliveryTracker& tracker() { return tracker_; }
    TypingRelay& typing() { return typing_; }
    TransferRelay& transfers() { return transfers_; }

private:
    void on_register(ConnectionHandle origin, const RegisterRequest& request);
    void on_public_message(ConnectionHandle origin, const PublicMessageRequest& request);
    void on_private_message(ConnectionHandle origin, const PrivateMessageRequest& request);
    void on_read_ack(ConnectionHandle origin, const ReadAckRequest& request);
    void on_history(ConnectionHandle origin);
    void on_key_exchange(ConnectionHandle origin, const KeyExchangeRequest& request);
    void on_file_chunk(ConnectionHandle origin, const FileChunkUpload& upload);
    void on_transfer_ack(ConnectionHandle origin, const FileTransferAck& ack);

    void send_error(ConnectionHandle origin, const RelayError& error);

    EventSink& sink_;
    SessionRegistry registry_;
    DeliveryTracker tracker_;
    TypingRelay typing_;
    TransferRelay transfers_;
};

} // namespace chatrelay
