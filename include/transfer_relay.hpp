/*
 * ChatRelay - server side file transfer relay
 */

#pragma once

#include "errors.hpp"
#include "event_sink.hpp"
#include "events.hpp"
#include "session_registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chatrelay {

constexpr std::chrono::milliseconds kDefaultTransferIdleTimeout{300000};

struct TransferSession {
    std::string transfer_id;
    ConnectionHandle sender = 0;
    std::string sender_username;
    std::optional<std::string> recipient;
    bool is_private = false;
    uint64_t expected_chunks = 0; // known once chunk 0 arrived
    uint64_t received_chunks = 0;
    std::optional<TransferMetadata> metadata;
    std::optional<std::string> encrypted_aes_key;
    std::optional<std::string> iv;
    uint64_t last_activity_ms = 0;

    bool complete() const { return expected_chunks > 0 && received_chunks >= expected_chunks; }
};

// Pure relay with progress bookkeeping: chunk content is never inspected.
// A record lives until a downstream file_transfer_ack arrives, its sender
// disconnects, or it sits idle longer than the idle timeout.
class TransferRelay {
public:
    using Clock = std::function<uint64_t()>;

    TransferRelay(SessionRegistry& registry,
                  EventSink& sink,
                  std::chrono::milliseconds idle_timeout = kDefaultTransferIdleTimeout,
                  Clock clock = monotonic_clock());

    bool handle_chunk(ConnectionHandle sender, const FileChunkUpload& upload, RelayError& error);

    // Forwards the ack to the transfer's sender and releases the record.
    // Unknown transfer ids are ignored; returns false for them.
    bool handle_ack(ConnectionHandle from, const FileTransferAck& ack);

    // Drops every transfer started by `sender`.
    std::size_t drop_connection(ConnectionHandle sender);

    // Drops transfers idle for longer than the idle timeout.
    std::size_t reclaim_idle();

    std::optional<TransferSession> find(const std::string& transfer_id) const;
    std::size_t active_count() const;

    static Clock monotonic_clock();

private:
    SessionRegistry& registry_;
    EventSink& sink_;
    const std::chrono::milliseconds idle_timeout_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TransferSession> transfers_;
};

} // namespace chatrelay
