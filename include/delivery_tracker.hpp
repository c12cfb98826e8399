/*
 * ChatRelay - private message delivery tracking
 */

#pragma once

#include "errors.hpp"
#include "event_sink.hpp"
#include "events.hpp"
#include "session_registry.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

// Forward-only: Sent -> Delivered -> Seen. Seen is terminal.
enum class DeliveryStatus {
    Sent = 0,
    Delivered = 1,
    Seen = 2
};

const char* delivery_status_name(DeliveryStatus status);

struct PrivateMessageRecord {
    uint64_t id = 0;
    ConnectionHandle sender = 0;
    ConnectionHandle recipient = 0;
    DeliveryStatus status = DeliveryStatus::Sent;
};

class DeliveryTracker {
public:
    DeliveryTracker(SessionRegistry& registry, EventSink& sink);

    // Routes a private message to an online recipient. Returns the new
    // message id, or nullopt with `error` filled and no record created.
    std::optional<uint64_t> send_private(ConnectionHandle sender,
                                         const std::string& recipient_username,
                                         const std::string& text,
                                         std::optional<FilePayload> file,
                                         std::optional<double> origin_timestamp,
                                         RelayError& error);

    // Marks each id Seen when `recipient` is its recipient and it is not
    // already Seen, sending one receipt per transition to the sender if the
    // sender is still connected. Returns the number of transitions.
    std::size_t acknowledge_read(ConnectionHandle recipient, const std::vector<uint64_t>& message_ids);

    std::optional<DeliveryStatus> status_of(uint64_t message_id) const;
    std::size_t message_count() const;

private:
    static bool advance(PrivateMessageRecord& record, DeliveryStatus next);

    SessionRegistry& registry_;
    EventSink& sink_;

    mutable std::mutex mutex_;
    uint64_t next_message_id_ = 1;
    std::map<uint64_t, PrivateMessageRecord> messages_;
};

} // namespace chatrelay
