/*
 * ChatRelay - private message delivery tracking implementation
 */

#include "delivery_tracker.hpp"

#include "server_log.hpp"
#include "utils.hpp"

#include <utility>

namespace chatrelay {

namespace {
constexpr const char* kUnknownSender = "Unknown";
} // namespace

const char* delivery_status_name(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Sent:
            return "sent";
        case DeliveryStatus::Delivered:
            return "delivered";
        case DeliveryStatus::Seen:
            return "seen";
    }
    return "unknown";
}

DeliveryTracker::DeliveryTracker(SessionRegistry& registry, EventSink& sink)
    : registry_(registry), sink_(sink) {}

bool DeliveryTracker::advance(PrivateMessageRecord& record, DeliveryStatus next) {
    if (static_cast<int>(next) <= static_cast<int>(record.status)) {
        return false;
    }
    record.status = next;
    return true;
}

std::optional<uint64_t> DeliveryTracker::send_private(ConnectionHandle sender,
                                                      const std::string& recipient_username,
                                                      const std::string& text,
                                                      std::optional<FilePayload> file,
                                                      std::optional<double> origin_timestamp,
                                                      RelayError& error) {
    const std::string recipient = trim(recipient_username);
    if (recipient.empty()) {
        error.set(ErrorCode::InvalidRecipient, "A valid recipient is required.");
        return std::nullopt;
    }
    if (file.has_value() && !sanitize_file_payload(file.value())) {
        error.set(ErrorCode::InvalidFile, "Invalid file attachment");
        return std::nullopt;
    }
    const std::string message = trim(text);
    if (message.empty() && !file.has_value()) {
        error.set(ErrorCode::EmptyPayload, "Cannot send an empty message. Attach a file or include text.");
        return std::nullopt;
    }

    const std::string sender_name = registry_.username_of(sender).value_or(kUnknownSender);
    server_log_info("Private message request from " + sender_name + " to " + recipient);

    if (sender_name == recipient) {
        error.set(ErrorCode::SelfMessage, "You cannot send a private message to yourself.");
        server_log_warn("Private message failed: " + sender_name + " tried to message themselves.");
        return std::nullopt;
    }

    auto recipient_handle = registry_.lookup(recipient);
    if (!recipient_handle.has_value()) {
        error.set(ErrorCode::RecipientOffline, "User '" + recipient + "' not found or offline.");
        server_log_warn("Private message failed: " + recipient + " not found for sender " + sender_name);
        return std::nullopt;
    }

    uint64_t message_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_id = next_message_id_++;
        PrivateMessageRecord record;
        record.id = message_id;
        record.sender = sender;
        record.recipient = recipient_handle.value();
        record.status = DeliveryStatus::Sent;
        messages_[message_id] = record;
    }

    PrivateMessageNotice notice;
    notice.sender = sender_name;
    notice.recipient = recipient;
    notice.message = message;
    notice.message_id = message_id;
    notice.file = std::move(file);
    notice.timestamp = origin_timestamp;

    PrivateMessageReceived to_recipient;
    static_cast<PrivateMessageNotice&>(to_recipient) = notice;
    to_recipient.status = delivery_status_name(DeliveryStatus::Delivered);
    sink_.emit(to_recipient, EmitTarget::one(recipient_handle.value()));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = messages_.find(message_id);
        if (it != messages_.end()) {
            advance(it->second, DeliveryStatus::Delivered);
        }
    }

    PrivateMessageSent to_sender;
    static_cast<PrivateMessageNotice&>(to_sender) = std::move(notice);
    to_sender.status = delivery_status_name(DeliveryStatus::Sent);
    sink_.emit(to_sender, EmitTarget::one(sender));

    server_log_info("Private message #" + std::to_string(message_id) + " delivered from " +
                    sender_name + " to " + recipient);
    return message_id;
}

std::size_t DeliveryTracker::acknowledge_read(ConnectionHandle recipient,
                                              const std::vector<uint64_t>& message_ids) {
    std::vector<std::pair<ConnectionHandle, uint64_t>> receipts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t id : message_ids) {
            auto it = messages_.find(id);
            if (it == messages_.end()) {
                continue;
            }
            PrivateMessageRecord& record = it->second;
            if (record.recipient != recipient) {
                continue;
            }
            if (advance(record, DeliveryStatus::Seen)) {
                receipts.emplace_back(record.sender, id);
            }
        }
    }

    for (const auto& [sender, id] : receipts) {
        if (!registry_.is_connected(sender)) {
            server_log_debug("Dropping read receipt for message #" + std::to_string(id) +
                             ": sender disconnected");
            continue;
        }
        sink_.emit(ReadReceipt{id}, EmitTarget::one(sender));
    }
    return receipts.size();
}

std::optional<DeliveryStatus> DeliveryTracker::status_of(uint64_t message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(message_id);
    if (it == messages_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::size_t DeliveryTracker::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

} // namespace chatrelay
