/*
 * ChatRelay - server side file transfer relay implementation
 */

#include "transfer_relay.hpp"

#include "server_log.hpp"
#include "utils.hpp"

#include <vector>

namespace chatrelay {

TransferRelay::TransferRelay(SessionRegistry& registry,
                             EventSink& sink,
                             std::chrono::milliseconds idle_timeout,
                             Clock clock)
    : registry_(registry),
      sink_(sink),
      idle_timeout_(idle_timeout),
      clock_(clock ? std::move(clock) : monotonic_clock()) {}

TransferRelay::Clock TransferRelay::monotonic_clock() {
    return [] { return monotonic_millis(); };
}

bool TransferRelay::handle_chunk(ConnectionHandle sender,
                                 const FileChunkUpload& upload,
                                 RelayError& error) {
    const FileChunkFields& chunk = upload.chunk;
    if (chunk.transfer_id.empty() || !chunk.chunk_index.has_value() || chunk.chunk_data.empty()) {
        error.set(ErrorCode::InvalidChunk, "Invalid file chunk");
        return false;
    }
    const uint64_t index = chunk.chunk_index.value();
    const std::string sender_name = registry_.username_of(sender).value_or("Unknown");

    std::optional<ConnectionHandle> target;
    std::string recipient;
    if (upload.is_private) {
        recipient = trim(upload.recipient.value_or(""));
        if (recipient.empty()) {
            error.set(ErrorCode::InvalidRecipient, "A valid recipient is required.");
            return false;
        }
        target = registry_.lookup(recipient);
        if (!target.has_value()) {
            error.set(ErrorCode::RecipientOffline, "Recipient '" + recipient + "' not found");
            return false;
        }
    }

    FileChunkRelay forward;
    forward.chunk.transfer_id = chunk.transfer_id;
    forward.chunk.chunk_index = index;
    forward.chunk.chunk_data = chunk.chunk_data;
    forward.chunk.is_last_chunk = chunk.is_last_chunk;

    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(chunk.transfer_id);
        if (it == transfers_.end()) {
            TransferSession session;
            session.transfer_id = chunk.transfer_id;
            session.sender = sender;
            session.sender_username = sender_name;
            session.is_private = upload.is_private;
            if (upload.is_private) {
                session.recipient = recipient;
            }
            it = transfers_.emplace(chunk.transfer_id, std::move(session)).first;
        }
        TransferSession& session = it->second;

        if (index == 0 && chunk.metadata.has_value()) {
            session.metadata = chunk.metadata;
            session.expected_chunks = chunk.metadata->total_chunks;
            session.encrypted_aes_key = chunk.encrypted_aes_key;
            session.iv = chunk.iv;
        }
        session.received_chunks++;
        session.last_activity_ms = clock_();

        if (index == 0) {
            forward.chunk.metadata = session.metadata;
            forward.chunk.encrypted_aes_key = session.encrypted_aes_key;
            forward.chunk.iv = session.iv;
        }
        completed = session.complete();
    }

    if (target.has_value()) {
        sink_.emit(forward, EmitTarget::one(target.value()));
        server_log_debug("Private file chunk forwarded: " + sender_name + " -> " + recipient);
    } else {
        sink_.emit(forward, EmitTarget::all());
        server_log_debug("Public file chunk broadcast from " + sender_name);
    }

    if (completed) {
        // Released when the acknowledgement arrives.
        server_log_info("File transfer complete: " + chunk.transfer_id);
    }
    return true;
}

bool TransferRelay::handle_ack(ConnectionHandle from, const FileTransferAck& ack) {
    ConnectionHandle sender = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(ack.transfer_id);
        if (it == transfers_.end()) {
            return false;
        }
        sender = it->second.sender;
        transfers_.erase(it);
    }
    sink_.emit(FileTransferAck{ack.transfer_id, ack.success, ack.error}, EmitTarget::one(sender));
    server_log_info("File transfer " + ack.transfer_id + (ack.success ? " acknowledged" : " failed") +
                    " by connection #" + std::to_string(from));
    return true;
}

std::size_t TransferRelay::drop_connection(ConnectionHandle sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (it->second.sender == sender) {
            it = transfers_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t TransferRelay::reclaim_idle() {
    const uint64_t now = clock_();
    const uint64_t timeout = static_cast<uint64_t>(idle_timeout_.count());
    std::vector<std::string> reclaimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (now >= it->second.last_activity_ms && now - it->second.last_activity_ms > timeout) {
                reclaimed.push_back(it->first);
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& id : reclaimed) {
        server_log_warn("Reclaimed idle file transfer " + id);
    }
    return reclaimed.size();
}

std::optional<TransferSession> TransferRelay::find(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TransferRelay::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

} // namespace chatrelay
