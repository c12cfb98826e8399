/*
 * ChatRelay - client side reassembly implementation
 */

#include "transfer_assembler.hpp"

#include "errors.hpp"
#include "file_transfer.hpp"
#include "utils.hpp"

namespace chatrelay {

TransferAssembler::TransferAssembler(PkeyHandle private_key, SendCallback send)
    : private_key_(std::move(private_key)), send_(std::move(send)) {}

void TransferAssembler::set_progress_callback(ProgressCallback callback) {
    on_progress_ = std::move(callback);
}

void TransferAssembler::set_complete_callback(CompleteCallback callback) {
    on_complete_ = std::move(callback);
}

void TransferAssembler::set_error_callback(ErrorCallback callback) {
    on_error_ = std::move(callback);
}

void TransferAssembler::on_chunk(const FileChunkFields& chunk) {
    if (chunk.transfer_id.empty() || !chunk.chunk_index.has_value()) {
        log_warn("Dropping file chunk without transfer id or index");
        return;
    }

    uint64_t received = 0;
    uint64_t expected = 0;
    std::optional<PendingTransfer> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PendingTransfer& pending = pending_[chunk.transfer_id];
        const uint64_t index = chunk.chunk_index.value();
        pending.chunks[index] = chunk.chunk_data;
        if (index == 0 && chunk.metadata.has_value()) {
            pending.metadata = chunk.metadata;
            pending.encrypted_aes_key = chunk.encrypted_aes_key.value_or("");
            pending.iv = chunk.iv.value_or("");
        }
        received = pending.chunks.size();
        expected = pending.metadata.has_value() ? pending.metadata->total_chunks : 0;
        if (expected > 0 && received >= expected) {
            ready = std::move(pending);
            pending_.erase(chunk.transfer_id);
        }
    }

    if (on_progress_) {
        on_progress_(chunk.transfer_id, received, expected);
    }
    if (ready.has_value()) {
        finish(chunk.transfer_id, std::move(ready.value()));
    }
}

void TransferAssembler::finish(const std::string& transfer_id, PendingTransfer pending) {
    const TransferMetadata& metadata = pending.metadata.value();
    try {
        ReceivedFile file;
        file.transfer_id = transfer_id;
        file.filename = metadata.filename;
        file.data = reassemble_transfer(pending.chunks, metadata, pending.encrypted_aes_key, pending.iv,
                                        private_key_);
        log_info("Received file " + metadata.filename + " (" + std::to_string(file.data.size()) + " bytes)");
        if (send_) {
            send_(FileTransferAck{transfer_id, true, ""});
        }
        if (on_complete_) {
            on_complete_(file);
        }
    } catch (const TransferError& ex) {
        log_warn("File transfer " + transfer_id + " failed (" + error_code_name(ex.code()) + "): " + ex.what());
        if (send_) {
            send_(FileTransferAck{transfer_id, false, ex.what()});
        }
        if (on_error_) {
            on_error_(transfer_id, ex.what());
        }
    }
}

void TransferAssembler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

std::size_t TransferAssembler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace chatrelay
