/*
 * ChatRelay - client side reassembly of incoming encrypted transfers
 */

#pragma once

#include "crypto.hpp"
#include "events.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatrelay {

struct ReceivedFile {
    std::string transfer_id;
    std::string filename;
    std::vector<uint8_t> data;
};

class TransferAssembler {
public:
    using SendCallback = std::function<void(const Event&)>;
    // expected is 0 until chunk 0 has arrived.
    using ProgressCallback =
        std::function<void(const std::string& transfer_id, uint64_t received, uint64_t expected)>;
    using CompleteCallback = std::function<void(const ReceivedFile&)>;
    using ErrorCallback = std::function<void(const std::string& transfer_id, const std::string& message)>;

    TransferAssembler(PkeyHandle private_key, SendCallback send);

    void set_progress_callback(ProgressCallback callback);
    void set_complete_callback(CompleteCallback callback);
    void set_error_callback(ErrorCallback callback);

    // Buffers one chunk; once every chunk is present the file is
    // reassembled, verified and acknowledged and the state released.
    void on_chunk(const FileChunkFields& chunk);

    void clear();
    std::size_t pending_count() const;

private:
    struct PendingTransfer {
        std::map<uint64_t, std::string> chunks;
        std::optional<TransferMetadata> metadata;
        std::string encrypted_aes_key;
        std::string iv;
    };

    void finish(const std::string& transfer_id, PendingTransfer pending);

    PkeyHandle private_key_;
    SendCallback send_;
    ProgressCallback on_progress_;
    CompleteCallback on_complete_;
    ErrorCallback on_error_;

    mutable std::mutex mutex_;
    std::map<std::string, PendingTransfer> pending_;
};

} // namespace chatrelay
