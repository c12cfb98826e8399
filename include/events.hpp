/*
 * ChatRelay - event payload records
 *
 * One record per event name of the relay protocol. Events travelling to the
 * server and events travelling to clients are distinct types even where the
 * protocol reuses a name (message, private_message_read,
 * public_key_exchange), so the variant alternative alone identifies both the
 * name and the direction.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chatrelay {

constexpr uint64_t kMaxFileBytes = 5ull * 1024ull * 1024ull;
constexpr std::size_t kMaxFileFieldLength = 255;
constexpr const char* kDefaultMime = "application/octet-stream";

struct FilePayload {
    std::string name;
    std::string mime;
    uint64_t size = 0;
    std::string data; // base64
};

struct TransferMetadata {
    std::string filename;
    uint64_t total_size = 0;
    uint64_t total_chunks = 0;
    std::string file_hash; // lowercase hex SHA-256 of the plaintext
    uint64_t chunk_size = 0;
};

struct FileChunkFields {
    std::string transfer_id;
    std::optional<uint64_t> chunk_index;
    std::string chunk_data; // base64
    bool is_last_chunk = false;
    std::optional<TransferMetadata> metadata;
    std::optional<std::string> encrypted_aes_key; // base64
    std::optional<std::string> iv;                // base64
};

// register (client -> server)
struct RegisterRequest {
    std::string username;
};

// update_user_list (server -> client)
struct UserListUpdate {
    std::vector<std::string> users;
};

// message (client -> server)
struct PublicMessageRequest {
    std::string message;
    std::optional<FilePayload> file;
    std::optional<double> timestamp;
};

// message (server -> client); also the public history entry
struct PublicMessage {
    std::string username;
    std::string message;
    std::optional<FilePayload> file;
    std::optional<double> timestamp;
};

// private_message (client -> server)
struct PrivateMessageRequest {
    std::string recipient;
    std::string message;
    std::optional<FilePayload> file;
    std::optional<double> timestamp;
};

struct PrivateMessageNotice {
    std::string sender;
    std::string recipient;
    std::string message;
    uint64_t message_id = 0;
    std::string status;
    std::optional<FilePayload> file;
    std::optional<double> timestamp;
};

// private_message_received (server -> recipient)
struct PrivateMessageReceived : PrivateMessageNotice {};

// private_message_sent (server -> sender)
struct PrivateMessageSent : PrivateMessageNotice {};

// private_message_read (client -> server)
struct ReadAckRequest {
    std::vector<uint64_t> message_ids;
};

// private_message_read (server -> original sender)
struct ReadReceipt {
    uint64_t message_id = 0;
};

// typing (client -> server)
struct TypingRequest {
    std::string context;
    bool is_typing = false;
    std::optional<std::string> recipient;
};

// public_typing (server -> client)
struct PublicTyping {
    std::string username;
    bool is_typing = false;
};

// private_typing (server -> client)
struct PrivateTyping {
    std::string username;
    bool is_typing = false;
};

// request_history (client -> server)
struct HistoryRequest {};

// chat_history (server -> client)
struct ChatHistory {
    std::vector<PublicMessage> messages;
};

// public_key_exchange (client -> server)
struct KeyExchangeRequest {
    std::string target_username;
    std::string public_key;
};

// public_key_exchange (server -> target)
struct PeerPublicKey {
    std::string username;
    std::string public_key;
};

// public_file_chunk / private_file_chunk (client -> server)
struct FileChunkUpload {
    bool is_private = false;
    std::optional<std::string> recipient;
    FileChunkFields chunk;
};

// file_chunk (server -> client)
struct FileChunkRelay {
    FileChunkFields chunk;
};

// file_transfer_ack (both directions)
struct FileTransferAck {
    std::string transfer_id;
    bool success = false;
    std::string error;
};

// error (server -> client)
struct ErrorNotice {
    std::string message;
};

using Event = std::variant<RegisterRequest,
                           UserListUpdate,
                           PublicMessageRequest,
                           PublicMessage,
                           PrivateMessageRequest,
                           PrivateMessageReceived,
                           PrivateMessageSent,
                           ReadAckRequest,
                           ReadReceipt,
                           TypingRequest,
                           PublicTyping,
                           PrivateTyping,
                           HistoryRequest,
                           ChatHistory,
                           KeyExchangeRequest,
                           PeerPublicKey,
                           FileChunkUpload,
                           FileChunkRelay,
                           FileTransferAck,
                           ErrorNotice>;

enum class EventDirection {
    ToServer,
    ToClient
};

const char* event_name(const Event& event);

// Clamps name and mime to 255 characters and applies the default mime.
// Returns false when the data is missing, the declared size or encoded
// length exceeds the 5 MiB cap, or the encoded length exceeds
// ceil(size * 4 / 3) + 8 for the declared size.
bool sanitize_file_payload(FilePayload& file);

} // namespace chatrelay
