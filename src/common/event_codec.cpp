/*
 * ChatRelay - event wire codec implementation
 */

#include "event_codec.hpp"

#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <sstream>
#include <type_traits>

namespace chatrelay {

namespace {
using Fields = std::map<std::string, std::string>;

template <class> inline constexpr bool kAlwaysFalse = false;

bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

bool parse_bool(const std::string& text) {
    return text == "1" || text == "true" || text == "True";
}

std::string get(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

bool has(const Fields& fields, const std::string& key) {
    return fields.find(key) != fields.end();
}

std::optional<std::string> get_optional(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool has_prefix(const Fields& fields, const std::string& prefix) {
    auto it = fields.lower_bound(prefix);
    return it != fields.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

void put_timestamp(Fields& fields, const std::string& key, const std::optional<double>& ts) {
    if (ts.has_value()) {
        fields[key] = format_double(ts.value());
    }
}

std::optional<double> get_timestamp(const Fields& fields, const std::string& key) {
    double value = 0.0;
    auto it = fields.find(key);
    if (it == fields.end() || !parse_double(it->second, value)) {
        return std::nullopt;
    }
    return value;
}

void put_file(Fields& fields, const std::string& prefix, const std::optional<FilePayload>& file) {
    if (!file.has_value()) {
        return;
    }
    fields[prefix + "name"] = file->name;
    fields[prefix + "mime"] = file->mime;
    fields[prefix + "size"] = std::to_string(file->size);
    fields[prefix + "data"] = file->data;
}

// A declared size that does not parse counts as zero; sanitize_file_payload
// then rejects the attachment.
std::optional<FilePayload> get_file(const Fields& fields, const std::string& prefix) {
    if (!has_prefix(fields, prefix)) {
        return std::nullopt;
    }
    FilePayload file;
    file.name = get(fields, prefix + "name");
    file.mime = get(fields, prefix + "mime");
    if (!parse_u64(get(fields, prefix + "size"), file.size)) {
        file.size = 0;
    }
    file.data = get(fields, prefix + "data");
    return file;
}

void put_metadata(Fields& fields, const TransferMetadata& meta) {
    fields["metadata.filename"] = meta.filename;
    fields["metadata.total_size"] = std::to_string(meta.total_size);
    fields["metadata.total_chunks"] = std::to_string(meta.total_chunks);
    fields["metadata.file_hash"] = meta.file_hash;
    fields["metadata.chunk_size"] = std::to_string(meta.chunk_size);
}

bool get_metadata(const Fields& fields, std::optional<TransferMetadata>& out, std::string& error) {
    if (!has_prefix(fields, "metadata.")) {
        out.reset();
        return true;
    }
    TransferMetadata meta;
    meta.filename = get(fields, "metadata.filename");
    meta.file_hash = get(fields, "metadata.file_hash");
    if (!parse_u64(get(fields, "metadata.total_size"), meta.total_size) ||
        !parse_u64(get(fields, "metadata.total_chunks"), meta.total_chunks)) {
        error = "malformed transfer metadata";
        return false;
    }
    if (has(fields, "metadata.chunk_size") &&
        !parse_u64(get(fields, "metadata.chunk_size"), meta.chunk_size)) {
        error = "malformed transfer metadata";
        return false;
    }
    out = meta;
    return true;
}

void put_chunk(Fields& fields, const FileChunkFields& chunk) {
    fields["transfer_id"] = chunk.transfer_id;
    if (chunk.chunk_index.has_value()) {
        fields["chunk_index"] = std::to_string(chunk.chunk_index.value());
    }
    fields["chunk_data"] = chunk.chunk_data;
    fields["is_last_chunk"] = chunk.is_last_chunk ? "true" : "false";
    if (chunk.metadata.has_value()) {
        put_metadata(fields, chunk.metadata.value());
    }
    if (chunk.encrypted_aes_key.has_value()) {
        fields["encrypted_aes_key"] = chunk.encrypted_aes_key.value();
    }
    if (chunk.iv.has_value()) {
        fields["iv"] = chunk.iv.value();
    }
}

bool get_chunk(const Fields& fields, FileChunkFields& chunk, std::string& error) {
    chunk.transfer_id = get(fields, "transfer_id");
    if (has(fields, "chunk_index")) {
        uint64_t index = 0;
        if (!parse_u64(get(fields, "chunk_index"), index)) {
            error = "malformed chunk_index";
            return false;
        }
        chunk.chunk_index = index;
    }
    chunk.chunk_data = get(fields, "chunk_data");
    chunk.is_last_chunk = parse_bool(get(fields, "is_last_chunk"));
    if (!get_metadata(fields, chunk.metadata, error)) {
        return false;
    }
    chunk.encrypted_aes_key = get_optional(fields, "encrypted_aes_key");
    chunk.iv = get_optional(fields, "iv");
    return true;
}

bool get_count(const Fields& fields, const std::string& key, uint64_t& count, std::string& error) {
    count = 0;
    if (!has(fields, key)) {
        return true;
    }
    // Every listed element needs its own field, so a count beyond the field total is a lie.
    if (!parse_u64(get(fields, key), count) || count > fields.size()) {
        error = "malformed " + key;
        return false;
    }
    return true;
}

void put_public_message(Fields& fields, const std::string& prefix, const PublicMessage& msg) {
    fields[prefix + "username"] = msg.username;
    fields[prefix + "message"] = msg.message;
    put_timestamp(fields, prefix + "timestamp", msg.timestamp);
    put_file(fields, prefix + "file.", msg.file);
}

PublicMessage get_public_message(const Fields& fields, const std::string& prefix) {
    PublicMessage msg;
    msg.username = get(fields, prefix + "username");
    msg.message = get(fields, prefix + "message");
    msg.timestamp = get_timestamp(fields, prefix + "timestamp");
    msg.file = get_file(fields, prefix + "file.");
    return msg;
}

void put_notice(Fields& fields, const PrivateMessageNotice& notice) {
    fields["sender"] = notice.sender;
    fields["recipient"] = notice.recipient;
    fields["message"] = notice.message;
    fields["message_id"] = std::to_string(notice.message_id);
    fields["status"] = notice.status;
    put_timestamp(fields, "timestamp", notice.timestamp);
    put_file(fields, "file.", notice.file);
}

bool get_notice(const Fields& fields, PrivateMessageNotice& notice, std::string& error) {
    notice.sender = get(fields, "sender");
    notice.recipient = get(fields, "recipient");
    notice.message = get(fields, "message");
    if (!parse_u64(get(fields, "message_id"), notice.message_id)) {
        error = "malformed message_id";
        return false;
    }
    notice.status = get(fields, "status");
    notice.timestamp = get_timestamp(fields, "timestamp");
    notice.file = get_file(fields, "file.");
    return true;
}

std::optional<Event> decode_to_server(const std::string& type, const Fields& fields, std::string& error) {
    if (type == "register") {
        return Event{RegisterRequest{get(fields, "username")}};
    }
    if (type == "message") {
        PublicMessageRequest req;
        req.message = get(fields, "message");
        req.file = get_file(fields, "file.");
        req.timestamp = get_timestamp(fields, "timestamp");
        return Event{req};
    }
    if (type == "private_message") {
        PrivateMessageRequest req;
        req.recipient = get(fields, "recipient");
        req.message = get(fields, "message");
        req.file = get_file(fields, "file.");
        req.timestamp = get_timestamp(fields, "timestamp");
        return Event{req};
    }
    if (type == "private_message_read") {
        ReadAckRequest req;
        uint64_t count = 0;
        if (!get_count(fields, "message_ids.count", count, error)) {
            return std::nullopt;
        }
        for (uint64_t i = 0; i < count; ++i) {
            uint64_t id = 0;
            // Ids that do not parse are skipped rather than failing the batch.
            if (parse_u64(get(fields, "message_ids." + std::to_string(i)), id)) {
                req.message_ids.push_back(id);
            }
        }
        return Event{req};
    }
    if (type == "typing") {
        TypingRequest req;
        req.context = get(fields, "context");
        req.is_typing = parse_bool(get(fields, "is_typing"));
        req.recipient = get_optional(fields, "recipient");
        return Event{req};
    }
    if (type == "request_history") {
        return Event{HistoryRequest{}};
    }
    if (type == "public_key_exchange") {
        return Event{KeyExchangeRequest{get(fields, "target_username"), get(fields, "public_key")}};
    }
    if (type == "public_file_chunk" || type == "private_file_chunk") {
        FileChunkUpload upload;
        upload.is_private = type == "private_file_chunk";
        if (upload.is_private) {
            upload.recipient = get_optional(fields, "recipient");
        }
        if (!get_chunk(fields, upload.chunk, error)) {
            return std::nullopt;
        }
        return Event{upload};
    }
    if (type == "file_transfer_ack") {
        return Event{FileTransferAck{get(fields, "transfer_id"),
                                     parse_bool(get(fields, "success")),
                                     get(fields, "error")}};
    }
    error = "unknown event '" + type + "'";
    return std::nullopt;
}

std::optional<Event> decode_to_client(const std::string& type, const Fields& fields, std::string& error) {
    if (type == "update_user_list") {
        UserListUpdate update;
        uint64_t count = 0;
        if (!get_count(fields, "users.count", count, error)) {
            return std::nullopt;
        }
        for (uint64_t i = 0; i < count; ++i) {
            update.users.push_back(get(fields, "users." + std::to_string(i)));
        }
        return Event{update};
    }
    if (type == "message") {
        return Event{get_public_message(fields, "")};
    }
    if (type == "private_message_received") {
        PrivateMessageReceived notice;
        if (!get_notice(fields, notice, error)) {
            return std::nullopt;
        }
        return Event{notice};
    }
    if (type == "private_message_sent") {
        PrivateMessageSent notice;
        if (!get_notice(fields, notice, error)) {
            return std::nullopt;
        }
        return Event{notice};
    }
    if (type == "private_message_read") {
        ReadReceipt receipt;
        if (!parse_u64(get(fields, "message_id"), receipt.message_id)) {
            error = "malformed message_id";
            return std::nullopt;
        }
        return Event{receipt};
    }
    if (type == "public_typing") {
        return Event{PublicTyping{get(fields, "username"), parse_bool(get(fields, "is_typing"))}};
    }
    if (type == "private_typing") {
        return Event{PrivateTyping{get(fields, "username"), parse_bool(get(fields, "is_typing"))}};
    }
    if (type == "chat_history") {
        ChatHistory history;
        uint64_t count = 0;
        if (!get_count(fields, "messages.count", count, error)) {
            return std::nullopt;
        }
        for (uint64_t i = 0; i < count; ++i) {
            history.messages.push_back(get_public_message(fields, "messages." + std::to_string(i) + "."));
        }
        return Event{history};
    }
    if (type == "public_key_exchange") {
        return Event{PeerPublicKey{get(fields, "username"), get(fields, "public_key")}};
    }
    if (type == "file_chunk") {
        FileChunkRelay relay;
        if (!get_chunk(fields, relay.chunk, error)) {
            return std::nullopt;
        }
        return Event{relay};
    }
    if (type == "file_transfer_ack") {
        return Event{FileTransferAck{get(fields, "transfer_id"),
                                     parse_bool(get(fields, "success")),
                                     get(fields, "error")}};
    }
    if (type == "error") {
        return Event{ErrorNotice{get(fields, "message")}};
    }
    error = "unknown event '" + type + "'";
    return std::nullopt;
}
} // namespace

std::string encode_event(const Event& event) {
    Fields fields;
    fields["type"] = event_name(event);
    std::visit([&fields](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, RegisterRequest>) {
            fields["username"] = payload.username;
        } else if constexpr (std::is_same_v<T, UserListUpdate>) {
            fields["users.count"] = std::to_string(payload.users.size());
            for (std::size_t i = 0; i < payload.users.size(); ++i) {
                fields["users." + std::to_string(i)] = payload.users[i];
            }
        } else if constexpr (std::is_same_v<T, PublicMessageRequest>) {
            fields["message"] = payload.message;
            put_timestamp(fields, "timestamp", payload.timestamp);
            put_file(fields, "file.", payload.file);
        } else if constexpr (std::is_same_v<T, PublicMessage>) {
            put_public_message(fields, "", payload);
        } else if constexpr (std::is_same_v<T, PrivateMessageRequest>) {
            fields["recipient"] = payload.recipient;
            fields["message"] = payload.message;
            put_timestamp(fields, "timestamp", payload.timestamp);
            put_file(fields, "file.", payload.file);
        } else if constexpr (std::is_same_v<T, PrivateMessageReceived> ||
                             std::is_same_v<T, PrivateMessageSent>) {
            put_notice(fields, payload);
        } else if constexpr (std::is_same_v<T, ReadAckRequest>) {
            fields["message_ids.count"] = std::to_string(payload.message_ids.size());
            for (std::size_t i = 0; i < payload.message_ids.size(); ++i) {
                fields["message_ids." + std::to_string(i)] = std::to_string(payload.message_ids[i]);
            }
        } else if constexpr (std::is_same_v<T, ReadReceipt>) {
            fields["message_id"] = std::to_string(payload.message_id);
        } else if constexpr (std::is_same_v<T, TypingRequest>) {
            fields["context"] = payload.context;
            fields["is_typing"] = payload.is_typing ? "true" : "false";
            if (payload.recipient.has_value()) {
                fields["recipient"] = payload.recipient.value();
            }
        } else if constexpr (std::is_same_v<T, PublicTyping> || std::is_same_v<T, PrivateTyping>) {
            fields["username"] = payload.username;
            fields["is_typing"] = payload.is_typing ? "true" : "false";
        } else if constexpr (std::is_same_v<T, HistoryRequest>) {
            // no fields
        } else if constexpr (std::is_same_v<T, ChatHistory>) {
            fields["messages.count"] = std::to_string(payload.messages.size());
            for (std::size_t i = 0; i < payload.messages.size(); ++i) {
                put_public_message(fields, "messages." + std::to_string(i) + ".", payload.messages[i]);
            }
        } else if constexpr (std::is_same_v<T, KeyExchangeRequest>) {
            fields["target_username"] = payload.target_username;
            fields["public_key"] = payload.public_key;
        } else if constexpr (std::is_same_v<T, PeerPublicKey>) {
            fields["username"] = payload.username;
            fields["public_key"] = payload.public_key;
        } else if constexpr (std::is_same_v<T, FileChunkUpload>) {
            put_chunk(fields, payload.chunk);
            if (payload.recipient.has_value()) {
                fields["recipient"] = payload.recipient.value();
            }
        } else if constexpr (std::is_same_v<T, FileChunkRelay>) {
            put_chunk(fields, payload.chunk);
        } else if constexpr (std::is_same_v<T, FileTransferAck>) {
            fields["transfer_id"] = payload.transfer_id;
            fields["success"] = payload.success ? "true" : "false";
            fields["error"] = payload.error;
        } else if constexpr (std::is_same_v<T, ErrorNotice>) {
            fields["message"] = payload.message;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled event type");
        }
    }, event);
    return kv_string(fields);
}

std::optional<Event> decode_event(const std::string& text,
                                  EventDirection direction,
                                  std::string& error) {
    Fields fields = parse_kv_string(text);
    auto type_it = fields.find("type");
    if (type_it == fields.end() || type_it->second.empty()) {
        error = "event without type";
        return std::nullopt;
    }
    const std::string type = type_it->second;
    std::optional<Event> event = direction == EventDirection::ToServer
                                     ? decode_to_server(type, fields, error)
                                     : decode_to_client(type, fields, error);
    if (!event.has_value() && error.find(type) == std::string::npos) {
        error = "'" + type + "': " + error;
    }
    return event;
}

} // namespace chatrelay
