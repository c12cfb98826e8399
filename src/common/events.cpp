/*
 * ChatRelay - event payload helpers
 */

#include "events.hpp"

#include <type_traits>

namespace chatrelay {

namespace {
template <class> inline constexpr bool kAlwaysFalse = false;
} // namespace

const char* event_name(const Event& event) {
    return std::visit([](const auto& payload) -> const char* {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, RegisterRequest>) {
            return "register";
        } else if constexpr (std::is_same_v<T, UserListUpdate>) {
            return "update_user_list";
        } else if constexpr (std::is_same_v<T, PublicMessageRequest> ||
                             std::is_same_v<T, PublicMessage>) {
            return "message";
        } else if constexpr (std::is_same_v<T, PrivateMessageRequest>) {
            return "private_message";
        } else if constexpr (std::is_same_v<T, PrivateMessageReceived>) {
            return "private_message_received";
        } else if constexpr (std::is_same_v<T, PrivateMessageSent>) {
            return "private_message_sent";
        } else if constexpr (std::is_same_v<T, ReadAckRequest> ||
                             std::is_same_v<T, ReadReceipt>) {
            return "private_message_read";
        } else if constexpr (std::is_same_v<T, TypingRequest>) {
            return "typing";
        } else if constexpr (std::is_same_v<T, PublicTyping>) {
            return "public_typing";
        } else if constexpr (std::is_same_v<T, PrivateTyping>) {
            return "private_typing";
        } else if constexpr (std::is_same_v<T, HistoryRequest>) {
            return "request_history";
        } else if constexpr (std::is_same_v<T, ChatHistory>) {
            return "chat_history";
        } else if constexpr (std::is_same_v<T, KeyExchangeRequest> ||
                             std::is_same_v<T, PeerPublicKey>) {
            return "public_key_exchange";
        } else if constexpr (std::is_same_v<T, FileChunkUpload>) {
            return payload.is_private ? "private_file_chunk" : "public_file_chunk";
        } else if constexpr (std::is_same_v<T, FileChunkRelay>) {
            return "file_chunk";
        } else if constexpr (std::is_same_v<T, FileTransferAck>) {
            return "file_transfer_ack";
        } else if constexpr (std::is_same_v<T, ErrorNotice>) {
            return "error";
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled event type");
        }
    }, event);
}

bool sanitize_file_payload(FilePayload& file) {
    if (file.name.size() > kMaxFileFieldLength) {
        file.name.resize(kMaxFileFieldLength);
    }
    if (file.mime.empty()) {
        file.mime = kDefaultMime;
    }
    if (file.mime.size() > kMaxFileFieldLength) {
        file.mime.resize(kMaxFileFieldLength);
    }
    if (file.data.empty()) {
        return false;
    }
    if (file.size > kMaxFileBytes) {
        return false;
    }
    if (file.data.size() > (kMaxFileBytes * 4) / 3 + 8) {
        return false;
    }
    // The encoded data must also fit the declared size.
    const uint64_t declared_bound = (file.size * 4 + 2) / 3 + 8;
    return file.data.size() <= declared_bound;
}

} // namespace chatrelay
