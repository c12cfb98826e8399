/*
 * ChatRelay - server event dispatch implementation
 */

#include "relay_service.hpp"

#include "server_log.hpp"
#include "utils.hpp"

#include <type_traits>

namespace chatrelay {

namespace {
template <class>
inline constexpr bool kAlwaysFalse = false;
} // namespace

RelayService::RelayService(EventSink& sink, RelayServiceOptions options)
    : sink_(sink),
      registry_(sink, options.history_capacity),
      tracker_(registry_, sink),
      typing_(registry_, sink),
      transfers_(registry_, sink, options.transfer_idle_timeout, std::move(options.clock)) {}

void RelayService::on_connect(ConnectionHandle handle) {
    server_log_info("Connection #" + std::to_string(handle) + " opened");
    registry_.mark_connected(handle);
    auto history = registry_.history_snapshot();
    if (!history.empty()) {
        sink_.emit(ChatHistory{std::move(history)}, EmitTarget::one(handle));
    }
}

void RelayService::on_disconnect(ConnectionHandle handle) {
    auto name = registry_.username_of(handle);
    registry_.unregister_session(handle);
    std::size_t dropped = transfers_.drop_connection(handle);
    if (dropped > 0) {
        server_log_info("Dropped " + std::to_string(dropped) + " unfinished transfer(s) of connection #" +
                        std::to_string(handle));
    }
    server_log_info("Connection #" + std::to_string(handle) + " closed" +
                    (name.has_value() ? " (" + name.value() + ")" : std::string()));
}

void RelayService::handle_event(ConnectionHandle origin, const Event& event) {
    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, RegisterRequest>) {
                on_register(origin, payload);
            } else if constexpr (std::is_same_v<T, PublicMessageRequest>) {
                on_public_message(origin, payload);
            } else if constexpr (std::is_same_v<T, PrivateMessageRequest>) {
                on_private_message(origin, payload);
            } else if constexpr (std::is_same_v<T, ReadAckRequest>) {
                on_read_ack(origin, payload);
            } else if constexpr (std::is_same_v<T, TypingRequest>) {
                typing_.relay(origin, payload);
            } else if constexpr (std::is_same_v<T, HistoryRequest>) {
                on_history(origin);
            } else if constexpr (std::is_same_v<T, KeyExchangeRequest>) {
                on_key_exchange(origin, payload);
            } else if constexpr (std::is_same_v<T, FileChunkUpload>) {
                on_file_chunk(origin, payload);
            } else if constexpr (std::is_same_v<T, FileTransferAck>) {
                on_transfer_ack(origin, payload);
            } else if constexpr (std::is_same_v<T, UserListUpdate> || std::is_same_v<T, PublicMessage> ||
                                 std::is_same_v<T, PrivateMessageReceived> ||
                                 std::is_same_v<T, PrivateMessageSent> || std::is_same_v<T, ReadReceipt> ||
                                 std::is_same_v<T, PublicTyping> || std::is_same_v<T, PrivateTyping> ||
                                 std::is_same_v<T, ChatHistory> || std::is_same_v<T, PeerPublicKey> ||
                                 std::is_same_v<T, FileChunkRelay> || std::is_same_v<T, ErrorNotice>) {
                server_log_warn(std::string("Ignoring server-bound copy of '") + event_name(event) +
                                "' from connection #" + std::to_string(origin));
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled event type");
            }
        },
        event);
}

void RelayService::reject_malformed(ConnectionHandle origin, const std::string& reason) {
    server_log_warn("Malformed event from connection #" + std::to_string(origin) + ": " + reason);
    sink_.emit(ErrorNotice{"Malformed event: " + reason}, EmitTarget::one(origin));
}

void RelayService::on_register(ConnectionHandle origin, const RegisterRequest& request) {
    RelayError error;
    if (!registry_.register_session(origin, request.username, error)) {
        server_log_warn("Registration rejected for connection #" + std::to_string(origin) + ": " +
                        error.message);
        send_error(origin, error);
        return;
    }
    server_log_info("Connection #" + std::to_string(origin) + " registered as " + trim(request.username));
}

void RelayService::on_public_message(ConnectionHandle origin, const PublicMessageRequest& request) {
    const std::string username = registry_.username_of(origin).value_or("Unknown");
    std::optional<FilePayload> file = request.file;
    if (file.has_value() && !sanitize_file_payload(file.value())) {
        RelayError error;
        error.set(ErrorCode::InvalidFile, "Invalid file attachment");
        send_error(origin, error);
        return;
    }
    const std::string text = trim(request.message);
    if (text.empty() && !file.has_value()) {
        server_log_debug("Ignoring empty public message from " + username);
        return;
    }

    PublicMessage message{username, text, std::move(file), request.timestamp};
    registry_.append_history(message);
    sink_.emit(message, EmitTarget::all());
    server_log_info("Public message from " + username +
                    (message.file.has_value() ? " with attachment " + message.file->name : std::string()));
}

void RelayService::on_private_message(ConnectionHandle origin, const PrivateMessageRequest& request) {
    RelayError error;
    auto id = tracker_.send_private(origin, request.recipient, request.message, request.file,
                                    request.timestamp, error);
    if (!id.has_value()) {
        send_error(origin, error);
    }
}

void RelayService::on_read_ack(ConnectionHandle origin, const ReadAckRequest& request) {
    std::size_t seen = tracker_.acknowledge_read(origin, request.message_ids);
    if (seen > 0) {
        server_log_debug(std::to_string(seen) + " message(s) marked seen by connection #" +
                         std::to_string(origin));
    }
}

void RelayService::on_history(ConnectionHandle origin) {
    sink_.emit(ChatHistory{registry_.history_snapshot()}, EmitTarget::one(origin));
}

void RelayService::on_key_exchange(ConnectionHandle origin, const KeyExchangeRequest& request) {
    RelayError error;
    const std::string target_name = trim(request.target_username);
    if (target_name.empty() || request.public_key.empty()) {
        error.set(ErrorCode::InvalidKeyExchange, "Invalid key exchange data");
        send_error(origin, error);
        return;
    }
    auto target = registry_.lookup(target_name);
    if (!target.has_value()) {
        error.set(ErrorCode::UnknownTarget, "User '" + target_name + "' not found for key exchange");
        send_error(origin, error);
        return;
    }
    const std::string sender = registry_.username_of(origin).value_or("Unknown");
    sink_.emit(PeerPublicKey{sender, request.public_key}, EmitTarget::one(target.value()));
    server_log_info("Public key forwarded from " + sender + " to " + target_name);
}

void RelayService::on_file_chunk(ConnectionHandle origin, const FileChunkUpload& upload) {
    RelayError error;
    if (!transfers_.handle_chunk(origin, upload, error)) {
        server_log_warn("File chunk rejected from connection #" + std::to_string(origin) + ": " +
                        error.message);
        send_error(origin, error);
    }
}

void RelayService::on_transfer_ack(ConnectionHandle origin, const FileTransferAck& ack) {
    if (!transfers_.handle_ack(origin, ack)) {
        server_log_debug("Ignoring ack for unknown transfer " + ack.transfer_id);
    }
}

void RelayService::send_error(ConnectionHandle origin, const RelayError& error) {
    sink_.emit(ErrorNotice{error.message}, EmitTarget::one(origin));
}

} // namespace chatrelay
