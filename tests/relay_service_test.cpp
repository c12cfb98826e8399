/*
 * ChatRelay - relay service tests
 */

#include <string>

#include "relay_service.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;
using chatrelay::testing::RecordingSink;
using chatrelay::testing::targets_one;

namespace {
bool has_error_for(const RecordingSink& sink, ConnectionHandle handle, const std::string& message) {
    for (const auto& [notice, target] : sink.of<ErrorNotice>()) {
        if (targets_one(target, handle) && notice.message == message) {
            return true;
        }
    }
    return false;
}
} // namespace

int main() {
    set_log_level(LogLevel::Error);

    RecordingSink sink;
    RelayService service(sink);

    service.on_connect(1);
    service.on_connect(2);
    if (!sink.of<ChatHistory>().empty()) {
        FAIL();
    }
    service.handle_event(1, RegisterRequest{"alice"});
    service.handle_event(2, RegisterRequest{"alice"});
    if (!has_error_for(sink, 2, "Username 'alice' is already taken.")) {
        FAIL();
    }
    service.handle_event(2, RegisterRequest{"carol"});

    // alice says hi: everyone, the sender included, gets it.
    sink.clear();
    service.handle_event(1, PublicMessageRequest{" hi ", std::nullopt, 42.0});
    auto messages = sink.of<PublicMessage>();
    if (messages.size() != 1 || messages[0].second.kind != EmitTarget::Kind::All ||
        messages[0].first.username != "alice" || messages[0].first.message != "hi" ||
        messages[0].first.timestamp.value_or(0) != 42.0) {
        FAIL();
    }
    if (service.registry().history_snapshot().size() != 1) {
        FAIL();
    }

    // Empty public messages are ignored; bad attachments are rejected.
    sink.clear();
    service.handle_event(1, PublicMessageRequest{"   ", std::nullopt, std::nullopt});
    if (!sink.all().empty()) {
        FAIL();
    }
    service.handle_event(1, PublicMessageRequest{"", FilePayload{"x.bin", "", 1, ""}, std::nullopt});
    if (!has_error_for(sink, 1, "Invalid file attachment")) {
        FAIL();
    }

    // bob is offline.
    sink.clear();
    service.handle_event(1, PrivateMessageRequest{"bob", "psst", std::nullopt, std::nullopt});
    if (!has_error_for(sink, 1, "User 'bob' not found or offline.") || !sink.of<PrivateMessageReceived>().empty()) {
        FAIL();
    }
    service.handle_event(1, PrivateMessageRequest{"alice", "me", std::nullopt, std::nullopt});
    if (!has_error_for(sink, 1, "You cannot send a private message to yourself.")) {
        FAIL();
    }

    // Private message and read receipt through the dispatcher.
    sink.clear();
    service.handle_event(1, PrivateMessageRequest{"carol", "hey", std::nullopt, std::nullopt});
    auto received = sink.of<PrivateMessageReceived>();
    if (received.size() != 1 || !targets_one(received[0].second, 2)) {
        FAIL();
    }
    service.handle_event(2, ReadAckRequest{{received[0].first.message_id}});
    auto receipts = sink.of<ReadReceipt>();
    if (receipts.size() != 1 || !targets_one(receipts[0].second, 1)) {
        FAIL();
    }

    // History on demand and on connect.
    sink.clear();
    service.handle_event(2, HistoryRequest{});
    auto history = sink.of<ChatHistory>();
    if (history.size() != 1 || !targets_one(history[0].second, 2) || history[0].first.messages.size() != 1) {
        FAIL();
    }
    service.on_connect(3);
    history = sink.of<ChatHistory>();
    if (history.size() != 2 || !targets_one(history[1].second, 3)) {
        FAIL();
    }

    // Key exchange routing.
    sink.clear();
    service.handle_event(1, KeyExchangeRequest{"carol", "PEM"});
    auto keys = sink.of<PeerPublicKey>();
    if (keys.size() != 1 || keys[0].first.username != "alice" || keys[0].first.public_key != "PEM" ||
        !targets_one(keys[0].second, 2)) {
        FAIL();
    }
    service.handle_event(1, KeyExchangeRequest{"", "PEM"});
    if (!has_error_for(sink, 1, "Invalid key exchange data")) {
        FAIL();
    }
    service.handle_event(1, KeyExchangeRequest{"bob", "PEM"});
    if (!has_error_for(sink, 1, "User 'bob' not found for key exchange")) {
        FAIL();
    }

    // Typing and file chunks are delegated.
    sink.clear();
    service.handle_event(1, TypingRequest{"public", true, std::nullopt});
    if (sink.of<PublicTyping>().size() != 1) {
        FAIL();
    }
    FileChunkUpload upload;
    upload.is_private = true;
    upload.recipient = "carol";
    upload.chunk.transfer_id = "t";
    upload.chunk.chunk_index = 0;
    upload.chunk.chunk_data = "QUJD";
    upload.chunk.metadata = TransferMetadata{"f", 3, 1, "ab", 16};
    service.handle_event(1, upload);
    if (sink.of<FileChunkRelay>().size() != 1 || service.transfers().active_count() != 1) {
        FAIL();
    }
    upload.chunk.chunk_data.clear();
    service.handle_event(1, upload);
    if (!has_error_for(sink, 1, "Invalid file chunk")) {
        FAIL();
    }
    service.handle_event(2, FileTransferAck{"t", true, ""});
    if (sink.of<FileTransferAck>().size() != 1 || service.transfers().active_count() != 0) {
        FAIL();
    }

    // Malformed input turns into an error event for the sender.
    sink.clear();
    service.reject_malformed(2, "unknown event 'bogus'");
    if (sink.of<ErrorNotice>().size() != 1) {
        FAIL();
    }

    // Disconnect frees the name and tells the others.
    sink.clear();
    service.on_disconnect(1);
    auto lists = sink.of<UserListUpdate>();
    if (lists.empty() || lists.back().first.users != std::vector<std::string>{"carol"}) {
        FAIL();
    }
    if (service.registry().lookup("alice").has_value()) {
        FAIL();
    }
    return 0;
}
