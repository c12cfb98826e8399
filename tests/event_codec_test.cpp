/*
 * ChatRelay - event wire codec tests
 */

#include <string>
#include <vector>

#include "event_codec.hpp"
#include "events.hpp"
#include "protocol.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;

int main() {
    // Reserved characters survive the key/value encoding.
    const std::string awkward = "a;b=c%d e\nf\t\"quoted\"";
    if (kv_unescape(kv_escape(awkward)) != awkward) {
        FAIL();
    }
    auto parsed = parse_kv_string(kv_string({{"k;1", "v=1"}, {"x", awkward}}));
    if (parsed["k;1"] != "v=1" || parsed["x"] != awkward) {
        FAIL();
    }
    if (base64_decode("abc").has_value() || !base64_decode("YWJj").has_value()) {
        FAIL();
    }

    std::string error;

    PrivateMessageRequest request{"bob", awkward, FilePayload{"n;ame.txt", "text/plain", 3, "QUJD"}, 1.5};
    auto decoded = decode_event(encode_event(request), EventDirection::ToServer, error);
    if (!decoded.has_value()) {
        FAIL();
    }
    const auto* pm = std::get_if<PrivateMessageRequest>(&decoded.value());
    if (!pm || pm->recipient != "bob" || pm->message != awkward || !pm->file.has_value() ||
        pm->file->name != "n;ame.txt" || pm->file->size != 3 || pm->timestamp.value_or(0) != 1.5) {
        FAIL();
    }

    // Names shared by both directions decode to the direction's type.
    auto to_client = decode_event(encode_event(PublicMessage{"alice", "hi", std::nullopt, std::nullopt}),
                                  EventDirection::ToClient, error);
    if (!to_client.has_value() || !std::holds_alternative<PublicMessage>(to_client.value())) {
        FAIL();
    }
    auto to_server = decode_event(encode_event(PublicMessageRequest{"hi", std::nullopt, std::nullopt}),
                                  EventDirection::ToServer, error);
    if (!to_server.has_value() || !std::holds_alternative<PublicMessageRequest>(to_server.value())) {
        FAIL();
    }

    FileChunkUpload upload;
    upload.is_private = true;
    upload.recipient = "bob";
    upload.chunk.transfer_id = "abcd";
    upload.chunk.chunk_index = 0;
    upload.chunk.chunk_data = "QUJD";
    upload.chunk.metadata = TransferMetadata{"f.bin", 3, 1, "ff00", 65536};
    upload.chunk.encrypted_aes_key = "a2V5";
    upload.chunk.iv = "aXY=";
    if (std::string(event_name(upload)) != "private_file_chunk") {
        FAIL();
    }
    auto chunk_event = decode_event(encode_event(upload), EventDirection::ToServer, error);
    if (!chunk_event.has_value()) {
        FAIL();
    }
    const auto* chunk = std::get_if<FileChunkUpload>(&chunk_event.value());
    if (!chunk || !chunk->is_private || chunk->recipient.value_or("") != "bob" ||
        chunk->chunk.chunk_index.value_or(9) != 0 || !chunk->chunk.metadata.has_value() ||
        chunk->chunk.metadata->total_chunks != 1 || chunk->chunk.metadata->chunk_size != 65536 ||
        chunk->chunk.iv.value_or("") != "aXY=") {
        FAIL();
    }

    ChatHistory history;
    history.messages.push_back(PublicMessage{"alice", "one", std::nullopt, 1.0});
    history.messages.push_back(PublicMessage{"bob", "two", FilePayload{"x", "y", 1, "QQ=="}, std::nullopt});
    auto history_event = decode_event(encode_event(history), EventDirection::ToClient, error);
    const auto* decoded_history = history_event ? std::get_if<ChatHistory>(&history_event.value()) : nullptr;
    if (!decoded_history || decoded_history->messages.size() != 2 ||
        decoded_history->messages[1].username != "bob" || !decoded_history->messages[1].file.has_value() ||
        decoded_history->messages[0].file.has_value()) {
        FAIL();
    }

    // Rejections.
    if (decode_event("type=bogus", EventDirection::ToServer, error).has_value() || error.empty()) {
        FAIL();
    }
    if (decode_event("type=private_message_received;message_id=1", EventDirection::ToServer, error).has_value()) {
        FAIL();
    }
    if (decode_event("type=register;username=x", EventDirection::ToClient, error).has_value()) {
        FAIL();
    }
    if (decode_event("type=private_file_chunk;transfer_id=t;chunk_index=-1", EventDirection::ToServer, error)
            .has_value()) {
        FAIL();
    }
    if (decode_event("type=private_message_sent;message_id=abc", EventDirection::ToClient, error).has_value()) {
        FAIL();
    }

    // A missing chunk index is left for the relay to reject.
    auto no_index = decode_event("type=public_file_chunk;transfer_id=t;chunk_data=QQ%3D%3D",
                                 EventDirection::ToServer, error);
    if (!no_index.has_value() || std::get<FileChunkUpload>(no_index.value()).chunk.chunk_index.has_value()) {
        FAIL();
    }

    // Unparseable read-ack ids are skipped.
    auto acks = decode_event("type=private_message_read;message_ids.count=3;message_ids.0=4;message_ids.1=x;"
                             "message_ids.2=9",
                             EventDirection::ToServer, error);
    if (!acks.has_value() || std::get<ReadAckRequest>(acks.value()).message_ids != std::vector<uint64_t>{4, 9}) {
        FAIL();
    }

    // List counts larger than the fields actually sent are rejected before any element is read.
    error.clear();
    if (decode_event("type=private_message_read;message_ids.count=18446744073709551615;message_ids.0=4",
                     EventDirection::ToServer, error)
            .has_value() ||
        error != "malformed message_ids.count") {
        FAIL();
    }
    if (decode_event("type=update_user_list;users.count=4000000000;users.0=alice", EventDirection::ToClient, error)
            .has_value() ||
        error != "malformed users.count") {
        FAIL();
    }
    if (decode_event("type=chat_history;messages.count=99999", EventDirection::ToClient, error).has_value() ||
        error != "malformed messages.count") {
        FAIL();
    }
    auto listed = decode_event("type=update_user_list;users.count=2;users.0=alice;users.1=bob",
                               EventDirection::ToClient, error);
    if (!listed.has_value() || std::get<UserListUpdate>(listed.value()).users.size() != 2) {
        FAIL();
    }

    // Attachment limits.
    FilePayload named{std::string(300, 'n'), "", 3, "QUJD"};
    if (!sanitize_file_payload(named) || named.name.size() != kMaxFileFieldLength || named.mime != kDefaultMime) {
        FAIL();
    }
    FilePayload understated{"a", "text/plain", 0, "QUJDREVGR0g="};
    FilePayload no_data{"a", "text/plain", 3, ""};
    FilePayload too_big{"a", "text/plain", kMaxFileBytes + 1, "QUJD"};
    if (sanitize_file_payload(understated) || sanitize_file_payload(no_data) || sanitize_file_payload(too_big)) {
        FAIL();
    }

    // Channel associated data differs by direction and connection.
    if (channel_aad(true, 7) == channel_aad(false, 7) || channel_aad(true, 7) == channel_aad(true, 8)) {
        FAIL();
    }
    std::vector<uint8_t> nonce(12, 1), ciphertext{1, 2, 3}, tag(16, 2);
    std::vector<uint8_t> n2, c2, t2;
    if (!unpack_sealed_payload(pack_sealed_payload(nonce, ciphertext, tag), n2, c2, t2) || c2 != ciphertext ||
        n2 != nonce || t2 != tag) {
        FAIL();
    }
    if (unpack_sealed_payload(std::vector<uint8_t>(10, 0), n2, c2, t2)) {
        FAIL();
    }
    return 0;
}
