/*
 * ChatRelay - transfer relay tests
 */

#include <chrono>
#include <string>

#include "session_registry.hpp"
#include "test_support.hpp"
#include "transfer_relay.hpp"
#include "utils.hpp"

using namespace chatrelay;
using chatrelay::testing::RecordingSink;
using chatrelay::testing::targets_one;

namespace {
FileChunkUpload make_chunk(const std::string& id, uint64_t index, uint64_t total, const std::string& recipient) {
    FileChunkUpload upload;
    upload.is_private = !recipient.empty();
    if (upload.is_private) {
        upload.recipient = recipient;
    }
    upload.chunk.transfer_id = id;
    upload.chunk.chunk_index = index;
    upload.chunk.chunk_data = "QUJD";
    upload.chunk.is_last_chunk = index + 1 == total;
    if (index == 0) {
        upload.chunk.metadata = TransferMetadata{"doc.pdf", 10, total, "00ff", 4};
        upload.chunk.encrypted_aes_key = "a2V5";
        upload.chunk.iv = "aXY=";
    }
    return upload;
}
} // namespace

int main() {
    set_log_level(LogLevel::Error);

    RecordingSink sink;
    SessionRegistry registry(sink);
    uint64_t now = 1000;
    TransferRelay relay(registry, sink, std::chrono::milliseconds(5000), [&now] { return now; });
    RelayError err;
    if (!registry.register_session(1, "alice", err) || !registry.register_session(2, "bob", err)) {
        FAIL();
    }
    sink.clear();

    FileChunkUpload missing = make_chunk("t1", 0, 2, "bob");
    missing.chunk.chunk_data.clear();
    RelayError invalid;
    if (relay.handle_chunk(1, missing, invalid) || invalid.code != ErrorCode::InvalidChunk ||
        invalid.message != "Invalid file chunk") {
        FAIL();
    }
    FileChunkUpload no_index = make_chunk("t1", 0, 2, "bob");
    no_index.chunk.chunk_index.reset();
    if (relay.handle_chunk(1, no_index, invalid)) {
        FAIL();
    }

    RelayError unknown;
    if (relay.handle_chunk(1, make_chunk("t0", 0, 1, "zed"), unknown) ||
        unknown.message != "Recipient 'zed' not found" || error_category(unknown.code) != ErrorCategory::NotFound) {
        FAIL();
    }
    if (relay.active_count() != 0) {
        FAIL();
    }

    // Private transfer: forwarded to bob only, key material on chunk 0 only.
    if (!relay.handle_chunk(1, make_chunk("t1", 0, 2, "bob"), err)) {
        FAIL();
    }
    now += 100;
    if (!relay.handle_chunk(1, make_chunk("t1", 1, 2, "bob"), err)) {
        FAIL();
    }
    auto forwarded = sink.of<FileChunkRelay>();
    if (forwarded.size() != 2 || !targets_one(forwarded[0].second, 2) || !targets_one(forwarded[1].second, 2)) {
        FAIL();
    }
    const FileChunkFields& first = forwarded[0].first.chunk;
    const FileChunkFields& second = forwarded[1].first.chunk;
    if (!first.metadata.has_value() || first.metadata->total_chunks != 2 || first.encrypted_aes_key != "a2V5" ||
        first.iv != "aXY=") {
        FAIL();
    }
    if (second.metadata.has_value() || second.encrypted_aes_key.has_value() || second.iv.has_value() ||
        !second.is_last_chunk) {
        FAIL();
    }
    auto session = relay.find("t1");
    if (!session.has_value() || !session->complete() || session->sender_username != "alice" ||
        session->last_activity_ms != 1100) {
        FAIL();
    }

    // The downstream ack goes back to the sender and releases the record.
    sink.clear();
    if (!relay.handle_ack(2, FileTransferAck{"t1", true, ""})) {
        FAIL();
    }
    auto acks = sink.of<FileTransferAck>();
    if (acks.size() != 1 || !targets_one(acks[0].second, 1) || !acks[0].first.success) {
        FAIL();
    }
    if (relay.find("t1").has_value() || relay.handle_ack(2, FileTransferAck{"t1", true, ""})) {
        FAIL();
    }

    // Public chunks go to everyone.
    sink.clear();
    if (!relay.handle_chunk(2, make_chunk("p1", 0, 3, ""), err)) {
        FAIL();
    }
    auto broadcast = sink.of<FileChunkRelay>();
    if (broadcast.size() != 1 || broadcast[0].second.kind != EmitTarget::Kind::All) {
        FAIL();
    }

    // Idle transfers are reclaimed after the timeout.
    if (!relay.handle_chunk(1, make_chunk("t2", 0, 4, "bob"), err)) {
        FAIL();
    }
    now += 4000;
    if (!relay.handle_chunk(1, make_chunk("t2", 1, 4, "bob"), err)) {
        FAIL();
    }
    now += 2000; // p1 idle 6000 ms, t2 idle 2000 ms
    if (relay.reclaim_idle() != 1 || relay.find("p1").has_value() || !relay.find("t2").has_value()) {
        FAIL();
    }

    if (relay.drop_connection(1) != 1 || relay.active_count() != 0) {
        FAIL();
    }
    return 0;
}
