/*
 * ChatRelay - transfer assembler tests
 */

#include <string>
#include <utility>
#include <vector>

#include "crypto.hpp"
#include "file_transfer.hpp"
#include "peer_keys.hpp"
#include "test_support.hpp"
#include "transfer_assembler.hpp"
#include "utils.hpp"

using namespace chatrelay;

int main() {
    set_log_level(LogLevel::Error);

    PkeyHandle local = generate_rsa_keypair();

    // The sender finds our key in its directory by username.
    PeerKeyDirectory directory;
    std::string error;
    if (!directory.store("carol", public_key_to_pem(local), error) || !directory.contains("carol")) {
        FAIL();
    }
    if (directory.store("mallory", "garbage", error) || directory.contains("mallory")) {
        FAIL();
    }
    if (!directory.mark_offered("carol") || directory.mark_offered("carol")) {
        FAIL();
    }
    auto carol_key = directory.find("carol");
    if (!carol_key.has_value()) {
        FAIL();
    }

    auto plaintext = random_bytes(5000);
    PreparedTransfer transfer = prepare_transfer("photo.png", plaintext, carol_key.value(), 512);

    std::vector<Event> sent;
    std::vector<std::pair<uint64_t, uint64_t>> progress;
    std::vector<ReceivedFile> completed;
    std::vector<std::string> failures;

    TransferAssembler assembler(local, [&sent](const Event& event) { sent.push_back(event); });
    assembler.set_progress_callback([&progress](const std::string&, uint64_t received, uint64_t expected) {
        progress.emplace_back(received, expected);
    });
    assembler.set_complete_callback([&completed](const ReceivedFile& file) { completed.push_back(file); });
    assembler.set_error_callback([&failures](const std::string&, const std::string& message) {
        failures.push_back(message);
    });

    // Deliver in reverse: expected stays 0 until chunk 0 shows up last.
    const std::size_t total = transfer.chunks.size();
    for (std::size_t i = total; i-- > 0;) {
        assembler.on_chunk(chunk_fields(transfer, i));
    }
    if (progress.size() != total) {
        FAIL();
    }
    for (std::size_t i = 0; i + 1 < total; ++i) {
        if (progress[i].first != i + 1 || progress[i].second != 0) {
            FAIL();
        }
    }
    if (progress.back() != std::pair<uint64_t, uint64_t>(total, total)) {
        FAIL();
    }
    if (completed.size() != 1 || completed[0].data != plaintext || completed[0].filename != "photo.png" ||
        !failures.empty()) {
        FAIL();
    }
    if (sent.size() != 1) {
        FAIL();
    }
    const auto* ack = std::get_if<FileTransferAck>(&sent[0]);
    if (!ack || !ack->success || ack->transfer_id != transfer.transfer_id) {
        FAIL();
    }
    if (assembler.pending_count() != 0) {
        FAIL();
    }

    // A corrupted chunk fails the transfer, negatively acknowledged.
    PreparedTransfer second = prepare_transfer("photo.png", plaintext, carol_key.value(), 512);
    for (std::size_t i = 0; i < second.chunks.size(); ++i) {
        FileChunkFields fields = chunk_fields(second, i);
        if (i == 1) {
            auto bytes = base64_decode(fields.chunk_data).value();
            bytes[0] ^= 0x01;
            fields.chunk_data = base64_encode(bytes);
        }
        assembler.on_chunk(fields);
    }
    if (failures.size() != 1 || completed.size() != 1 || sent.size() != 2) {
        FAIL();
    }
    const auto* nack = std::get_if<FileTransferAck>(&sent[1]);
    if (!nack || nack->success || nack->error.empty()) {
        FAIL();
    }
    if (assembler.pending_count() != 0) {
        FAIL();
    }

    // Partial transfers stay pending until cleared.
    PreparedTransfer third = prepare_transfer("a.txt", plaintext, carol_key.value(), 1024);
    assembler.on_chunk(chunk_fields(third, 0));
    if (assembler.pending_count() != 1) {
        FAIL();
    }
    assembler.clear();
    if (assembler.pending_count() != 0) {
        FAIL();
    }
    return 0;
}
