/*
 * ChatRelay - chunked file transfer tests
 */

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "file_transfer.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;

namespace {
std::map<uint64_t, std::string> as_map(const PreparedTransfer& transfer) {
    std::map<uint64_t, std::string> chunks;
    for (std::size_t i = 0; i < transfer.chunks.size(); ++i) {
        chunks[i] = transfer.chunks[i];
    }
    return chunks;
}

// Returns the error code raised by reassembly, or None when it succeeded.
ErrorCode reassemble_code(const std::map<uint64_t, std::string>& chunks,
                          const PreparedTransfer& transfer,
                          const TransferMetadata& metadata,
                          const PkeyHandle& key) {
    try {
        reassemble_transfer(chunks, metadata, transfer.encrypted_aes_key, transfer.iv, key);
    } catch (const TransferError& ex) {
        return ex.code();
    }
    return ErrorCode::None;
}
} // namespace

int main() {
    PkeyHandle recipient = generate_rsa_keypair();
    PkeyHandle recipient_public = load_public_key_pem(public_key_to_pem(recipient));
    auto plaintext = random_bytes(1000);

    struct Case {
        std::size_t length;
        std::size_t chunk_size;
    };
    // Lengths on and off the cipher block boundary, up to the attachment limit.
    // The largest file is paired with wide chunks to keep the chunk list small.
    const std::size_t max_length = static_cast<std::size_t>(kMaxFileBytes);
    const Case cases[] = {
        {1, 1},         {1, 65536},         {16, 1},           {16, 65536},    {1000, 1},
        {1000, 7},      {1000, 16},         {1000, 333},       {1000, 1008},   {1000, 65536},
        {1008, 1},      {1008, 65536},      {max_length, 4093}, {max_length, 65536},
    };
    for (const Case& c : cases) {
        const auto data = c.length == plaintext.size() ? plaintext : random_bytes(c.length);
        PreparedTransfer transfer = prepare_transfer("report.bin", data, recipient_public, c.chunk_size);
        // PKCS#7 always adds padding, a whole block when the length is already aligned.
        const std::size_t ciphertext_size = (c.length / 16 + 1) * 16;
        if (transfer.chunks.size() != (ciphertext_size + c.chunk_size - 1) / c.chunk_size) {
            FAIL();
        }
        if (transfer.metadata.total_chunks != transfer.chunks.size() || transfer.metadata.total_size != c.length ||
            transfer.metadata.chunk_size != c.chunk_size || transfer.metadata.file_hash != sha256_hex(data)) {
            FAIL();
        }
        if (transfer.transfer_id.size() != 32) {
            FAIL();
        }
        auto recovered = reassemble_transfer(as_map(transfer), transfer.metadata, transfer.encrypted_aes_key,
                                             transfer.iv, recipient);
        if (recovered != data) {
            FAIL();
        }
    }

    PreparedTransfer transfer = prepare_transfer("report.bin", plaintext, recipient_public, 100);

    // Key material rides on chunk 0 only.
    auto uploads = private_chunk_uploads(transfer, "bob");
    if (uploads.size() != transfer.chunks.size() || !uploads[0].chunk.metadata.has_value() ||
        !uploads[0].chunk.encrypted_aes_key.has_value() || !uploads[0].chunk.iv.has_value()) {
        FAIL();
    }
    if (uploads[1].chunk.metadata.has_value() || uploads[1].chunk.iv.has_value() ||
        uploads[1].chunk.is_last_chunk || !uploads.back().chunk.is_last_chunk) {
        FAIL();
    }
    if (!uploads[0].is_private || uploads[0].recipient.value_or("") != "bob") {
        FAIL();
    }

    // A flipped ciphertext byte never yields plaintext.
    auto tampered = as_map(transfer);
    auto bytes = base64_decode(tampered[3]).value();
    bytes[5] ^= 0x40;
    tampered[3] = base64_encode(bytes);
    if (reassemble_code(tampered, transfer, transfer.metadata, recipient) != ErrorCode::IntegrityFailure) {
        FAIL();
    }

    // The last chunk holds the padding.
    auto bad_padding = as_map(transfer);
    auto tail = base64_decode(bad_padding.rbegin()->second).value();
    tail.back() ^= 0xFF;
    bad_padding.rbegin()->second = base64_encode(tail);
    if (reassemble_code(bad_padding, transfer, transfer.metadata, recipient) != ErrorCode::IntegrityFailure) {
        FAIL();
    }

    TransferMetadata wrong_hash = transfer.metadata;
    wrong_hash.file_hash = sha256_hex(random_bytes(8));
    if (reassemble_code(as_map(transfer), transfer, wrong_hash, recipient) != ErrorCode::IntegrityFailure) {
        FAIL();
    }

    auto missing = as_map(transfer);
    missing.erase(2);
    if (reassemble_code(missing, transfer, transfer.metadata, recipient) != ErrorCode::IntegrityFailure) {
        FAIL();
    }

    PkeyHandle stranger = generate_rsa_keypair();
    if (reassemble_code(as_map(transfer), transfer, transfer.metadata, stranger) != ErrorCode::KeyUnwrapFailure) {
        FAIL();
    }
    if (error_category(ErrorCode::KeyUnwrapFailure) != ErrorCategory::IntegrityFailure) {
        FAIL();
    }

    bool rejected = false;
    try {
        prepare_transfer("x", plaintext, recipient_public, 0);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    if (!rejected) {
        FAIL();
    }

    // Two transfers of the same file use fresh keys.
    PreparedTransfer again = prepare_transfer("report.bin", plaintext, recipient_public, 100);
    if (again.transfer_id == transfer.transfer_id || again.iv == transfer.iv || again.chunks[0] == transfer.chunks[0]) {
        FAIL();
    }
    return 0;
}
