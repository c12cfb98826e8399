/*
 * ChatRelay - encrypted chunked file transfer codec implementation
 */

#include "file_transfer.hpp"

#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace chatrelay {

namespace {
constexpr std::size_t kTransferIdBytes = 16;

TransferError integrity_failure(const std::string& detail) {
    return TransferError(ErrorCode::IntegrityFailure, "File integrity check failed: " + detail);
}
} // namespace

std::string new_transfer_id() {
    return hex_encode(random_bytes(kTransferIdBytes));
}

PreparedTransfer prepare_transfer(const std::string& filename,
                                  const std::vector<uint8_t>& plaintext,
                                  const PkeyHandle& recipient_key,
                                  std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be at least 1");
    }

    auto aes_key = random_bytes(kAes256KeySize);
    auto iv = random_bytes(kAesBlockSize);
    auto ciphertext = aes256_cbc_encrypt(aes_key, iv, plaintext);
    auto wrapped_key = rsa_oaep_encrypt(recipient_key, aes_key);
    std::fill(aes_key.begin(), aes_key.end(), 0);

    PreparedTransfer transfer;
    transfer.transfer_id = new_transfer_id();
    transfer.encrypted_aes_key = base64_encode(wrapped_key);
    transfer.iv = base64_encode(iv);

    for (std::size_t offset = 0; offset < ciphertext.size(); offset += chunk_size) {
        std::size_t len = std::min(chunk_size, ciphertext.size() - offset);
        std::vector<uint8_t> slice(ciphertext.begin() + static_cast<std::ptrdiff_t>(offset),
                                   ciphertext.begin() + static_cast<std::ptrdiff_t>(offset + len));
        transfer.chunks.push_back(base64_encode(slice));
    }

    transfer.metadata.filename = filename;
    transfer.metadata.total_size = plaintext.size();
    transfer.metadata.total_chunks = transfer.chunks.size();
    transfer.metadata.file_hash = sha256_hex(plaintext);
    transfer.metadata.chunk_size = chunk_size;
    return transfer;
}

FileChunkFields chunk_fields(const PreparedTransfer& transfer, std::size_t index) {
    if (index >= transfer.chunks.size()) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " out of range");
    }
    FileChunkFields fields;
    fields.transfer_id = transfer.transfer_id;
    fields.chunk_index = index;
    fields.chunk_data = transfer.chunks[index];
    fields.is_last_chunk = index + 1 == transfer.chunks.size();
    if (index == 0) {
        fields.metadata = transfer.metadata;
        fields.encrypted_aes_key = transfer.encrypted_aes_key;
        fields.iv = transfer.iv;
    }
    return fields;
}

std::vector<FileChunkUpload> private_chunk_uploads(const PreparedTransfer& transfer,
                                                   const std::string& recipient) {
    std::vector<FileChunkUpload> uploads;
    uploads.reserve(transfer.chunks.size());
    for (std::size_t i = 0; i < transfer.chunks.size(); ++i) {
        FileChunkUpload upload;
        upload.is_private = true;
        upload.recipient = recipient;
        upload.chunk = chunk_fields(transfer, i);
        uploads.push_back(std::move(upload));
    }
    return uploads;
}

std::vector<uint8_t> reassemble_transfer(const std::map<uint64_t, std::string>& chunks,
                                         const TransferMetadata& metadata,
                                         const std::string& encrypted_aes_key,
                                         const std::string& iv,
                                         const PkeyHandle& private_key) {
    if (metadata.total_chunks == 0 || chunks.size() != metadata.total_chunks) {
        throw integrity_failure("expected " + std::to_string(metadata.total_chunks) + " chunks, have " +
                                std::to_string(chunks.size()));
    }

    std::vector<uint8_t> ciphertext;
    uint64_t expected_index = 0;
    for (const auto& [index, encoded] : chunks) {
        if (index != expected_index++) {
            throw integrity_failure("missing chunk " + std::to_string(expected_index - 1));
        }
        auto bytes = base64_decode(encoded);
        if (!bytes.has_value()) {
            throw integrity_failure("chunk " + std::to_string(index) + " is not valid base64");
        }
        ciphertext.insert(ciphertext.end(), bytes->begin(), bytes->end());
    }

    auto wrapped = base64_decode(encrypted_aes_key);
    if (!wrapped.has_value() || wrapped->empty()) {
        throw TransferError(ErrorCode::KeyUnwrapFailure, "Failed to unwrap file key: malformed key");
    }
    std::vector<uint8_t> aes_key;
    try {
        aes_key = rsa_oaep_decrypt(private_key, wrapped.value());
    } catch (const std::exception& ex) {
        throw TransferError(ErrorCode::KeyUnwrapFailure, std::string("Failed to unwrap file key: ") + ex.what());
    }
    if (aes_key.size() != kAes256KeySize) {
        throw TransferError(ErrorCode::KeyUnwrapFailure, "Failed to unwrap file key: unexpected key size");
    }

    auto iv_bytes = base64_decode(iv);
    if (!iv_bytes.has_value() || iv_bytes->size() != kAesBlockSize) {
        throw integrity_failure("malformed IV");
    }

    std::vector<uint8_t> plaintext;
    try {
        plaintext = aes256_cbc_decrypt(aes_key, iv_bytes.value(), ciphertext);
    } catch (const std::exception&) {
        std::fill(aes_key.begin(), aes_key.end(), 0);
        throw integrity_failure("decryption failed");
    }
    std::fill(aes_key.begin(), aes_key.end(), 0);

    if (sha256_hex(plaintext) != metadata.file_hash) {
        std::fill(plaintext.begin(), plaintext.end(), 0);
        throw integrity_failure("hash mismatch");
    }
    return plaintext;
}

} // namespace chatrelay
