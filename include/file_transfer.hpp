/*
 * ChatRelay - encrypted chunked file transfer codec
 *
 * A transfer is the AES-256-CBC ciphertext of one file, cut into chunks of
 * chunk_size bytes. Chunk 0 carries the metadata, the RSA-OAEP wrapped AES
 * key and the IV; the metadata holds the SHA-256 of the plaintext so the
 * receiver can verify the reassembled file.
 */

#pragma once

#include "crypto.hpp"
#include "errors.hpp"
#include "events.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chatrelay {

struct PreparedTransfer {
    std::string transfer_id;
    TransferMetadata metadata;
    std::string encrypted_aes_key; // base64
    std::string iv;                // base64
    std::vector<std::string> chunks; // base64 ciphertext slices in index order
};

// 16 random bytes, lowercase hex.
std::string new_transfer_id();

// Throws std::invalid_argument for a zero chunk size and
// std::runtime_error when a crypto primitive fails.
PreparedTransfer prepare_transfer(const std::string& filename,
                                  const std::vector<uint8_t>& plaintext,
                                  const PkeyHandle& recipient_key,
                                  std::size_t chunk_size);

FileChunkFields chunk_fields(const PreparedTransfer& transfer, std::size_t index);

std::vector<FileChunkUpload> private_chunk_uploads(const PreparedTransfer& transfer,
                                                   const std::string& recipient);

// Concatenates the chunks in index order and recovers the plaintext.
// Throws TransferError with KeyUnwrapFailure when the AES key cannot be
// recovered and IntegrityFailure for anything else that does not check out.
std::vector<uint8_t> reassemble_transfer(const std::map<uint64_t, std::string>& chunks,
                                         const TransferMetadata& metadata,
                                         const std::string& encrypted_aes_key,
                                         const std::string& iv,
                                         const PkeyHandle& private_key);

} // namespace chatrelay
