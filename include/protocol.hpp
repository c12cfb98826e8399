/*
 * ChatRelay - framing helpers header
 *
 * Wire framing for the TCP transport: a one byte frame kind followed by a
 * big-endian 32-bit payload length. Handshake frames carry plain key/value
 * text; event frames carry an AES-256-GCM sealed event (nonce | ciphertext |
 * tag).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace chatrelay {

constexpr uint32_t kMaxFramePayload = 16u * 1024u * 1024u;

enum class MessageKind : uint8_t {
    Handshake = 0x01,
    Event = 0x10
};

struct Frame {
    MessageKind kind;
    std::vector<uint8_t> payload;
};

bool send_frame(int socket_fd, const Frame& frame);

// Returns nullopt on EOF, socket error, unknown kind or an oversized frame.
std::optional<Frame> receive_frame(int socket_fd);

std::vector<uint8_t> pack_sealed_payload(const std::vector<uint8_t>& nonce,
                                         const std::vector<uint8_t>& ciphertext,
                                         const std::vector<uint8_t>& tag);

bool unpack_sealed_payload(const std::vector<uint8_t>& payload,
                           std::vector<uint8_t>& nonce,
                           std::vector<uint8_t>& ciphertext,
                           std::vector<uint8_t>& tag);

// Associated data binding a sealed event to its direction and connection.
std::vector<uint8_t> channel_aad(bool to_server, uint64_t connection_id);

} // namespace chatrelay
