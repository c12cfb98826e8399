/*
 * ChatRelay - framing helpers implementation
 */

#include "protocol.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace chatrelay {

namespace {
constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kHeaderSize = 5;

bool send_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t written = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    return true;
}

bool recv_all(int fd, uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        ssize_t read_bytes = ::recv(fd, data + total, len - total, MSG_WAITALL);
        if (read_bytes < 0 && errno == EINTR) {
            continue;
        }
        if (read_bytes <= 0) {
            return false;
        }
        total += static_cast<std::size_t>(read_bytes);
    }
    return true;
}

bool known_kind(uint8_t raw) {
    return raw == static_cast<uint8_t>(MessageKind::Handshake) ||
           raw == static_cast<uint8_t>(MessageKind::Event);
}
} // namespace

bool send_frame(int socket_fd, const Frame& frame) {
    if (socket_fd < 0 || frame.payload.size() > kMaxFramePayload) {
        return false;
    }
    uint8_t header[kHeaderSize];
    header[0] = static_cast<uint8_t>(frame.kind);
    uint32_t len = htonl(static_cast<uint32_t>(frame.payload.size()));
    std::memcpy(header + 1, &len, sizeof(uint32_t));

    if (!send_all(socket_fd, header, sizeof(header))) {
        return false;
    }
    if (!frame.payload.empty()) {
        return send_all(socket_fd, frame.payload.data(), frame.payload.size());
    }
    return true;
}

std::optional<Frame> receive_frame(int socket_fd) {
    uint8_t header[kHeaderSize];
    if (!recv_all(socket_fd, header, sizeof(header))) {
        return std::nullopt;
    }
    if (!known_kind(header[0])) {
        return std::nullopt;
    }
    uint32_t len = 0;
    std::memcpy(&len, header + 1, sizeof(uint32_t));
    len = ntohl(len);
    if (len > kMaxFramePayload) {
        return std::nullopt;
    }

    Frame frame;
    frame.kind = static_cast<MessageKind>(header[0]);
    frame.payload.resize(len);
    if (len > 0 && !recv_all(socket_fd, frame.payload.data(), len)) {
        return std::nullopt;
    }
    return frame;
}

std::vector<uint8_t> pack_sealed_payload(const std::vector<uint8_t>& nonce,
                                         const std::vector<uint8_t>& ciphertext,
                                         const std::vector<uint8_t>& tag) {
    if (nonce.size() != kNonceSize || tag.size() != kTagSize) {
        throw std::invalid_argument("pack_sealed_payload: invalid nonce/tag size");
    }
    std::vector<uint8_t> payload;
    payload.reserve(nonce.size() + ciphertext.size() + tag.size());
    payload.insert(payload.end(), nonce.begin(), nonce.end());
    payload.insert(payload.end(), ciphertext.begin(), ciphertext.end());
    payload.insert(payload.end(), tag.begin(), tag.end());
    return payload;
}

bool unpack_sealed_payload(const std::vector<uint8_t>& payload,
                           std::vector<uint8_t>& nonce,
                           std::vector<uint8_t>& ciphertext,
                           std::vector<uint8_t>& tag) {
    if (payload.size() < kNonceSize + kTagSize) {
        return false;
    }
    nonce.assign(payload.begin(), payload.begin() + kNonceSize);
    tag.assign(payload.end() - kTagSize, payload.end());
    ciphertext.assign(payload.begin() + kNonceSize, payload.end() - kTagSize);
    return true;
}

std::vector<uint8_t> channel_aad(bool to_server, uint64_t connection_id) {
    std::vector<uint8_t> aad = {'E', 'V', 'N', 'T', static_cast<uint8_t>(to_server ? 'S' : 'C')};
    for (int shift = 56; shift >= 0; shift -= 8) {
        aad.push_back(static_cast<uint8_t>((connection_id >> shift) & 0xFF));
    }
    return aad;
}

} // namespace chatrelay
