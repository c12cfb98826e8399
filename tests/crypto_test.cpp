/*
 * ChatRelay - cryptographic primitive tests
 */

#include <stdexcept>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "test_support.hpp"
#include "utils.hpp"

using namespace chatrelay;

int main() {
    // SHA-256 of "abc".
    std::vector<uint8_t> abc{'a', 'b', 'c'};
    if (sha256_hex(abc) != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        FAIL();
    }
    if (sha256(abc).size() != kSha256Size) {
        FAIL();
    }

    // RSA-OAEP round trip through the PEM encoding.
    PkeyHandle keys = generate_rsa_keypair();
    std::string pem = public_key_to_pem(keys);
    if (pem.find("BEGIN PUBLIC KEY") == std::string::npos) {
        FAIL();
    }
    PkeyHandle peer = load_public_key_pem(pem);
    auto secret = random_bytes(kAes256KeySize);
    auto wrapped = rsa_oaep_encrypt(peer, secret);
    if (wrapped.size() != static_cast<std::size_t>(kRsaKeyBits / 8)) {
        FAIL();
    }
    if (rsa_oaep_decrypt(keys, wrapped) != secret) {
        FAIL();
    }

    // Unwrapping with another private key must fail.
    PkeyHandle other = generate_rsa_keypair();
    bool unwrap_failed = false;
    try {
        rsa_oaep_decrypt(other, wrapped);
    } catch (const std::runtime_error&) {
        unwrap_failed = true;
    }
    if (!unwrap_failed) {
        FAIL();
    }

    bool bad_pem = false;
    try {
        load_public_key_pem("not a key");
    } catch (const std::invalid_argument&) {
        bad_pem = true;
    }
    if (!bad_pem) {
        FAIL();
    }

    // CBC pads to the next block boundary, a full block for aligned input.
    auto key = random_bytes(kAes256KeySize);
    auto iv = random_bytes(kAesBlockSize);
    for (std::size_t len : {0u, 1u, 15u, 16u, 17u, 1000u}) {
        auto plaintext = random_bytes(len);
        auto ciphertext = aes256_cbc_encrypt(key, iv, plaintext);
        if (ciphertext.size() != (len / kAesBlockSize + 1) * kAesBlockSize) {
            FAIL();
        }
        if (aes256_cbc_decrypt(key, iv, ciphertext) != plaintext) {
            FAIL();
        }
    }

    bool truncated_failed = false;
    try {
        auto ciphertext = aes256_cbc_encrypt(key, iv, random_bytes(40));
        ciphertext.resize(ciphertext.size() - 3);
        aes256_cbc_decrypt(key, iv, ciphertext);
    } catch (const std::runtime_error&) {
        truncated_failed = true;
    }
    if (!truncated_failed) {
        FAIL();
    }

    // Channel key agreement as used by the transport handshake.
    KeyPair server = generate_x25519_keypair();
    KeyPair client = generate_x25519_keypair();
    auto server_key = hkdf_sha256(compute_x25519_shared(server.private_key, client.public_key),
                                  "chatrelay-channel", kAes256KeySize);
    auto client_key = hkdf_sha256(compute_x25519_shared(client.private_key, server.public_key),
                                  "chatrelay-channel", kAes256KeySize);
    if (server_key != client_key) {
        FAIL();
    }
    std::vector<uint8_t> aad{'E', 'V', 'N', 'T'};
    std::vector<uint8_t> message{'h', 'i'};
    Ciphertext sealed = aes256_gcm_encrypt(client_key, message, aad);
    if (aes256_gcm_decrypt(server_key, sealed, aad) != message) {
        FAIL();
    }
    sealed.data[0] ^= 0x01;
    bool tamper_detected = false;
    try {
        aes256_gcm_decrypt(server_key, sealed, aad);
    } catch (const std::runtime_error&) {
        tamper_detected = true;
    }
    if (!tamper_detected) {
        FAIL();
    }

    return 0;
}
