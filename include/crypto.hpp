/*
 * ChatRelay - cryptographic helpers
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace chatrelay {

constexpr std::size_t kAes256KeySize = 32;
constexpr std::size_t kAesBlockSize = 16;
constexpr std::size_t kSha256Size = 32;
constexpr int kRsaKeyBits = 2048;

struct KeyPair {
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> private_key;
};

struct Ciphertext {
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> data;
    std::vector<uint8_t> tag;
};

// Shared so cached peer keys can be handed out without copying key material.
using PkeyHandle = std::shared_ptr<EVP_PKEY>;

// Channel protection used by the TCP transport.
KeyPair generate_x25519_keypair();

std::vector<uint8_t> compute_x25519_shared(const std::vector<uint8_t>& private_key,
                                           const std::vector<uint8_t>& peer_public_key);

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& shared_secret,
                                 const std::string& info,
                                 std::size_t length);

Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext,
                              const std::vector<uint8_t>& aad);

std::vector<uint8_t> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                        const Ciphertext& ciphertext,
                                        const std::vector<uint8_t>& aad);

// File transfer primitives.
PkeyHandle generate_rsa_keypair(int bits = kRsaKeyBits);

// SubjectPublicKeyInfo PEM.
std::string public_key_to_pem(const PkeyHandle& key);

// Throws std::invalid_argument when the text is not an RSA public key.
PkeyHandle load_public_key_pem(const std::string& pem);

// RSA-OAEP with SHA-256 for both the digest and MGF1.
std::vector<uint8_t> rsa_oaep_encrypt(const PkeyHandle& public_key,
                                      const std::vector<uint8_t>& plaintext);

std::vector<uint8_t> rsa_oaep_decrypt(const PkeyHandle& private_key,
                                      const std::vector<uint8_t>& ciphertext);

// AES-256-CBC, PKCS7 padded to the 16 byte block boundary.
std::vector<uint8_t> aes256_cbc_encrypt(const std::vector<uint8_t>& key,
                                        const std::vector<uint8_t>& iv,
                                        const std::vector<uint8_t>& plaintext);

// Throws std::runtime_error on a bad key size, bad padding or truncated input.
std::vector<uint8_t> aes256_cbc_decrypt(const std::vector<uint8_t>& key,
                                        const std::vector<uint8_t>& iv,
                                        const std::vector<uint8_t>& ciphertext);

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

std::string sha256_hex(const std::vector<uint8_t>& data);

} // namespace chatrelay
