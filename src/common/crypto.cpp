/*
 * ChatRelay - cryptographic helpers implementation
 */

#include "crypto.hpp"

#include "utils.hpp"

#include <stdexcept>

#include <openssl/bio.h>
#include <openssl/kdf.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace chatrelay {

namespace {
constexpr std::size_t kX25519KeySize = 32;
constexpr std::size_t kGcmNonceSize = 12;
constexpr std::size_t kGcmTagSize = 16;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

PkeyHandle wrap_pkey(EVP_PKEY* key) {
    return PkeyHandle(key, [](EVP_PKEY* k) { EVP_PKEY_free(k); });
}

CipherCtxPtr new_cipher_ctx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

bool configure_oaep(EVP_PKEY_CTX* ctx) {
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
           EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
           EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}
} // namespace

KeyPair generate_x25519_keypair() {
    KeyPair kp;
    kp.public_key.resize(kX25519KeySize);
    kp.private_key.resize(kX25519KeySize);

    PkeyCtxPtr context(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!context) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen_init(context.get()) <= 0 ||
        EVP_PKEY_keygen(context.get(), &raw) <= 0) {
        throw std::runtime_error("EVP_PKEY_keygen failed");
    }
    PkeyHandle params = wrap_pkey(raw);

    std::size_t pub_len = kX25519KeySize;
    std::size_t priv_len = kX25519KeySize;
    if (EVP_PKEY_get_raw_public_key(params.get(), kp.public_key.data(), &pub_len) <= 0 ||
        EVP_PKEY_get_raw_private_key(params.get(), kp.private_key.data(), &priv_len) <= 0) {
        throw std::runtime_error("Failed to extract X25519 key material");
    }
    return kp;
}

std::vector<uint8_t> compute_x25519_shared(const std::vector<uint8_t>& private_key,
                                           const std::vector<uint8_t>& peer_public_key) {
    if (private_key.size() != kX25519KeySize || peer_public_key.size() != kX25519KeySize) {
        throw std::invalid_argument("X25519 keys must be 32 bytes");
    }

    PkeyHandle my_key = wrap_pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519,
                                                               nullptr,
                                                               private_key.data(),
                                                               private_key.size()));
    if (!my_key) {
        throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
    }
    PkeyHandle peer_key = wrap_pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519,
                                                                nullptr,
                                                                peer_public_key.data(),
                                                                peer_public_key.size()));
    if (!peer_key) {
        throw std::runtime_error("EVP_PKEY_new_raw_public_key failed");
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(my_key.get(), nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new failed");
    }
    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer_key.get()) <= 0) {
        throw std::runtime_error("EVP_PKEY_derive init failed");
    }

    std::size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) <= 0) {
        throw std::runtime_error("EVP_PKEY_derive length query failed");
    }
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
        throw std::runtime_error("EVP_PKEY_derive failed");
    }
    secret.resize(secret_len);
    return secret;
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& shared_secret,
                                 const std::string& info,
                                 std::size_t length) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id(HKDF) failed");
    }

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(""),
                                    0) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(),
                                   shared_secret.data(),
                                   static_cast<int>(shared_secret.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("HKDF setup failed");
    }

    std::vector<uint8_t> output(length);
    if (EVP_PKEY_derive(ctx.get(), output.data(), &length) <= 0) {
        throw std::runtime_error("HKDF derive failed");
    }
    output.resize(length);
    return output;
}

Ciphertext aes256_gcm_encrypt(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& plaintext,
                              const std::vector<uint8_t>& aad) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }

    Ciphertext result;
    result.nonce = random_bytes(kGcmNonceSize);
    result.data.resize(plaintext.size());
    result.tag.resize(kGcmTagSize);

    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), result.nonce.data()) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-GCM AAD update failed");
    }
    if (EVP_EncryptUpdate(ctx.get(),
                          result.data.data(),
                          &len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-GCM encrypt failed");
    }
    int ciphertext_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), result.data.data() + len, &len) != 1) {
        throw std::runtime_error("AES-GCM finalization failed");
    }
    ciphertext_len += len;
    result.data.resize(static_cast<std::size_t>(ciphertext_len));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kGcmTagSize, result.tag.data()) != 1) {
        throw std::runtime_error("AES-GCM get tag failed");
    }
    return result;
}

std::vector<uint8_t> aes256_gcm_decrypt(const std::vector<uint8_t>& key,
                                        const Ciphertext& ciphertext,
                                        const std::vector<uint8_t>& aad) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
    if (ciphertext.nonce.size() != kGcmNonceSize || ciphertext.tag.size() != kGcmTagSize) {
        throw std::invalid_argument("Invalid AES-GCM parameters");
    }

    std::vector<uint8_t> plaintext(ciphertext.data.size());
    auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kGcmNonceSize, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), ciphertext.nonce.data()) != 1) {
        throw std::runtime_error("AES-GCM decrypt init failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AES-GCM decrypt AAD update failed");
    }
    if (EVP_DecryptUpdate(ctx.get(),
                          plaintext.data(),
                          &len,
                          ciphertext.data.data(),
                          static_cast<int>(ciphertext.data.size())) != 1) {
        throw std::runtime_error("AES-GCM decrypt failed");
    }
    int plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(),
                            EVP_CTRL_GCM_SET_TAG,
                            kGcmTagSize,
                            const_cast<unsigned char*>(ciphertext.tag.data())) != 1) {
        throw std::runtime_error("AES-GCM set tag failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        throw std::runtime_error("AES-GCM authentication failed");
    }
    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));
    return plaintext;
}

PkeyHandle generate_rsa_keypair(int bits) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id(RSA) failed");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw std::runtime_error("RSA keygen setup failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw std::runtime_error("RSA keygen failed");
    }
    return wrap_pkey(raw);
}

std::string public_key_to_pem(const PkeyHandle& key) {
    if (!key) {
        throw std::invalid_argument("public_key_to_pem: null key");
    }
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw std::runtime_error("BIO_new failed");
    }
    if (PEM_write_bio_PUBKEY(bio.get(), key.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_PUBKEY failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) {
        throw std::runtime_error("Empty PEM output");
    }
    return std::string(data, static_cast<std::size_t>(len));
}

PkeyHandle load_public_key_pem(const std::string& pem) {
    if (pem.empty()) {
        throw std::invalid_argument("Invalid public key: empty PEM");
    }
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw std::runtime_error("BIO_new_mem_buf failed");
    }
    PkeyHandle key = wrap_pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw std::invalid_argument("Invalid public key: PEM parse failed");
    }
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        throw std::invalid_argument("Invalid public key: not an RSA key");
    }
    return key;
}

std::vector<uint8_t> rsa_oaep_encrypt(const PkeyHandle& public_key,
                                      const std::vector<uint8_t>& plaintext) {
    if (!public_key) {
        throw std::invalid_argument("Peer public key not set");
    }
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(public_key.get(), nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new failed");
    }
    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !configure_oaep(ctx.get())) {
        throw std::runtime_error("RSA-OAEP encrypt setup failed");
    }
    std::size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) <= 0) {
        throw std::runtime_error("RSA-OAEP length query failed");
    }
    std::vector<uint8_t> out(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, plaintext.data(), plaintext.size()) <= 0) {
        throw std::runtime_error("RSA-OAEP encrypt failed");
    }
    out.resize(out_len);
    return out;
}

std::vector<uint8_t> rsa_oaep_decrypt(const PkeyHandle& private_key,
                                      const std::vector<uint8_t>& ciphertext) {
    if (!private_key) {
        throw std::invalid_argument("Private key not set");
    }
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(private_key.get(), nullptr));
    if (!ctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new failed");
    }
    if (EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !configure_oaep(ctx.get())) {
        throw std::runtime_error("RSA-OAEP decrypt setup failed");
    }
    std::size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) <= 0) {
        throw std::runtime_error("RSA-OAEP length query failed");
    }
    std::vector<uint8_t> out(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), out.data(), &out_len, ciphertext.data(), ciphertext.size()) <= 0) {
        throw std::runtime_error("RSA-OAEP decrypt failed");
    }
    out.resize(out_len);
    return out;
}

std::vector<uint8_t> aes256_cbc_encrypt(const std::vector<uint8_t>& key,
                                        const std::vector<uint8_t>& iv,
                                        const std::vector<uint8_t>& plaintext) {
    if (key.size() != kAes256KeySize) {
        throw std::invalid_argument("AES-256 key must be 32 bytes");
    }
    if (iv.size() != kAesBlockSize) {
        throw std::invalid_argument("AES-CBC IV must be 16 bytes");
    }

    // EVP's default padding is PKCS7; a full block is added when aligned.
    std::vector<uint8_t> out(plaintext.size() + kAesBlockSize);
    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("AES-CBC init failed");
    }
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(),
                          out.data(),
                          &len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-CBC encrypt failed");
    }
    int total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw std::runtime_error("AES-CBC finalization failed");
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));
    return out;
}

std::vector<uint8_t> aes256_cbc_decrypt(const std::vector<uint8_t>& key,
                                        const std::vector<uint8_t>& iv,
                                        const std::vector<uint8_t>& ciphertext) {
    if (key.size() != kAes256KeySize) {
        throw std::runtime_error("AES-256 key must be 32 bytes");
    }
    if (iv.size() != kAesBlockSize) {
        throw std::runtime_error("AES-CBC IV must be 16 bytes");
    }
    if (ciphertext.empty() || ciphertext.size() % kAesBlockSize != 0) {
        throw std::runtime_error("AES-CBC ciphertext is not block aligned");
    }

    std::vector<uint8_t> out(ciphertext.size() + kAesBlockSize);
    auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("AES-CBC decrypt init failed");
    }
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(),
                          out.data(),
                          &len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
        throw std::runtime_error("AES-CBC decrypt failed");
    }
    int total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw std::runtime_error("AES-CBC padding check failed");
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));
    return out;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(kSha256Size);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    digest.resize(len);
    return digest;
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return hex_encode(sha256(data));
}

} // namespace chatrelay
