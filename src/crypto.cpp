#include "vidstore/crypto.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#if defined(VIDSTORE_HAS_ARGON2) && VIDSTORE_HAS_ARGON2
#include <argon2.h>
#endif

#include <limits>
#include <stdexcept>

namespace vidstore::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedInt(std::size_t value, const char* what) {
    if (value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for OpenSSL");
    }
    return static_cast<int>(value);
}

detail::UniqueCipherCtx NewGcmContext(bool encrypt, const Bytes& key, const Bytes& iv) {
    if (key.size() != constants::kKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    Ensure(EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, encrypt ? 1 : 0) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data(), encrypt ? 1 : 0) == 1,
           "AES-GCM set key failed");
    return ctx;
}

void FeedAad(EVP_CIPHER_CTX* ctx, std::string_view aad) {
    if (aad.empty()) {
        return;
    }
    int out_len = 0;
    Ensure(EVP_CipherUpdate(ctx, nullptr, &out_len, reinterpret_cast<const unsigned char*>(aad.data()),
                            CheckedInt(aad.size(), "AAD")) == 1,
           "AES-GCM aad failed");
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedInt(out.size(), "random buffer")) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), CheckedInt(iterations, "PBKDF2 iterations"),
                             EVP_sha256(), static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

#if defined(VIDSTORE_HAS_ARGON2) && VIDSTORE_HAS_ARGON2
Bytes Argon2idHashRaw(const std::string& password,
                      const Bytes& salt,
                      std::uint32_t time_cost,
                      std::uint32_t memory_cost,
                      std::uint32_t parallelism,
                      std::size_t length) {
    Bytes out(length);
    int rc = argon2id_hash_raw(time_cost,
                               memory_cost,
                               parallelism,
                               password.data(),
                               password.size(),
                               salt.data(),
                               salt.size(),
                               out.data(),
                               out.size());
    if (rc != ARGON2_OK) {
        throw std::runtime_error(std::string("Argon2id failed: ") + argon2_error_message(rc));
    }
    return out;
}
#endif

Bytes AesGcmSeal(const Bytes& key, const Bytes& iv, const Bytes& plaintext, std::string_view aad) {
    detail::UniqueCipherCtx ctx = NewGcmContext(true, key, iv);
    FeedAad(ctx.get(), aad);

    Bytes out(plaintext.size() + constants::kTagLen);
    int out_len = 0;
    int total_len = 0;
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext.data(),
                                 CheckedInt(plaintext.size(), "plaintext")) == 1,
               "AES-GCM encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-GCM final failed");
    total_len += out_len;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kTagLen),
                               out.data() + total_len) == 1,
           "AES-GCM get tag failed");
    out.resize(static_cast<std::size_t>(total_len) + constants::kTagLen);
    return out;
}

std::optional<Bytes> AesGcmOpen(const Bytes& key, const Bytes& iv, const Bytes& blob, std::string_view aad) {
    if (blob.size() < constants::kTagLen) {
        return std::nullopt;
    }
    detail::UniqueCipherCtx ctx = NewGcmContext(false, key, iv);
    FeedAad(ctx.get(), aad);

    const std::size_t ct_len = blob.size() - constants::kTagLen;
    Bytes tag(blob.end() - static_cast<std::ptrdiff_t>(constants::kTagLen), blob.end());
    Bytes plaintext(ct_len);
    int out_len = 0;
    int total_len = 0;
    if (ct_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, blob.data(),
                                 CheckedInt(ct_len, "ciphertext")) == 1,
               "AES-GCM decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
        return std::nullopt;
    }
    total_len += out_len;
    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

Bytes Sha256(const std::uint8_t* data, std::size_t size) {
    detail::UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes out(EVP_MAX_MD_SIZE);
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
    if (size > 0) {
        Ensure(EVP_DigestUpdate(ctx.get(), data, size) == 1, "SHA-256 update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    out.resize(out_len);
    return out;
}

Bytes Sha256(const Bytes& data) {
    return Sha256(data.data(), data.size());
}

}  // namespace vidstore::crypto
