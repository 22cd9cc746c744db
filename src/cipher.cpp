#include "vidstore/cipher.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/crypto.hpp"
#include "vidstore/env.hpp"
#include "vidstore/errors.hpp"

#include <string>
#include <utility>

namespace vidstore::cipher {

namespace {

std::uint32_t ResolvePbkdf2Iterations() {
    std::uint64_t iters = env::GetUnsigned("VIDSTORE_KDF_ITERS", constants::kPbkdf2Iterations);
    if (iters > constants::kMaxPbkdf2Iterations) {
        iters = constants::kMaxPbkdf2Iterations;
    }
    return static_cast<std::uint32_t>(iters);
}

void ValidateKdf(const KdfParams& kdf) {
    switch (kdf.kind) {
    case KdfKind::Pbkdf2:
        if (kdf.cost_a == 0 || kdf.cost_a > constants::kMaxPbkdf2Iterations) {
            throw ParameterError("PBKDF2 iteration count must be in [1, " +
                                 std::to_string(constants::kMaxPbkdf2Iterations) + "]");
        }
        return;
    case KdfKind::Argon2id:
        if (!KdfSupported(KdfKind::Argon2id)) {
            throw ParameterError("artifact requires Argon2id but this build has no Argon2 support");
        }
        if (kdf.cost_a == 0 || kdf.cost_a > constants::kMaxArgon2TimeCost || kdf.cost_b < 8 ||
            kdf.cost_b > constants::kMaxArgon2MemoryCost) {
            throw ParameterError("invalid Argon2id cost parameters");
        }
        return;
    case KdfKind::None:
        break;
    }
    throw ParameterError("unknown key derivation function");
}

}  // namespace

KdfParams DefaultKdf() {
    KdfParams kdf;
    if (KdfSupported(KdfKind::Argon2id)) {
        kdf.kind = KdfKind::Argon2id;
        kdf.cost_a = constants::kArgon2TimeCost;
        kdf.cost_b = constants::kArgon2MemoryCost;
        return kdf;
    }
    kdf.kind = KdfKind::Pbkdf2;
    kdf.cost_a = ResolvePbkdf2Iterations();
    return kdf;
}

bool KdfSupported(KdfKind kind) {
    switch (kind) {
    case KdfKind::Pbkdf2:
        return true;
    case KdfKind::Argon2id:
#if defined(VIDSTORE_HAS_ARGON2) && VIDSTORE_HAS_ARGON2
        return true;
#else
        return false;
#endif
    case KdfKind::None:
        break;
    }
    return false;
}

const char* KdfName(KdfKind kind) {
    switch (kind) {
    case KdfKind::None:
        return "none";
    case KdfKind::Pbkdf2:
        return "pbkdf2-sha256";
    case KdfKind::Argon2id:
        return "argon2id";
    }
    return "unknown";
}

Bytes DeriveKey(const std::string& password, const Bytes& salt, const KdfParams& kdf) {
    ValidateKdf(kdf);
    if (kdf.kind == KdfKind::Pbkdf2) {
        return crypto::Pbkdf2HmacSha256(password, salt, kdf.cost_a, constants::kKeyLen);
    }
#if defined(VIDSTORE_HAS_ARGON2) && VIDSTORE_HAS_ARGON2
    return crypto::Argon2idHashRaw(password, salt, kdf.cost_a, kdf.cost_b,
                                   constants::kArgon2Parallelism, constants::kKeyLen);
#else
    throw ParameterError("Argon2id is not available in this build");
#endif
}

SealedPayload Encrypt(const Bytes& plaintext, const std::string& password) {
    return Encrypt(plaintext, password, DefaultKdf());
}

SealedPayload Encrypt(const Bytes& plaintext, const std::string& password, const KdfParams& kdf) {
    SealedPayload sealed;
    if (password.empty()) {
        sealed.data = plaintext;
        return sealed;
    }
    sealed.kdf = kdf;
    sealed.salt = crypto::RandomBytes(constants::kSaltLen);
    sealed.nonce = crypto::RandomBytes(constants::kNonceLen);
    Bytes key = DeriveKey(password, sealed.salt, kdf);
    sealed.data = crypto::AesGcmSeal(key, sealed.nonce, plaintext, constants::kCipherAad);
    sealed.encrypted = true;
    return sealed;
}

Bytes Decrypt(const SealedPayload& sealed, const std::string& password) {
    if (!sealed.encrypted) {
        return sealed.data;
    }
    if (password.empty()) {
        throw AuthenticationError("payload is encrypted and no password was given");
    }
    if (sealed.salt.size() != constants::kSaltLen || sealed.nonce.size() != constants::kNonceLen) {
        throw AuthenticationError("cipher parameters are malformed");
    }
    if (sealed.data.size() < constants::kTagLen) {
        throw AuthenticationError("ciphertext is shorter than the authentication tag");
    }
    Bytes key = DeriveKey(password, sealed.salt, sealed.kdf);
    auto opened = crypto::AesGcmOpen(key, sealed.nonce, sealed.data, constants::kCipherAad);
    if (!opened) {
        throw AuthenticationError("wrong password or corrupted ciphertext");
    }
    return std::move(*opened);
}

}  // namespace vidstore::cipher
