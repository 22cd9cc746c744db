#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vidstore::cipher {

using Bytes = std::vector<std::uint8_t>;

enum class KdfKind : std::uint8_t {
    None = 0,
    Pbkdf2 = 1,
    Argon2id = 2
};

// cost_a: iterations (PBKDF2) or time cost (Argon2id). cost_b: memory in KiB (Argon2id only).
struct KdfParams {
    KdfKind kind = KdfKind::None;
    std::uint32_t cost_a = 0;
    std::uint32_t cost_b = 0;
};

struct SealedPayload {
    Bytes data;
    Bytes salt;
    Bytes nonce;
    KdfParams kdf;
    bool encrypted = false;
};

// Argon2id when the build has it, PBKDF2 otherwise. VIDSTORE_KDF_ITERS overrides the PBKDF2 count.
KdfParams DefaultKdf();

bool KdfSupported(KdfKind kind);
const char* KdfName(KdfKind kind);

Bytes DeriveKey(const std::string& password, const Bytes& salt, const KdfParams& kdf);

// An empty password passes the plaintext through untouched.
SealedPayload Encrypt(const Bytes& plaintext, const std::string& password);
SealedPayload Encrypt(const Bytes& plaintext, const std::string& password, const KdfParams& kdf);

// Throws AuthenticationError when the password is wrong or the ciphertext was altered.
Bytes Decrypt(const SealedPayload& sealed, const std::string& password);

}  // namespace vidstore::cipher
