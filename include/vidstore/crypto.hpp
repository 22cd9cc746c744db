#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidstore::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);
#if defined(VIDSTORE_HAS_ARGON2) && VIDSTORE_HAS_ARGON2
Bytes Argon2idHashRaw(const std::string& password,
                      const Bytes& salt,
                      std::uint32_t time_cost,
                      std::uint32_t memory_cost,
                      std::uint32_t parallelism,
                      std::size_t length);
#endif

// AES-256-GCM with a caller supplied IV. Output is ciphertext followed by the 16-byte tag.
Bytes AesGcmSeal(const Bytes& key, const Bytes& iv, const Bytes& plaintext, std::string_view aad);

// Returns nullopt when the tag does not verify.
std::optional<Bytes> AesGcmOpen(const Bytes& key, const Bytes& iv, const Bytes& blob, std::string_view aad);

Bytes Sha256(const Bytes& data);
Bytes Sha256(const std::uint8_t* data, std::size_t size);

}  // namespace vidstore::crypto
