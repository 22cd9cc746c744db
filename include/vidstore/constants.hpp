#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vidstore::constants {

inline constexpr std::string_view kMagic = "VDST";
inline constexpr std::uint8_t kFormatVersion = 1;

inline constexpr std::uint8_t kFlagEncrypted = 0x01;
inline constexpr std::uint8_t kFlagCompressed = 0x02;

inline constexpr int kDefaultFrameWidth = 3840;
inline constexpr int kDefaultFrameHeight = 2160;
inline constexpr int kMaxFrameDimension = 65535;

inline constexpr int kDefaultBlockSize = 4;
inline constexpr int kDefaultLevels = 4;
inline constexpr int kDefaultEccParity = 32;
inline constexpr int kDefaultFps = 30;
inline constexpr int kDefaultCrf = 18;

inline constexpr int kMinLevels = 2;
inline constexpr int kMaxLevels = 256;
inline constexpr int kMaxBlockSize = 255;
inline constexpr int kMaxCrf = 51;

// Reed-Solomon over GF(2^8): codeword length and field parameters.
inline constexpr std::size_t kRsCodewordLen = 255;
inline constexpr std::uint16_t kRsPrimitivePolynomial = 0x11d;
inline constexpr std::uint8_t kRsFirstConsecutiveRoot = 1;
inline constexpr std::uint8_t kRsGeneratorRootGap = 1;
inline constexpr int kMinEccParity = 1;
inline constexpr int kMaxEccParity = 254;

// Header band: always painted with these parameters, independent of the body.
inline constexpr int kHeaderBlockSize = 8;
inline constexpr int kHeaderLevels = 2;
inline constexpr std::size_t kHeaderCapacity = 128;
inline constexpr std::size_t kHeaderParity = 64;
inline constexpr std::size_t kHeaderCopies = 3;
inline constexpr std::size_t kHeaderCodewordLen = kHeaderCapacity + kHeaderParity;
inline constexpr std::size_t kHeaderFixedLen = 66;
inline constexpr std::size_t kHeaderCipherLen = 1 + 4 + 4 + 16 + 12;

inline constexpr std::size_t kSaltLen = 16;
inline constexpr std::size_t kNonceLen = 12;
inline constexpr std::size_t kTagLen = 16;
inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kSha256Len = 32;

inline constexpr std::uint32_t kPbkdf2Iterations = 200000;
inline constexpr std::uint32_t kArgon2TimeCost = 3;
inline constexpr std::uint32_t kArgon2MemoryCost = 1u << 15;
inline constexpr std::uint32_t kArgon2Parallelism = 1;

// Upper bounds accepted from a header before any key derivation runs.
inline constexpr std::uint32_t kMaxPbkdf2Iterations = 10000000;
inline constexpr std::uint32_t kMaxArgon2TimeCost = 64;
inline constexpr std::uint32_t kMaxArgon2MemoryCost = 1u << 20;

inline constexpr std::string_view kCipherAad = "vidstore.payload.v1";

inline constexpr std::uint64_t kDefaultProcessTimeoutSec = 600;

}  // namespace vidstore::constants
