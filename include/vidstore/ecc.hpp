#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

struct correct_reed_solomon;

namespace vidstore::ecc {

using Bytes = std::vector<std::uint8_t>;

struct RecoveredChunk {
    Bytes data;
    std::size_t corrected = 0;
};

// Systematic RS(255, 255 - parity) over GF(2^8); shorter codewords are shortened codes.
// One instance must not be shared between threads.
class ReedSolomon {
public:
    explicit ReedSolomon(std::size_t parity);

    std::size_t parity() const noexcept { return parity_; }
    std::size_t max_data() const noexcept;

    // Returns data followed by parity bytes.
    Bytes Encode(const std::uint8_t* data, std::size_t size);

    // nullopt when the codeword has more errors than the code can correct.
    std::optional<RecoveredChunk> Decode(const std::uint8_t* codeword, std::size_t size);

private:
    struct Deleter {
        void operator()(correct_reed_solomon* rs) const noexcept;
    };

    std::size_t parity_;
    std::unique_ptr<correct_reed_solomon, Deleter> rs_;
};

std::size_t ChunkDataSize(std::size_t parity);
std::size_t ChunkCount(std::size_t stream_length, std::size_t parity);
std::size_t ProtectedSize(std::size_t stream_length, std::size_t parity);

// Chunk i covers stream bytes [i * data, (i + 1) * data); the last one is zero padded.
std::vector<Bytes> Protect(const Bytes& stream, std::size_t parity);

// Throws UncorrectableChunk carrying the chunk index and its offset in the protected stream.
RecoveredChunk Recover(ReedSolomon& rs, const std::uint8_t* codeword, std::size_t index);

// Maps a byte offset of the protected stream to the frame that carries it.
using FrameLocator = std::function<std::size_t(std::size_t byte_offset)>;

struct RecoveryReport {
    Bytes stream;
    std::vector<std::size_t> corrected;
    std::size_t total_corrected = 0;
    std::size_t chunks_with_errors = 0;
};

// Concatenated codewords for the whole stream, chunks encoded on up to `workers` threads.
Bytes ProtectAll(const Bytes& stream, std::size_t parity, std::size_t workers);

// Inverse of ProtectAll, trimmed to stream_length.
RecoveryReport RecoverAll(const Bytes& protected_stream,
                          std::size_t parity,
                          std::size_t stream_length,
                          std::size_t workers,
                          const FrameLocator& locate = {});

}  // namespace vidstore::ecc
