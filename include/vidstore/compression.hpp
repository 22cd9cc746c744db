#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidstore::compression {

using Bytes = std::vector<std::uint8_t>;

Bytes Deflate(const Bytes& input, int level = 9);

// Throws IntegrityError on a malformed stream.
Bytes Inflate(const Bytes& input);

// Like Inflate, but the output must be exactly `expected_size` bytes. Decompression stops
// with IntegrityError as soon as it would grow past that.
Bytes Inflate(const Bytes& input, std::size_t expected_size);

}  // namespace vidstore::compression
