#pragma once

#include "vidstore/cipher.hpp"
#include "vidstore/constants.hpp"
#include "vidstore/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidstore::header {

using Bytes = std::vector<std::uint8_t>;

struct Header {
    std::uint8_t version = constants::kFormatVersion;
    bool encrypted = false;
    bool compressed = false;
    int block_size = 0;
    int levels = 0;
    int ecc_parity = 0;
    int width = 0;
    int height = 0;
    std::uint64_t payload_length = 0;
    std::uint64_t stream_length = 0;
    std::uint32_t frame_count = 0;
    Bytes payload_sha256;
    cipher::KdfParams kdf;
    Bytes salt;
    Bytes nonce;

    frame::BodyParams body() const;
};

// Fixed big-endian layout; the cipher fields are present only when encrypted.
Bytes Serialize(const Header& header);

// Throws HeaderUnrecoverable on a wrong magic, unknown version or inconsistent fields.
Header Parse(const Bytes& data);

// Serialized header padded to the header capacity, RS encoded, repeated kHeaderCopies times.
Bytes Protect(const Header& header);
Header Recover(const Bytes& protected_bytes);

std::size_t ProtectedSize();
std::size_t BandBlocks();

// Pixel height of the header band for a frame of the given width.
int BandHeight(int width);

void Paint(frame::Frame& frame, const Header& header);
Header Read(const frame::Frame& frame);

}  // namespace vidstore::header
