#include "vidstore/bitstream.hpp"

#include <stdexcept>

namespace vidstore::blockmap {

std::uint32_t BitReader::Read(int bits) {
    if (bits < 0 || bits > 32) {
        throw std::invalid_argument("BitReader: bit count out of range");
    }
    std::uint32_t value = 0;
    for (int i = 0; i < bits; ++i) {
        std::uint32_t bit = 0;
        if (bit_pos_ < size_ * 8) {
            bit = (data_[bit_pos_ >> 3] >> (7 - (bit_pos_ & 7))) & 1u;
        }
        value = (value << 1) | bit;
        ++bit_pos_;
    }
    return value;
}

BitWriter::BitWriter(std::size_t byte_limit) : out_(byte_limit, 0), limit_bits_(byte_limit * 8) {}

void BitWriter::Write(std::uint32_t value, int bits) {
    if (bits < 0 || bits > 32) {
        throw std::invalid_argument("BitWriter: bit count out of range");
    }
    for (int i = bits - 1; i >= 0; --i) {
        if (bit_pos_ >= limit_bits_) {
            return;
        }
        if ((value >> i) & 1u) {
            out_[bit_pos_ >> 3] |= static_cast<std::uint8_t>(0x80u >> (bit_pos_ & 7));
        }
        ++bit_pos_;
    }
}

}  // namespace vidstore::blockmap
