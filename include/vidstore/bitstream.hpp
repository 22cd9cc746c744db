#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace vidstore::blockmap {

using Bytes = std::vector<std::uint8_t>;

// MSB-first reader; reads past the end yield zero bits.
class BitReader {
public:
    BitReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit BitReader(const Bytes& data) : BitReader(data.data(), data.size()) {}

    std::uint32_t Read(int bits);
    void Seek(std::size_t bit) noexcept { bit_pos_ = bit; }
    bool exhausted() const noexcept { return bit_pos_ >= size_ * 8; }
    std::size_t bit_position() const noexcept { return bit_pos_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t bit_pos_ = 0;
};

// MSB-first writer that stops accepting bits once `byte_limit` bytes are filled.
class BitWriter {
public:
    explicit BitWriter(std::size_t byte_limit);

    void Write(std::uint32_t value, int bits);
    bool full() const noexcept { return bit_pos_ >= limit_bits_; }
    std::size_t bit_position() const noexcept { return bit_pos_; }

    const Bytes& bytes() const noexcept { return out_; }
    Bytes Take() { return std::move(out_); }

private:
    Bytes out_;
    std::size_t limit_bits_;
    std::size_t bit_pos_ = 0;
};

}  // namespace vidstore::blockmap
