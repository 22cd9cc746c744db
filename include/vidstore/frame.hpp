#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidstore::frame {

using Bytes = std::vector<std::uint8_t>;

// Packed rgb24, row-major, no padding.
struct Frame {
    int width = 0;
    int height = 0;
    Bytes rgb;

    Frame() = default;
    Frame(int w, int h);

    std::size_t byte_size() const noexcept { return rgb.size(); }
};

std::size_t FrameBytes(int width, int height);

struct BodyParams {
    int block_size = 0;
    int levels = 0;
    int ecc_parity = 0;
};

struct BlockPosition {
    std::size_t frame = 0;
    int x = 0;
    int y = 0;
};

// Block grid of one resolution and body parameter set. Body blocks run left-to-right,
// top-to-bottom, continuing on the next frame; frame 0 skips the rows covered by the
// header band.
class FrameLayout {
public:
    // Throws ParameterError when the combination cannot be laid out.
    FrameLayout(int width, int height, const BodyParams& body);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    const BodyParams& body() const noexcept { return body_; }

    int blocks_per_row() const noexcept { return width_ / body_.block_size; }
    int block_rows() const noexcept { return height_ / body_.block_size; }
    std::size_t blocks_per_frame() const noexcept;
    int bits_per_block() const noexcept { return bits_per_block_; }

    int header_band_height() const noexcept { return band_height_; }
    int first_body_row() const noexcept { return first_body_row_; }
    std::size_t reserved_blocks() const noexcept;

    std::size_t BodyBlocks(std::size_t protected_bytes) const;
    std::size_t FrameCount(std::size_t protected_bytes) const;

    // Bytes of protected stream the given number of frames can carry.
    std::size_t Capacity(std::size_t frames) const;

    BlockPosition Locate(std::size_t body_block) const;
    std::size_t FrameOfByte(std::size_t byte_offset) const;

private:
    int width_;
    int height_;
    BodyParams body_;
    int bits_per_block_ = 0;
    int band_height_ = 0;
    int first_body_row_ = 0;
};

}  // namespace vidstore::frame
