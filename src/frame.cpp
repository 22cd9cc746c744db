#include "vidstore/frame.hpp"

#include "vidstore/blockmap.hpp"
#include "vidstore/constants.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/header.hpp"

#include <string>

namespace vidstore::frame {

namespace {

std::string Dims(int width, int height) {
    return std::to_string(width) + "x" + std::to_string(height);
}

}  // namespace

Frame::Frame(int w, int h) : width(w), height(h), rgb(FrameBytes(w, h), 0) {}

std::size_t FrameBytes(int width, int height) {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3;
}

FrameLayout::FrameLayout(int width, int height, const BodyParams& body)
    : width_(width), height_(height), body_(body) {
    if (width <= 0 || height <= 0 || width > constants::kMaxFrameDimension ||
        height > constants::kMaxFrameDimension) {
        throw ParameterError("invalid frame resolution " + Dims(width, height));
    }
    if (width % constants::kHeaderBlockSize != 0 || height % constants::kHeaderBlockSize != 0) {
        throw ParameterError("frame resolution " + Dims(width, height) + " must be a multiple of " +
                             std::to_string(constants::kHeaderBlockSize));
    }
    if (body.block_size < 1 || body.block_size > constants::kMaxBlockSize) {
        throw ParameterError("block size must be in [1, " + std::to_string(constants::kMaxBlockSize) +
                             "], got " + std::to_string(body.block_size));
    }
    if (width % body.block_size != 0 || height % body.block_size != 0) {
        throw ParameterError("block size " + std::to_string(body.block_size) +
                             " does not evenly divide frame resolution " + Dims(width, height));
    }
    if (!blockmap::IsSupportedLevels(body.levels)) {
        throw ParameterError("levels must be a power of two in [2, 256], got " + std::to_string(body.levels));
    }
    if (body.ecc_parity < constants::kMinEccParity || body.ecc_parity > constants::kMaxEccParity) {
        throw ParameterError("ecc parity must be in [" + std::to_string(constants::kMinEccParity) + ", " +
                             std::to_string(constants::kMaxEccParity) + "], got " +
                             std::to_string(body.ecc_parity));
    }

    bits_per_block_ = 3 * blockmap::LevelQuantizer(body.levels).bits();
    band_height_ = header::BandHeight(width);
    first_body_row_ = (band_height_ + body.block_size - 1) / body.block_size;
    if (band_height_ > height || first_body_row_ >= block_rows()) {
        throw ParameterError("frame resolution " + Dims(width, height) +
                             " leaves no room for body blocks below the header");
    }
}

std::size_t FrameLayout::blocks_per_frame() const noexcept {
    return static_cast<std::size_t>(blocks_per_row()) * static_cast<std::size_t>(block_rows());
}

std::size_t FrameLayout::reserved_blocks() const noexcept {
    return static_cast<std::size_t>(first_body_row_) * static_cast<std::size_t>(blocks_per_row());
}

std::size_t FrameLayout::BodyBlocks(std::size_t protected_bytes) const {
    const std::size_t bits = protected_bytes * 8;
    const std::size_t per = static_cast<std::size_t>(bits_per_block_);
    return (bits + per - 1) / per;
}

std::size_t FrameLayout::FrameCount(std::size_t protected_bytes) const {
    const std::size_t slots = reserved_blocks() + BodyBlocks(protected_bytes);
    const std::size_t per_frame = blocks_per_frame();
    return (slots + per_frame - 1) / per_frame;
}

std::size_t FrameLayout::Capacity(std::size_t frames) const {
    if (frames == 0) {
        return 0;
    }
    const std::size_t blocks = frames * blocks_per_frame() - reserved_blocks();
    return blocks * static_cast<std::size_t>(bits_per_block_) / 8;
}

BlockPosition FrameLayout::Locate(std::size_t body_block) const {
    const std::size_t slot = body_block + reserved_blocks();
    const std::size_t per_frame = blocks_per_frame();
    const std::size_t within = slot % per_frame;
    const std::size_t per_row = static_cast<std::size_t>(blocks_per_row());
    BlockPosition pos;
    pos.frame = slot / per_frame;
    pos.x = static_cast<int>(within % per_row) * body_.block_size;
    pos.y = static_cast<int>(within / per_row) * body_.block_size;
    return pos;
}

std::size_t FrameLayout::FrameOfByte(std::size_t byte_offset) const {
    const std::size_t block = byte_offset * 8 / static_cast<std::size_t>(bits_per_block_);
    return Locate(block).frame;
}

}  // namespace vidstore::frame
