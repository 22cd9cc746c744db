#pragma once

#include "vidstore/bitstream.hpp"
#include "vidstore/blockmap.hpp"
#include "vidstore/frame.hpp"
#include "vidstore/header.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidstore::frame {

// Lays the protected body stream out as frames. Frames are rendered on demand so only
// one frame buffer is alive per call. `body` must outlive the assembler.
class FrameAssembler {
public:
    FrameAssembler(const header::Header& header, const Bytes& body, std::size_t workers);

    const FrameLayout& layout() const noexcept { return layout_; }
    std::size_t frame_count() const noexcept { return frame_count_; }

    Frame Render(std::size_t index) const;

private:
    header::Header header_;
    const Bytes& body_;
    FrameLayout layout_;
    blockmap::SymbolCodec codec_;
    std::size_t body_blocks_;
    std::size_t frame_count_;
    std::size_t workers_;
};

// Collects the body stream back from frames delivered in order.
class FrameDisassembler {
public:
    FrameDisassembler(const header::Header& header, std::size_t workers);

    const FrameLayout& layout() const noexcept { return layout_; }
    std::size_t expected_frames() const noexcept { return expected_frames_; }
    std::size_t frames_consumed() const noexcept { return consumed_; }
    bool complete() const noexcept { return consumed_ >= expected_frames_; }

    // Throws ExternalProcessError when the frame does not fit the header's geometry or
    // arrives past the declared frame count.
    void Consume(const Frame& frame);

    Bytes TakeBody();

private:
    FrameLayout layout_;
    blockmap::SymbolCodec codec_;
    std::size_t body_blocks_;
    std::size_t expected_frames_;
    std::size_t workers_;
    std::size_t consumed_ = 0;
    std::size_t blocks_read_ = 0;
    blockmap::BitWriter writer_;
};

}  // namespace vidstore::frame
