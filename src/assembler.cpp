#include "vidstore/assembler.hpp"

#include "vidstore/bitstream.hpp"
#include "vidstore/ecc.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/parallel.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vidstore::frame {

namespace {

std::size_t ProtectedBytes(const header::Header& header) {
    return ecc::ProtectedSize(static_cast<std::size_t>(header.stream_length),
                              static_cast<std::size_t>(header.ecc_parity));
}

// Where frame `index` starts in the body block sequence.
struct FrameSpan {
    std::size_t first_block = 0;
    int first_row = 0;
};

FrameSpan SpanOf(const FrameLayout& layout, std::size_t index) {
    FrameSpan span;
    if (index == 0) {
        span.first_row = layout.first_body_row();
        return span;
    }
    span.first_block = index * layout.blocks_per_frame() - layout.reserved_blocks();
    return span;
}

}  // namespace

FrameAssembler::FrameAssembler(const header::Header& header, const Bytes& body, std::size_t workers)
    : header_(header),
      body_(body),
      layout_(header.width, header.height, header.body()),
      codec_(header.levels),
      body_blocks_(layout_.BodyBlocks(body.size())),
      frame_count_(layout_.FrameCount(body.size())),
      workers_(std::max<std::size_t>(1, workers)) {
    if (body.size() != ProtectedBytes(header)) {
        throw ParameterError("body size does not match the header's stream length");
    }
    if (frame_count_ != header.frame_count) {
        throw ParameterError("header frame count disagrees with the layout");
    }
}

Frame FrameAssembler::Render(std::size_t index) const {
    if (index >= frame_count_) {
        throw std::out_of_range("frame index out of range: " + std::to_string(index));
    }
    Frame frame(layout_.width(), layout_.height());
    if (index == 0) {
        header::Paint(frame, header_);
    }
    const FrameSpan span = SpanOf(layout_, index);
    const int per_row = layout_.blocks_per_row();
    const int rows = layout_.block_rows() - span.first_row;
    const int size = layout_.body().block_size;
    const int bpb = codec_.bits_per_block();

    parallel::ParallelFor(static_cast<std::size_t>(rows), workers_, [&](std::size_t, std::size_t r) {
        const std::size_t row_first = span.first_block + r * static_cast<std::size_t>(per_row);
        if (row_first >= body_blocks_) {
            return;
        }
        blockmap::BitReader reader(body_);
        reader.Seek(row_first * static_cast<std::size_t>(bpb));
        const int y = (span.first_row + static_cast<int>(r)) * size;
        const std::size_t count = std::min<std::size_t>(static_cast<std::size_t>(per_row), body_blocks_ - row_first);
        for (std::size_t c = 0; c < count; ++c) {
            blockmap::PaintBlock(frame.rgb.data(), frame.width, static_cast<int>(c) * size, y, size,
                                 codec_.BitsToBlock(reader.Read(bpb)));
        }
    });
    return frame;
}

FrameDisassembler::FrameDisassembler(const header::Header& header, std::size_t workers)
    : layout_(header.width, header.height, header.body()),
      codec_(header.levels),
      body_blocks_(layout_.BodyBlocks(ProtectedBytes(header))),
      expected_frames_(header.frame_count),
      workers_(std::max<std::size_t>(1, workers)),
      writer_(ProtectedBytes(header)) {}

void FrameDisassembler::Consume(const Frame& frame) {
    if (consumed_ >= expected_frames_) {
        throw ExternalProcessError("video delivered more frames than the header declares (" +
                                   std::to_string(expected_frames_) + ")");
    }
    if (frame.width != layout_.width() || frame.height != layout_.height() ||
        frame.rgb.size() != FrameBytes(frame.width, frame.height)) {
        throw ExternalProcessError("frame " + std::to_string(consumed_) + " is " + std::to_string(frame.width) +
                                   "x" + std::to_string(frame.height) + ", header declares " +
                                   std::to_string(layout_.width()) + "x" + std::to_string(layout_.height()));
    }
    const FrameSpan span = SpanOf(layout_, consumed_);
    const std::size_t per_row = static_cast<std::size_t>(layout_.blocks_per_row());
    const int rows = layout_.block_rows() - span.first_row;
    const int size = layout_.body().block_size;

    std::vector<std::vector<std::uint32_t>> symbols(static_cast<std::size_t>(rows));
    parallel::ParallelFor(static_cast<std::size_t>(rows), workers_, [&](std::size_t, std::size_t r) {
        const std::size_t row_first = span.first_block + r * per_row;
        if (row_first >= body_blocks_) {
            return;
        }
        const int y = (span.first_row + static_cast<int>(r)) * size;
        const std::size_t count = std::min(per_row, body_blocks_ - row_first);
        auto& out = symbols[r];
        out.reserve(count);
        for (std::size_t c = 0; c < count; ++c) {
            auto mean = blockmap::SampleBlock(frame.rgb.data(), frame.width, static_cast<int>(c) * size, y, size);
            out.push_back(codec_.BlockToBits(mean));
        }
    });

    const int bpb = codec_.bits_per_block();
    for (const auto& row : symbols) {
        for (std::uint32_t symbol : row) {
            writer_.Write(symbol, bpb);
            ++blocks_read_;
        }
    }
    ++consumed_;
}

Bytes FrameDisassembler::TakeBody() {
    if (!complete()) {
        throw ExternalProcessError("video ended after " + std::to_string(consumed_) + " frames, header declares " +
                                   std::to_string(expected_frames_));
    }
    return writer_.Take();
}

}  // namespace vidstore::frame
