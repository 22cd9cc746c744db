#include "vidstore/blockmap.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/errors.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace vidstore::blockmap {

bool IsSupportedLevels(int levels) {
    if (levels < constants::kMinLevels || levels > constants::kMaxLevels) {
        return false;
    }
    return (levels & (levels - 1)) == 0;
}

LevelQuantizer::LevelQuantizer(int levels) : levels_(levels), bits_(0) {
    if (!IsSupportedLevels(levels)) {
        throw ParameterError("levels must be a power of two in [2, 256], got " + std::to_string(levels));
    }
    while ((1 << bits_) < levels_) {
        ++bits_;
    }
    const int span = levels_ - 1;
    for (int level = 0; level < levels_; ++level) {
        // round(level * 255 / span), half up
        table_[static_cast<std::size_t>(level)] =
            static_cast<std::uint8_t>((level * 255 * 2 + span) / (2 * span));
    }
    thresholds_.reserve(static_cast<std::size_t>(span));
    for (int level = 0; level < span; ++level) {
        thresholds_.push_back((table_[static_cast<std::size_t>(level)] +
                               table_[static_cast<std::size_t>(level + 1)]) / 2.0);
    }
}

std::uint8_t LevelQuantizer::Intensity(unsigned level) const {
    if (level >= static_cast<unsigned>(levels_)) {
        throw std::out_of_range("quantization level out of range");
    }
    return table_[level];
}

unsigned LevelQuantizer::Nearest(double sample) const {
    auto it = std::lower_bound(thresholds_.begin(), thresholds_.end(), sample);
    return static_cast<unsigned>(it - thresholds_.begin());
}

SymbolCodec::SymbolCodec(int levels) : quantizer_(levels) {}

Rgb SymbolCodec::BitsToBlock(std::uint32_t symbol) const {
    const int bits = quantizer_.bits();
    const std::uint32_t mask = (1u << bits) - 1u;
    Rgb color;
    color.r = quantizer_.Intensity((symbol >> (2 * bits)) & mask);
    color.g = quantizer_.Intensity((symbol >> bits) & mask);
    color.b = quantizer_.Intensity(symbol & mask);
    return color;
}

std::uint32_t SymbolCodec::BlockToBits(const ChannelMean& sample) const {
    const int bits = quantizer_.bits();
    std::uint32_t symbol = quantizer_.Nearest(sample.r);
    symbol = (symbol << bits) | quantizer_.Nearest(sample.g);
    symbol = (symbol << bits) | quantizer_.Nearest(sample.b);
    return symbol;
}

void PaintBlock(std::uint8_t* rgb, int width, int x0, int y0, int size, Rgb color) {
    const std::size_t stride = static_cast<std::size_t>(width) * 3;
    std::uint8_t* first = rgb + static_cast<std::size_t>(y0) * stride + static_cast<std::size_t>(x0) * 3;
    for (int x = 0; x < size; ++x) {
        first[x * 3] = color.r;
        first[x * 3 + 1] = color.g;
        first[x * 3 + 2] = color.b;
    }
    const std::size_t row_bytes = static_cast<std::size_t>(size) * 3;
    for (int y = 1; y < size; ++y) {
        std::memcpy(first + static_cast<std::size_t>(y) * stride, first, row_bytes);
    }
}

ChannelMean SampleBlock(const std::uint8_t* rgb, int width, int x0, int y0, int size) {
    const std::size_t stride = static_cast<std::size_t>(width) * 3;
    std::uint64_t sum_r = 0;
    std::uint64_t sum_g = 0;
    std::uint64_t sum_b = 0;
    for (int y = 0; y < size; ++y) {
        const std::uint8_t* row =
            rgb + static_cast<std::size_t>(y0 + y) * stride + static_cast<std::size_t>(x0) * 3;
        for (int x = 0; x < size; ++x) {
            sum_r += row[x * 3];
            sum_g += row[x * 3 + 1];
            sum_b += row[x * 3 + 2];
        }
    }
    const double count = static_cast<double>(size) * static_cast<double>(size);
    ChannelMean mean;
    mean.r = static_cast<double>(sum_r) / count;
    mean.g = static_cast<double>(sum_g) / count;
    mean.b = static_cast<double>(sum_b) / count;
    return mean;
}

}  // namespace vidstore::blockmap
