#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidstore::blockmap {

bool IsSupportedLevels(int levels);

// Maps quantization levels to evenly spaced 8-bit intensities and back.
class LevelQuantizer {
public:
    explicit LevelQuantizer(int levels);

    int levels() const noexcept { return levels_; }
    int bits() const noexcept { return bits_; }
    double spacing() const noexcept { return 255.0 / static_cast<double>(levels_ - 1); }

    std::uint8_t Intensity(unsigned level) const;

    // Nearest reconstruction value; a sample exactly between two levels maps to the lower one.
    unsigned Nearest(double sample) const;

private:
    int levels_;
    int bits_;
    std::array<std::uint8_t, 256> table_{};
    std::vector<double> thresholds_;
};

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

struct ChannelMean {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

// One block carries 3 * log2(levels) bits: the high third selects R, then G, then B.
class SymbolCodec {
public:
    explicit SymbolCodec(int levels);

    int bits_per_block() const noexcept { return 3 * quantizer_.bits(); }
    const LevelQuantizer& quantizer() const noexcept { return quantizer_; }

    Rgb BitsToBlock(std::uint32_t symbol) const;
    std::uint32_t BlockToBits(const ChannelMean& sample) const;

private:
    LevelQuantizer quantizer_;
};

// rgb is a packed rgb24 buffer `width` pixels wide.
void PaintBlock(std::uint8_t* rgb, int width, int x0, int y0, int size, Rgb color);
ChannelMean SampleBlock(const std::uint8_t* rgb, int width, int x0, int y0, int size);

}  // namespace vidstore::blockmap
