#pragma once

#include "vidstore/cipher.hpp"
#include "vidstore/constants.hpp"
#include "vidstore/frame.hpp"
#include "vidstore/header.hpp"
#include "vidstore/video.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vidstore::pipeline {

using Bytes = std::vector<std::uint8_t>;

// overall and stage fractions are in [0, 1].
using ProgressFn = std::function<void(double overall, const std::string& stage, double stage_fraction)>;

struct EncodeOptions {
    std::string password;
    frame::BodyParams body{constants::kDefaultBlockSize, constants::kDefaultLevels, constants::kDefaultEccParity};
    int width = constants::kDefaultFrameWidth;
    int height = constants::kDefaultFrameHeight;
    int fps = constants::kDefaultFps;
    int crf = constants::kDefaultCrf;
    bool compress = false;
    std::optional<cipher::KdfParams> kdf;  // DefaultKdf() when unset
    std::size_t workers = 0;               // 0 resolves from VIDSTORE_WORKERS / hardware
    ProgressFn progress;
};

struct EncodeReport {
    header::Header header;
    std::size_t frames = 0;
    std::size_t stream_bytes = 0;
    std::size_t protected_bytes = 0;
    std::size_t capacity_bytes = 0;
};

struct DecodeOptions {
    std::string password;
    std::size_t workers = 0;
    ProgressFn progress;
};

struct DecodeReport {
    header::Header header;
    std::size_t frames = 0;
    std::size_t chunks = 0;
    std::size_t chunks_with_errors = 0;
    std::size_t corrected_symbols = 0;
};

// Throws ParameterError before any frame is produced when the options cannot be laid out.
frame::FrameLayout ValidateEncodeOptions(const EncodeOptions& options);

video::EncodeSettings SettingsFor(const EncodeOptions& options);

EncodeReport EncodeBytes(const Bytes& payload, video::FrameSink& sink, const EncodeOptions& options);
EncodeReport EncodeFile(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        video::VideoBridge& bridge,
                        const EncodeOptions& options);

Bytes DecodeBytes(video::FrameSource& source, const DecodeOptions& options, DecodeReport* report = nullptr);

// The output file appears only after every stage has succeeded.
DecodeReport DecodeFile(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        video::VideoBridge& bridge,
                        const DecodeOptions& options);

header::Header InspectVideo(const std::filesystem::path& input, video::VideoBridge& bridge);

struct DryRunReport {
    EncodeReport encode;
    DecodeReport decode;
    bool verified = false;
};

// Encode into memory and decode back.
DryRunReport DryRun(const Bytes& payload, const EncodeOptions& options);

std::vector<std::string> DescribeHeader(const header::Header& header);

}  // namespace vidstore::pipeline
