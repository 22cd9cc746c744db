#pragma once

#include "vidstore/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vidstore::video {

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    std::uint64_t frame_count = 0;  // 0 when the container does not report it
    bool valid = false;
};

struct EncodeSettings {
    int width = 0;
    int height = 0;
    int fps = 0;
    int crf = 0;
    std::string codec = "libx264";
    std::string preset = "medium";
    std::string pixel_format = "yuv444p";
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void Write(const frame::Frame& frame) = 0;
    // Flushes and waits for the encoder; the artifact is complete only after Close returns.
    virtual void Close() = 0;
};

class FrameSource {
public:
    virtual ~FrameSource() = default;
    // Next frame in presentation order, nullopt once the stream is exhausted.
    virtual std::optional<frame::Frame> Next() = 0;
    virtual const VideoInfo& info() const = 0;
};

class VideoBridge {
public:
    virtual ~VideoBridge() = default;
    virtual std::unique_ptr<FrameSink> OpenSink(const std::filesystem::path& path, const EncodeSettings& settings) = 0;
    virtual std::unique_ptr<FrameSource> OpenSource(const std::filesystem::path& path) = 0;
};

// Pipes rgb24 frames through the ffmpeg binary (VIDSTORE_FFMPEG, VIDSTORE_FFPROBE).
class FfmpegBridge : public VideoBridge {
public:
    FfmpegBridge();
    FfmpegBridge(std::string ffmpeg, std::string ffprobe);

    std::unique_ptr<FrameSink> OpenSink(const std::filesystem::path& path, const EncodeSettings& settings) override;
    std::unique_ptr<FrameSource> OpenSource(const std::filesystem::path& path) override;

    std::vector<std::string> EncodeCommand(const std::filesystem::path& path, const EncodeSettings& settings) const;
    std::vector<std::string> DecodeCommand(const std::filesystem::path& path) const;

private:
    std::string ffmpeg_;
    std::string ffprobe_;
};

// Keeps "videos" as frame lists keyed by path. A sink's frames become visible on Close.
class MemoryBridge : public VideoBridge {
public:
    std::unique_ptr<FrameSink> OpenSink(const std::filesystem::path& path, const EncodeSettings& settings) override;
    std::unique_ptr<FrameSource> OpenSource(const std::filesystem::path& path) override;

    bool Contains(const std::filesystem::path& path) const;
    std::vector<frame::Frame>& Frames(const std::filesystem::path& path);

private:
    std::map<std::string, std::vector<frame::Frame>> videos_;
};

// ffprobe query for the first video stream; `valid` is false when probing fails.
VideoInfo ProbeVideo(const std::filesystem::path& path, const std::string& ffprobe = "ffprobe");

double ParseRate(const std::string& rate);

}  // namespace vidstore::video
