#include "vidstore/video.hpp"

#include "vidstore/env.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/process.hpp"

#include <sstream>
#include <utility>

namespace vidstore::video {

namespace {

std::vector<std::string> SplitLines(const std::string& input) {
    std::vector<std::string> lines;
    std::istringstream iss(input);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::string OrDefault(std::string value, const char* fallback) {
    return value.empty() ? std::string(fallback) : value;
}

class FfmpegSink : public FrameSink {
public:
    FfmpegSink(std::vector<std::string> cmd, const EncodeSettings& settings)
        : settings_(settings), proc_(std::move(cmd), process::PipeMode::Stdin) {}

    void Write(const frame::Frame& frame) override {
        if (frame.width != settings_.width || frame.height != settings_.height) {
            throw ParameterError("frame size differs from the encoder configuration");
        }
        proc_.Write(frame.rgb.data(), frame.rgb.size());
    }

    void Close() override {
        proc_.CloseInput();
        proc_.Finish();
    }

private:
    EncodeSettings settings_;
    process::Subprocess proc_;
};

class FfmpegSource : public FrameSource {
public:
    FfmpegSource(std::vector<std::string> cmd, VideoInfo info)
        : info_(info), proc_(std::move(cmd), process::PipeMode::Stdout) {}

    std::optional<frame::Frame> Next() override {
        if (done_) {
            return std::nullopt;
        }
        frame::Frame frame(info_.width, info_.height);
        std::size_t got = proc_.Read(frame.rgb.data(), frame.rgb.size());
        if (got == frame.rgb.size()) {
            return frame;
        }
        done_ = true;
        proc_.Finish();
        if (got != 0) {
            throw ExternalProcessError("decoder produced a truncated frame (" + std::to_string(got) + " of " +
                                       std::to_string(frame.rgb.size()) + " bytes)");
        }
        return std::nullopt;
    }

    const VideoInfo& info() const override { return info_; }

private:
    VideoInfo info_;
    process::Subprocess proc_;
    bool done_ = false;
};

class MemorySink : public FrameSink {
public:
    MemorySink(std::map<std::string, std::vector<frame::Frame>>& videos, std::string key)
        : videos_(videos), key_(std::move(key)) {}

    void Write(const frame::Frame& frame) override { pending_.push_back(frame); }
    void Close() override { videos_[key_] = std::move(pending_); }

private:
    std::map<std::string, std::vector<frame::Frame>>& videos_;
    std::string key_;
    std::vector<frame::Frame> pending_;
};

class MemorySource : public FrameSource {
public:
    explicit MemorySource(const std::vector<frame::Frame>& frames) : frames_(frames) {
        if (!frames_.empty()) {
            info_.width = frames_.front().width;
            info_.height = frames_.front().height;
            info_.valid = true;
        }
        info_.frame_count = frames_.size();
    }

    std::optional<frame::Frame> Next() override {
        if (next_ >= frames_.size()) {
            return std::nullopt;
        }
        return frames_[next_++];
    }

    const VideoInfo& info() const override { return info_; }

private:
    const std::vector<frame::Frame>& frames_;
    VideoInfo info_;
    std::size_t next_ = 0;
};

}  // namespace

double ParseRate(const std::string& rate) {
    if (rate.empty()) {
        return 0.0;
    }
    auto pos = rate.find('/');
    try {
        if (pos == std::string::npos) {
            return std::stod(rate);
        }
        double num = std::stod(rate.substr(0, pos));
        double den = std::stod(rate.substr(pos + 1));
        return den == 0.0 ? 0.0 : num / den;
    } catch (const std::exception&) {
        return 0.0;
    }
}

VideoInfo ProbeVideo(const std::filesystem::path& path, const std::string& ffprobe) {
    VideoInfo info;
    std::vector<std::string> cmd = {
        ffprobe, "-v", "error",
        "-select_streams", "v:0",
        "-show_entries", "stream=width,height,avg_frame_rate,nb_frames",
        "-of", "default=nw=1:nk=1",
        path.string()
    };
    std::string out;
    try {
        out = process::RunCapture(cmd);
    } catch (const ExternalProcessError&) {
        return info;
    }
    auto lines = SplitLines(out);
    if (lines.size() < 2) {
        return info;
    }
    try {
        info.width = std::stoi(lines[0]);
        info.height = std::stoi(lines[1]);
    } catch (const std::exception&) {
        return info;
    }
    if (lines.size() >= 3) {
        info.fps = ParseRate(lines[2]);
    }
    if (lines.size() >= 4) {
        try {
            info.frame_count = static_cast<std::uint64_t>(std::stoull(lines[3]));
        } catch (const std::exception&) {
            info.frame_count = 0;
        }
    }
    info.valid = info.width > 0 && info.height > 0;
    return info;
}

FfmpegBridge::FfmpegBridge()
    : FfmpegBridge(OrDefault(env::Get("VIDSTORE_FFMPEG"), "ffmpeg"),
                   OrDefault(env::Get("VIDSTORE_FFPROBE"), "ffprobe")) {}

FfmpegBridge::FfmpegBridge(std::string ffmpeg, std::string ffprobe)
    : ffmpeg_(std::move(ffmpeg)), ffprobe_(std::move(ffprobe)) {}

std::vector<std::string> FfmpegBridge::EncodeCommand(const std::filesystem::path& path,
                                                     const EncodeSettings& settings) const {
    return {
        ffmpeg_, "-y", "-v", "error",
        "-f", "rawvideo",
        "-pix_fmt", "rgb24",
        "-s", std::to_string(settings.width) + "x" + std::to_string(settings.height),
        "-r", std::to_string(settings.fps),
        "-i", "-",
        "-an",
        "-vf", "scale=out_color_matrix=bt709:out_range=full",
        "-c:v", settings.codec,
        "-preset", settings.preset,
        "-tune", "stillimage",
        "-crf", std::to_string(settings.crf),
        "-pix_fmt", settings.pixel_format,
        "-color_range", "pc",
        "-colorspace", "bt709",
        path.string()
    };
}

std::vector<std::string> FfmpegBridge::DecodeCommand(const std::filesystem::path& path) const {
    return {
        ffmpeg_, "-v", "error",
        "-i", path.string(),
        "-map", "0:v:0",
        "-vsync", "passthrough",
        "-f", "rawvideo",
        "-pix_fmt", "rgb24",
        "-"
    };
}

std::unique_ptr<FrameSink> FfmpegBridge::OpenSink(const std::filesystem::path& path, const EncodeSettings& settings) {
    return std::make_unique<FfmpegSink>(EncodeCommand(path, settings), settings);
}

std::unique_ptr<FrameSource> FfmpegBridge::OpenSource(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw IoError("input video not found: " + path.string());
    }
    VideoInfo info = ProbeVideo(path, ffprobe_);
    if (!info.valid) {
        throw ExternalProcessError("ffprobe could not read a video stream from " + path.string());
    }
    return std::make_unique<FfmpegSource>(DecodeCommand(path), info);
}

std::unique_ptr<FrameSink> MemoryBridge::OpenSink(const std::filesystem::path& path, const EncodeSettings&) {
    return std::make_unique<MemorySink>(videos_, path.string());
}

std::unique_ptr<FrameSource> MemoryBridge::OpenSource(const std::filesystem::path& path) {
    auto it = videos_.find(path.string());
    if (it == videos_.end()) {
        throw IoError("no in-memory video at " + path.string());
    }
    return std::make_unique<MemorySource>(it->second);
}

bool MemoryBridge::Contains(const std::filesystem::path& path) const {
    return videos_.count(path.string()) > 0;
}

std::vector<frame::Frame>& MemoryBridge::Frames(const std::filesystem::path& path) {
    auto it = videos_.find(path.string());
    if (it == videos_.end()) {
        throw IoError("no in-memory video at " + path.string());
    }
    return it->second;
}

}  // namespace vidstore::video
