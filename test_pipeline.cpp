#include "test_check.hpp"

#include "vidstore/blockmap.hpp"
#include "vidstore/cli_args.hpp"
#include "vidstore/cli_colors.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/fileio.hpp"
#include "vidstore/header.hpp"
#include "vidstore/pipeline.hpp"
#include "vidstore/progress.hpp"
#include "vidstore/video.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using vidstore::pipeline::Bytes;
using vidstore::pipeline::DecodeOptions;
using vidstore::pipeline::DecodeReport;
using vidstore::pipeline::EncodeOptions;
using vidstore::video::MemoryBridge;

namespace {

Bytes RandomPayload(std::size_t size, std::uint32_t seed) {
    std::mt19937 gen(seed);
    Bytes out(size);
    for (auto& b : out) {
        b = static_cast<std::uint8_t>(gen() & 0xFF);
    }
    return out;
}

EncodeOptions SmallOptions() {
    EncodeOptions opts;
    opts.width = 640;
    opts.height = 384;
    opts.body = {4, 4, 32};
    opts.workers = 2;
    return opts;
}

vidstore::pipeline::EncodeReport EncodeTo(MemoryBridge& bridge, const std::string& key, const Bytes& payload,
                                          const EncodeOptions& opts) {
    auto sink = bridge.OpenSink(key, vidstore::pipeline::SettingsFor(opts));
    return vidstore::pipeline::EncodeBytes(payload, *sink, opts);
}

Bytes DecodeFrom(MemoryBridge& bridge, const std::string& key, const DecodeOptions& opts,
                 DecodeReport* report = nullptr) {
    auto source = bridge.OpenSource(key);
    return vidstore::pipeline::DecodeBytes(*source, opts, report);
}

void TestRoundTripParameterSets() {
    struct Case {
        int width;
        int height;
        vidstore::frame::BodyParams body;
    };
    const std::vector<Case> cases = {
        {640, 384, {4, 4, 32}},
        {640, 384, {8, 2, 64}},
        {640, 384, {2, 16, 16}},
        {640, 480, {4, 8, 128}},
    };
    const std::vector<std::size_t> sizes = {0, 1, 100, 30000};
    std::uint32_t seed = 1;
    for (const auto& c : cases) {
        for (std::size_t size : sizes) {
            EncodeOptions opts = SmallOptions();
            opts.width = c.width;
            opts.height = c.height;
            opts.body = c.body;
            MemoryBridge bridge;
            const Bytes payload = RandomPayload(size, seed++);
            auto encoded = EncodeTo(bridge, "v", payload, opts);
            VIDSTORE_CHECK(bridge.Frames("v").size() == encoded.frames);
            VIDSTORE_CHECK(encoded.header.frame_count == encoded.frames);
            VIDSTORE_CHECK(encoded.capacity_bytes >= encoded.protected_bytes);

            DecodeOptions dopts;
            dopts.workers = 3;
            DecodeReport report;
            const Bytes restored = DecodeFrom(bridge, "v", dopts, &report);
            VIDSTORE_CHECK(restored == payload);
            VIDSTORE_CHECK(report.frames == encoded.frames);
            VIDSTORE_CHECK(report.corrected_symbols == 0);
        }
    }
}

void TestHundredBytesFitOneFrame() {
    EncodeOptions opts;
    opts.width = 3840;
    opts.height = 2160;
    opts.body = {8, 2, 64};
    opts.workers = 4;
    MemoryBridge bridge;
    const Bytes payload = RandomPayload(100, 77);
    auto encoded = EncodeTo(bridge, "uhd", payload, opts);
    VIDSTORE_CHECK(encoded.frames == 1);
    VIDSTORE_CHECK(encoded.protected_bytes == 255);
    VIDSTORE_CHECK(DecodeFrom(bridge, "uhd", DecodeOptions{}) == payload);
}

void TestEncryptedAndCompressed() {
    EncodeOptions opts = SmallOptions();
    opts.password = "correct horse";
    opts.kdf = vidstore::cipher::KdfParams{vidstore::cipher::KdfKind::Pbkdf2, 1000, 0};
    opts.compress = true;
    Bytes payload(20000, 0);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>("vidstore "[i % 9]);
    }
    MemoryBridge bridge;
    auto encoded = EncodeTo(bridge, "enc", payload, opts);
    VIDSTORE_CHECK(encoded.header.encrypted);
    VIDSTORE_CHECK(encoded.header.compressed);
    VIDSTORE_CHECK(encoded.stream_bytes < payload.size());
    VIDSTORE_CHECK(encoded.frames == 1);

    DecodeOptions dopts;
    dopts.password = "correct horse";
    VIDSTORE_CHECK(DecodeFrom(bridge, "enc", dopts) == payload);

    DecodeOptions wrong;
    wrong.password = "incorrect horse";
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::AuthenticationError>([&] { DecodeFrom(bridge, "enc", wrong); }));

    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::ParameterError>([&] { DecodeFrom(bridge, "enc", DecodeOptions{}); }));
}

void TestPasswordForPlainVideo() {
    MemoryBridge bridge;
    EncodeTo(bridge, "plain", RandomPayload(500, 3), SmallOptions());
    DecodeOptions dopts;
    dopts.password = "unused";
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>([&] { DecodeFrom(bridge, "plain", dopts); }));
}

void TestNoisyFramesRecover() {
    EncodeOptions opts = SmallOptions();
    MemoryBridge bridge;
    const Bytes payload = RandomPayload(30000, 21);
    EncodeTo(bridge, "noisy", payload, opts);

    std::mt19937 gen(5);
    std::uniform_int_distribution<int> noise(0, 30);
    for (auto& frame : bridge.Frames("noisy")) {
        for (auto& px : frame.rgb) {
            const int delta = noise(gen);
            px = static_cast<std::uint8_t>(px > 127 ? px - delta : px + delta);
        }
    }

    // Invert scattered body blocks so the RS layer has something to fix.
    auto& first = bridge.Frames("noisy").front();
    for (int i = 0; i < 12; ++i) {
        const int block = i * 700;
        const int x = (block % 160) * 4;
        const int y = 160 + (block / 160) * 4;
        const std::size_t idx = (static_cast<std::size_t>(y) * 640 + static_cast<std::size_t>(x)) * 3;
        const vidstore::blockmap::Rgb inverted{static_cast<std::uint8_t>(255 - first.rgb[idx]),
                                               static_cast<std::uint8_t>(255 - first.rgb[idx + 1]),
                                               static_cast<std::uint8_t>(255 - first.rgb[idx + 2])};
        vidstore::blockmap::PaintBlock(first.rgb.data(), 640, x, y, 4, inverted);
    }

    DecodeReport report;
    const Bytes restored = DecodeFrom(bridge, "noisy", DecodeOptions{}, &report);
    VIDSTORE_CHECK(restored == payload);
    VIDSTORE_CHECK(report.corrected_symbols > 0);
    VIDSTORE_CHECK(report.chunks_with_errors > 0);
}

void TestHeaderDecidesParameters() {
    EncodeOptions opts = SmallOptions();
    opts.body = {8, 2, 64};
    MemoryBridge bridge;
    const Bytes payload = RandomPayload(4000, 9);
    EncodeTo(bridge, "hdr", payload, opts);

    auto args = vidstore::cli::ParseDecodeArgs(
        {"-i", "hdr", "-o", "out.bin", "--block-size", "2", "--levels", "16", "--ecc", "8"});
    VIDSTORE_CHECK(args.ignored_flags.size() == 3);
    DecodeReport report;
    VIDSTORE_CHECK(DecodeFrom(bridge, "hdr", args.options, &report) == payload);
    VIDSTORE_CHECK(report.header.block_size == 8);
    VIDSTORE_CHECK(report.header.levels == 2);
    VIDSTORE_CHECK(report.header.ecc_parity == 64);
}

void TestFrameSequenceDamage() {
    EncodeOptions opts = SmallOptions();
    const Bytes payload = RandomPayload(30000, 31);

    MemoryBridge removed;
    EncodeTo(removed, "v", payload, opts);
    auto& frames = removed.Frames("v");
    VIDSTORE_CHECK(frames.size() >= 3);
    frames.erase(frames.begin() + 1);
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::ExternalProcessError>([&] { DecodeFrom(removed, "v", DecodeOptions{}); }));

    MemoryBridge duplicated;
    EncodeTo(duplicated, "v", payload, opts);
    auto& dup = duplicated.Frames("v");
    dup.push_back(dup.back());
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::ExternalProcessError>([&] { DecodeFrom(duplicated, "v", DecodeOptions{}); }));

    MemoryBridge resized;
    EncodeTo(resized, "v", payload, opts);
    resized.Frames("v")[1] = vidstore::frame::Frame(320, 192);
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::ExternalProcessError>([&] { DecodeFrom(resized, "v", DecodeOptions{}); }));

    MemoryBridge empty;
    empty.OpenSink("v", vidstore::pipeline::SettingsFor(opts))->Close();
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::ExternalProcessError>([&] { DecodeFrom(empty, "v", DecodeOptions{}); }));
}

void TestMassCorruptionNamesFrame() {
    EncodeOptions opts = SmallOptions();
    MemoryBridge bridge;
    EncodeTo(bridge, "v", RandomPayload(30000, 41), opts);
    auto& first = bridge.Frames("v").front();
    std::mt19937 gen(8);
    for (std::size_t i = static_cast<std::size_t>(160) * 640 * 3; i < first.rgb.size(); ++i) {
        first.rgb[i] = static_cast<std::uint8_t>(gen() & 0xFF);
    }
    DecodeOptions dopts;
    dopts.workers = 1;
    bool thrown = false;
    try {
        DecodeFrom(bridge, "v", dopts);
    } catch (const vidstore::UncorrectableChunk& ex) {
        thrown = true;
        VIDSTORE_CHECK(ex.frame() == 0);
        VIDSTORE_CHECK(ex.byte_offset() == ex.index() * 255);
        VIDSTORE_CHECK(ex.kind() == vidstore::ErrorKind::UncorrectableChunk);
    }
    VIDSTORE_CHECK(thrown);
}

void TestDestroyedHeader() {
    MemoryBridge bridge;
    EncodeTo(bridge, "v", RandomPayload(1000, 51), SmallOptions());
    auto& first = bridge.Frames("v").front();
    std::fill(first.rgb.begin(), first.rgb.begin() + static_cast<std::ptrdiff_t>(160) * 640 * 3, 0);
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { DecodeFrom(bridge, "v", DecodeOptions{}); }));
}

bool HasPartialFiles(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".part-") != std::string::npos) {
            return true;
        }
    }
    return false;
}

void TestDecodeFileAtomic() {
    const fs::path dir = fs::temp_directory_path() / ("vidstore_pipeline_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    const fs::path input = dir / "input.bin";
    const fs::path output = dir / "restored.bin";
    const Bytes payload = RandomPayload(5000, 61);
    vidstore::fileio::WriteFileAtomic(input, payload);

    MemoryBridge bridge;
    const fs::path video = dir / "video.mp4";
    auto report = vidstore::pipeline::EncodeFile(input, video, bridge, SmallOptions());
    VIDSTORE_CHECK(bridge.Contains(video));
    VIDSTORE_CHECK(report.header.payload_length == payload.size());

    DecodeOptions wrong;
    wrong.password = "not encrypted";
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>(
        [&] { vidstore::pipeline::DecodeFile(video, output, bridge, wrong); }));
    VIDSTORE_CHECK(!fs::exists(output));
    VIDSTORE_CHECK(!HasPartialFiles(dir));

    // Damage past the header band fails after every frame has been read.
    auto& frames = bridge.Frames(video);
    std::fill(frames.front().rgb.begin() + static_cast<std::ptrdiff_t>(160) * 640 * 3, frames.front().rgb.end(),
              0x80);
    DecodeOptions fast;
    fast.workers = 1;
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::UncorrectableChunk>(
        [&] { vidstore::pipeline::DecodeFile(video, output, bridge, fast); }));
    VIDSTORE_CHECK(!fs::exists(output));
    VIDSTORE_CHECK(!HasPartialFiles(dir));

    vidstore::pipeline::EncodeFile(input, video, bridge, SmallOptions());
    vidstore::pipeline::DecodeFile(video, output, bridge, DecodeOptions{});
    VIDSTORE_CHECK(vidstore::fileio::ReadFileBytes(output) == payload);
    VIDSTORE_CHECK(!HasPartialFiles(dir));

    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::IoError>(
        [&] { vidstore::pipeline::EncodeFile(dir / "missing.bin", dir / "x.mp4", bridge, SmallOptions()); }));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void TestDeclaredLengthBoundsInflate() {
    EncodeOptions opts = SmallOptions();
    opts.compress = true;
    MemoryBridge bridge;
    const Bytes payload(60000, 0x33);
    EncodeTo(bridge, "v", payload, opts);

    auto& first = bridge.Frames("v").front();
    auto hdr = vidstore::header::Read(first);
    VIDSTORE_CHECK(hdr.compressed);
    hdr.payload_length = 1000;
    vidstore::header::Paint(first, hdr);
    VIDSTORE_CHECK(vidstore::header::Read(first).payload_length == 1000);
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::IntegrityError>([&] { DecodeFrom(bridge, "v", DecodeOptions{}); }));
}

void TestInspectAndDryRun() {
    EncodeOptions opts = SmallOptions();
    opts.compress = true;
    MemoryBridge bridge;
    const Bytes payload = RandomPayload(2500, 71);
    EncodeTo(bridge, "v", payload, opts);

    auto hdr = vidstore::pipeline::InspectVideo("v", bridge);
    VIDSTORE_CHECK(hdr.payload_length == 2500);
    VIDSTORE_CHECK(hdr.compressed);
    VIDSTORE_CHECK(!hdr.encrypted);
    auto lines = vidstore::pipeline::DescribeHeader(hdr);
    VIDSTORE_CHECK(std::any_of(lines.begin(), lines.end(),
                               [](const std::string& l) { return l.find("640x384") != std::string::npos; }));

    auto dry = vidstore::pipeline::DryRun(payload, opts);
    VIDSTORE_CHECK(dry.verified);
    VIDSTORE_CHECK(dry.encode.frames == dry.decode.frames);
}

void TestParameterErrorsBeforeFrames() {
    struct CountingSink : vidstore::video::FrameSink {
        int writes = 0;
        void Write(const vidstore::frame::Frame&) override { ++writes; }
        void Close() override {}
    };
    auto rejects = [](EncodeOptions opts) {
        CountingSink sink;
        const bool thrown = vidstore_test::Throws<vidstore::ParameterError>(
            [&] { vidstore::pipeline::EncodeBytes(Bytes(10, 1), sink, opts); });
        return thrown && sink.writes == 0;
    };
    EncodeOptions levels = SmallOptions();
    levels.body.levels = 3;
    VIDSTORE_CHECK(rejects(levels));
    EncodeOptions block = SmallOptions();
    block.body.block_size = 7;
    VIDSTORE_CHECK(rejects(block));
    EncodeOptions ecc = SmallOptions();
    ecc.body.ecc_parity = 0;
    VIDSTORE_CHECK(rejects(ecc));
    EncodeOptions fps = SmallOptions();
    fps.fps = 0;
    VIDSTORE_CHECK(rejects(fps));
    EncodeOptions crf = SmallOptions();
    crf.crf = 99;
    VIDSTORE_CHECK(rejects(crf));
    EncodeOptions tiny = SmallOptions();
    tiny.width = 64;
    tiny.height = 64;
    VIDSTORE_CHECK(rejects(tiny));

    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>(
        [] { vidstore::cli::ParseEncodeArgs({"-i", "a", "-o", "b", "--resolution", "wide"}); }));
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>(
        [] { vidstore::cli::ParseEncodeArgs({"-i", "a", "-o", "b", "--levels", "four"}); }));
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::ParameterError>([] { vidstore::cli::ParseDecodeArgs({"-i", "a"}); }));
}

void TestConsoleHelpers() {
    vidstore::cli::SetColorsEnabled(false);
    VIDSTORE_CHECK(vidstore::cli::Green("yes") == "yes");
    VIDSTORE_CHECK(vidstore::cli::BoldRed("Error: ") == "Error: ");
    vidstore::cli::SetColorsEnabled(true);
    VIDSTORE_CHECK(vidstore::cli::Green("yes") == std::string("\033[0;32myes\033[0m"));
    VIDSTORE_CHECK(vidstore::cli::Dim("hint") == std::string("\033[0;90mhint\033[0m"));
    vidstore::cli::SetColorsEnabled(false);

    using vidstore::progress::ProgressReporter;
    VIDSTORE_CHECK(ProgressReporter::RenderBar(0.5, 10) == "(#####     )");
    VIDSTORE_CHECK(ProgressReporter::RenderBar(-1.0, 4) == "(    )");
    VIDSTORE_CHECK(ProgressReporter::RenderBar(2.0, 4) == "(####)");

    ProgressReporter silent("input.bin", false);
    silent.Update(0.5, "frames", 0.5);
}

void TestErrorKindsAndExitCodes() {
    using vidstore::ErrorKind;
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::Parameter) == 2);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::HeaderUnrecoverable) == 3);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::UncorrectableChunk) == 4);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::Authentication) == 5);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::ExternalProcess) == 6);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::Integrity) == 7);
    VIDSTORE_CHECK(vidstore::ExitCodeFor(ErrorKind::Io) == 8);
    VIDSTORE_CHECK(std::string(vidstore::ErrorKindName(ErrorKind::Authentication)) == "AuthenticationError");
    VIDSTORE_CHECK(vidstore::UncorrectableChunk(2, 510, 1).kind() == ErrorKind::UncorrectableChunk);
}

void TestFfmpegCommands() {
    vidstore::video::FfmpegBridge bridge("ffmpeg-test", "ffprobe-test");
    vidstore::video::EncodeSettings settings;
    settings.width = 1920;
    settings.height = 1080;
    settings.fps = 30;
    settings.crf = 18;
    auto enc = bridge.EncodeCommand("out.mp4", settings);
    auto has = [](const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
        for (std::size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag && args[i + 1] == value) {
                return true;
            }
        }
        return false;
    };
    VIDSTORE_CHECK(enc.front() == "ffmpeg-test");
    VIDSTORE_CHECK(enc.back() == "out.mp4");
    VIDSTORE_CHECK(has(enc, "-s", "1920x1080"));
    VIDSTORE_CHECK(has(enc, "-r", "30"));
    VIDSTORE_CHECK(has(enc, "-crf", "18"));
    VIDSTORE_CHECK(has(enc, "-c:v", "libx264"));
    VIDSTORE_CHECK(has(enc, "-pix_fmt", "yuv444p"));
    VIDSTORE_CHECK(has(enc, "-i", "-"));

    auto dec = bridge.DecodeCommand("in.mp4");
    VIDSTORE_CHECK(has(dec, "-i", "in.mp4"));
    VIDSTORE_CHECK(has(dec, "-pix_fmt", "rgb24"));
    VIDSTORE_CHECK(has(dec, "-f", "rawvideo"));
    VIDSTORE_CHECK(dec.back() == "-");

    VIDSTORE_CHECK(vidstore::video::ParseRate("30000/1001") > 29.9);
    VIDSTORE_CHECK(vidstore::video::ParseRate("25") == 25.0);
    VIDSTORE_CHECK(vidstore::video::ParseRate("0/0") == 0.0);
}

}  // namespace

int main() {
    vidstore_test::Run("round trip parameter sets", TestRoundTripParameterSets);
    vidstore_test::Run("100 bytes fit one frame", TestHundredBytesFitOneFrame);
    vidstore_test::Run("encrypted and compressed", TestEncryptedAndCompressed);
    vidstore_test::Run("password for plain video", TestPasswordForPlainVideo);
    vidstore_test::Run("noisy frames recover", TestNoisyFramesRecover);
    vidstore_test::Run("header decides parameters", TestHeaderDecidesParameters);
    vidstore_test::Run("frame sequence damage", TestFrameSequenceDamage);
    vidstore_test::Run("mass corruption names frame", TestMassCorruptionNamesFrame);
    vidstore_test::Run("destroyed header", TestDestroyedHeader);
    vidstore_test::Run("decode file atomic", TestDecodeFileAtomic);
    vidstore_test::Run("declared length bounds inflate", TestDeclaredLengthBoundsInflate);
    vidstore_test::Run("inspect and dry run", TestInspectAndDryRun);
    vidstore_test::Run("parameter errors before frames", TestParameterErrorsBeforeFrames);
    vidstore_test::Run("console helpers", TestConsoleHelpers);
    vidstore_test::Run("error kinds and exit codes", TestErrorKindsAndExitCodes);
    vidstore_test::Run("ffmpeg commands", TestFfmpegCommands);
    return vidstore_test::Summary("test_pipeline");
}
