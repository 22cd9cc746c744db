#include "vidstore/pipeline.hpp"

#include "vidstore/assembler.hpp"
#include "vidstore/compression.hpp"
#include "vidstore/crypto.hpp"
#include "vidstore/ecc.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/fileio.hpp"
#include "vidstore/log.hpp"
#include "vidstore/parallel.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>

namespace vidstore::pipeline {

namespace {

std::size_t Workers(std::size_t requested) {
    return requested > 0 ? requested : parallel::ResolveWorkers(std::numeric_limits<std::size_t>::max());
}

void Report(const ProgressFn& progress, double overall, const std::string& stage, double stage_fraction) {
    if (progress) {
        progress(overall, stage, stage_fraction);
    }
}

std::string Hex(const Bytes& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::uint8_t b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string HumanBytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return oss.str();
}

}  // namespace

frame::FrameLayout ValidateEncodeOptions(const EncodeOptions& options) {
    if (options.fps <= 0) {
        throw ParameterError("fps must be positive, got " + std::to_string(options.fps));
    }
    if (options.crf < 0 || options.crf > constants::kMaxCrf) {
        throw ParameterError("crf must be in [0, " + std::to_string(constants::kMaxCrf) + "], got " +
                             std::to_string(options.crf));
    }
    if (options.kdf && !options.password.empty() && !cipher::KdfSupported(options.kdf->kind)) {
        throw ParameterError(std::string("key derivation ") + cipher::KdfName(options.kdf->kind) +
                             " is not available in this build");
    }
    return frame::FrameLayout(options.width, options.height, options.body);
}

video::EncodeSettings SettingsFor(const EncodeOptions& options) {
    video::EncodeSettings settings;
    settings.width = options.width;
    settings.height = options.height;
    settings.fps = options.fps;
    settings.crf = options.crf;
    return settings;
}

EncodeReport EncodeBytes(const Bytes& payload, video::FrameSink& sink, const EncodeOptions& options) {
    const frame::FrameLayout layout = ValidateEncodeOptions(options);
    const std::size_t workers = Workers(options.workers);

    header::Header hdr;
    hdr.block_size = options.body.block_size;
    hdr.levels = options.body.levels;
    hdr.ecc_parity = options.body.ecc_parity;
    hdr.width = options.width;
    hdr.height = options.height;
    hdr.payload_length = payload.size();
    hdr.payload_sha256 = crypto::Sha256(payload);
    hdr.compressed = options.compress;

    Report(options.progress, 0.0, "prepare", 0.0);
    Bytes stream = options.compress ? compression::Deflate(payload) : payload;
    if (options.compress) {
        log::Debug("compressed " + std::to_string(payload.size()) + " -> " + std::to_string(stream.size()) + " bytes");
    }
    cipher::SealedPayload sealed = options.kdf ? cipher::Encrypt(stream, options.password, *options.kdf)
                                               : cipher::Encrypt(stream, options.password);
    stream.clear();
    stream.shrink_to_fit();
    hdr.encrypted = sealed.encrypted;
    if (sealed.encrypted) {
        hdr.kdf = sealed.kdf;
        hdr.salt = sealed.salt;
        hdr.nonce = sealed.nonce;
    }
    hdr.stream_length = sealed.data.size();
    Report(options.progress, 0.1, "encrypt", 1.0);

    const Bytes body = ecc::ProtectAll(sealed.data, static_cast<std::size_t>(hdr.ecc_parity), workers);
    Report(options.progress, 0.2, "ecc", 1.0);

    const std::size_t frames = layout.FrameCount(body.size());
    if (frames > std::numeric_limits<std::uint32_t>::max()) {
        throw ParameterError("payload needs more frames than the format can describe");
    }
    hdr.frame_count = static_cast<std::uint32_t>(frames);

    frame::FrameAssembler assembler(hdr, body, workers);
    log::Debug("layout " + std::to_string(layout.blocks_per_row()) + "x" + std::to_string(layout.block_rows()) +
               " blocks, " + std::to_string(layout.bits_per_block()) + " bits/block, " +
               std::to_string(layout.reserved_blocks()) + " reserved");
    for (std::size_t i = 0; i < frames; ++i) {
        sink.Write(assembler.Render(i));
        const double done = static_cast<double>(i + 1) / static_cast<double>(frames);
        Report(options.progress, 0.2 + 0.75 * done, "frames", done);
    }
    sink.Close();
    Report(options.progress, 1.0, "done", 1.0);

    EncodeReport report;
    report.header = hdr;
    report.frames = frames;
    report.stream_bytes = sealed.data.size();
    report.protected_bytes = body.size();
    report.capacity_bytes = layout.Capacity(frames);
    return report;
}

EncodeReport EncodeFile(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        video::VideoBridge& bridge,
                        const EncodeOptions& options) {
    ValidateEncodeOptions(options);
    const Bytes payload = fileio::ReadFileBytes(input);
    log::Info("encoding " + input.filename().string() + " (" + HumanBytes(payload.size()) + ")");
    auto sink = bridge.OpenSink(output, SettingsFor(options));
    try {
        EncodeReport report = EncodeBytes(payload, *sink, options);
        sink.reset();
        return report;
    } catch (const std::exception&) {
        sink.reset();
        std::error_code ignored;
        std::filesystem::remove(output, ignored);
        throw;
    }
}

Bytes DecodeBytes(video::FrameSource& source, const DecodeOptions& options, DecodeReport* report) {
    const std::size_t workers = Workers(options.workers);
    Report(options.progress, 0.0, "header", 0.0);

    std::optional<frame::Frame> first = source.Next();
    if (!first) {
        throw ExternalProcessError("video contains no frames");
    }
    const header::Header hdr = header::Read(*first);
    log::Debug("header: block " + std::to_string(hdr.block_size) + ", levels " + std::to_string(hdr.levels) +
               ", ecc " + std::to_string(hdr.ecc_parity) + ", " + std::to_string(hdr.frame_count) + " frames");

    if (hdr.encrypted && options.password.empty()) {
        throw ParameterError("video is encrypted; a password is required");
    }
    if (!hdr.encrypted && !options.password.empty()) {
        throw ParameterError("video is not encrypted but a password was given");
    }
    if (hdr.encrypted && !cipher::KdfSupported(hdr.kdf.kind)) {
        throw ParameterError(std::string("video uses ") + cipher::KdfName(hdr.kdf.kind) +
                             " which is not available in this build");
    }

    frame::FrameDisassembler disassembler(hdr, workers);
    const double total = static_cast<double>(disassembler.expected_frames());
    disassembler.Consume(*first);
    first.reset();
    Report(options.progress, 0.75 / total, "frames", 1.0 / total);
    while (auto next = source.Next()) {
        disassembler.Consume(*next);
        const double done = static_cast<double>(disassembler.frames_consumed()) / total;
        Report(options.progress, 0.75 * std::min(done, 1.0), "frames", std::min(done, 1.0));
    }
    const Bytes body = disassembler.TakeBody();

    const frame::FrameLayout& layout = disassembler.layout();
    ecc::RecoveryReport recovery = ecc::RecoverAll(
        body, static_cast<std::size_t>(hdr.ecc_parity), static_cast<std::size_t>(hdr.stream_length), workers,
        [&layout](std::size_t offset) { return layout.FrameOfByte(offset); });
    Report(options.progress, 0.85, "ecc", 1.0);
    if (recovery.total_corrected > 0) {
        log::Info("corrected " + std::to_string(recovery.total_corrected) + " symbols in " +
                  std::to_string(recovery.chunks_with_errors) + " chunks");
    }

    cipher::SealedPayload sealed;
    sealed.data = std::move(recovery.stream);
    sealed.encrypted = hdr.encrypted;
    sealed.salt = hdr.salt;
    sealed.nonce = hdr.nonce;
    sealed.kdf = hdr.kdf;
    Bytes payload = cipher::Decrypt(sealed, options.password);
    Report(options.progress, 0.95, "decrypt", 1.0);
    if (hdr.compressed) {
        payload = compression::Inflate(payload, static_cast<std::size_t>(hdr.payload_length));
    }

    if (payload.size() != hdr.payload_length) {
        throw IntegrityError("payload length " + std::to_string(payload.size()) + " differs from declared " +
                             std::to_string(hdr.payload_length));
    }
    if (crypto::Sha256(payload) != hdr.payload_sha256) {
        throw IntegrityError("payload digest mismatch");
    }
    Report(options.progress, 1.0, "done", 1.0);

    if (report) {
        report->header = hdr;
        report->frames = disassembler.frames_consumed();
        report->chunks = recovery.corrected.size();
        report->chunks_with_errors = recovery.chunks_with_errors;
        report->corrected_symbols = recovery.total_corrected;
    }
    return payload;
}

DecodeReport DecodeFile(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        video::VideoBridge& bridge,
                        const DecodeOptions& options) {
    auto source = bridge.OpenSource(input);
    DecodeReport report;
    Bytes payload = DecodeBytes(*source, options, &report);
    source.reset();
    fileio::WriteFileAtomic(output, payload);
    log::Info("decoded " + HumanBytes(payload.size()) + " from " + std::to_string(report.frames) + " frames");
    return report;
}

header::Header InspectVideo(const std::filesystem::path& input, video::VideoBridge& bridge) {
    auto source = bridge.OpenSource(input);
    std::optional<frame::Frame> first = source->Next();
    if (!first) {
        throw ExternalProcessError("video contains no frames");
    }
    return header::Read(*first);
}

DryRunReport DryRun(const Bytes& payload, const EncodeOptions& options) {
    video::MemoryBridge bridge;
    const std::filesystem::path key = "dry-run";
    DryRunReport report;
    {
        auto sink = bridge.OpenSink(key, SettingsFor(options));
        EncodeOptions quiet = options;
        quiet.progress = nullptr;
        report.encode = EncodeBytes(payload, *sink, quiet);
    }
    auto source = bridge.OpenSource(key);
    DecodeOptions decode;
    decode.password = options.password;
    decode.workers = options.workers;
    Bytes restored = DecodeBytes(*source, decode, &report.decode);
    report.verified = restored == payload;
    return report;
}

std::vector<std::string> DescribeHeader(const header::Header& hdr) {
    std::vector<std::string> lines;
    lines.push_back("format version: " + std::to_string(hdr.version));
    lines.push_back("resolution:     " + std::to_string(hdr.width) + "x" + std::to_string(hdr.height));
    lines.push_back("block size:     " + std::to_string(hdr.block_size));
    lines.push_back("levels:         " + std::to_string(hdr.levels));
    lines.push_back("ecc parity:     " + std::to_string(hdr.ecc_parity));
    lines.push_back("payload:        " + std::to_string(hdr.payload_length) + " bytes (" +
                    HumanBytes(hdr.payload_length) + ")");
    lines.push_back("stream:         " + std::to_string(hdr.stream_length) + " bytes");
    lines.push_back("frames:         " + std::to_string(hdr.frame_count));
    lines.push_back(std::string("compressed:     ") + (hdr.compressed ? "yes" : "no"));
    if (hdr.encrypted) {
        lines.push_back(std::string("encrypted:      yes (") + cipher::KdfName(hdr.kdf.kind) + ", cost " +
                        std::to_string(hdr.kdf.cost_a) +
                        (hdr.kdf.kind == cipher::KdfKind::Argon2id ? "/" + std::to_string(hdr.kdf.cost_b) + " KiB"
                                                                   : std::string()) +
                        ")");
    } else {
        lines.push_back("encrypted:      no");
    }
    lines.push_back("sha256:         " + Hex(hdr.payload_sha256));
    return lines;
}

}  // namespace vidstore::pipeline
