#include "vidstore/cli_args.hpp"
#include "vidstore/cli_colors.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/fileio.hpp"
#include "vidstore/log.hpp"
#include "vidstore/pipeline.hpp"
#include "vidstore/progress.hpp"
#include "vidstore/video.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  vidstore_cli encode -i <input> -o <output.mp4> [-p <password>] [--block-size N] [--levels N]\n"
                 "                      [--ecc N] [--fps N] [--crf N] [--resolution WxH] [--compress] [--dry-run]\n";
    std::cout << "  vidstore_cli decode -i <input.mp4> -o <output> [-p <password>]\n";
    std::cout << "  vidstore_cli info -i <input.mp4>\n";
    std::cout << "Common flags: --quiet, --verbose, --no-color\n";
}

void ApplyCommon(const vidstore::cli::CommonFlags& common) {
    if (common.no_color) {
        vidstore::cli::SetColorsEnabled(false);
    }
    if (common.verbose) {
        vidstore::log::SetLevel(vidstore::log::Level::Debug);
    } else if (common.quiet) {
        vidstore::log::SetLevel(vidstore::log::Level::Warn);
    }
}

bool WantProgress(const vidstore::cli::CommonFlags& common) {
    return !common.quiet && isatty(fileno(stderr)) != 0 &&
           vidstore::log::CurrentLevel() <= vidstore::log::Level::Info;
}

const char* HintFor(vidstore::ErrorKind kind) {
    switch (kind) {
    case vidstore::ErrorKind::HeaderUnrecoverable:
        return "the first frame is too damaged to read the header";
    case vidstore::ErrorKind::UncorrectableChunk:
        return "re-encode with a larger --ecc or --block-size, or fewer --levels";
    case vidstore::ErrorKind::Authentication:
        return "check the password";
    case vidstore::ErrorKind::ExternalProcess:
        return "check that ffmpeg and ffprobe are installed and the video is intact";
    case vidstore::ErrorKind::Parameter:
        return "run without arguments for usage";
    case vidstore::ErrorKind::Integrity:
        return "the recovered data does not match the original; re-encode with stronger parameters";
    case vidstore::ErrorKind::Io:
        break;
    }
    return nullptr;
}

int RunEncode(const std::vector<std::string>& args) {
    vidstore::cli::EncodeArgs parsed = vidstore::cli::ParseEncodeArgs(args);
    ApplyCommon(parsed.common);
    std::unique_ptr<vidstore::progress::ProgressReporter> progress;
    if (WantProgress(parsed.common)) {
        progress = std::make_unique<vidstore::progress::ProgressReporter>(parsed.input);
        parsed.options.progress = [&progress](double overall, const std::string& stage, double fraction) {
            progress->Update(overall, stage, fraction);
        };
    }
    if (parsed.dry_run) {
        vidstore::pipeline::Bytes payload = vidstore::fileio::ReadFileBytes(parsed.input);
        vidstore::pipeline::DryRunReport report = vidstore::pipeline::DryRun(payload, parsed.options);
        for (const auto& line : vidstore::pipeline::DescribeHeader(report.encode.header)) {
            std::cout << line << "\n";
        }
        std::cout << "capacity:       " << report.encode.capacity_bytes << " bytes in "
                  << report.encode.frames << " frames\n";
        std::cout << "verified:       "
                  << (report.verified ? vidstore::cli::Green("yes") : vidstore::cli::BoldRed("no")) << "\n";
        return report.verified ? 0 : vidstore::ExitCodeFor(vidstore::ErrorKind::Integrity);
    }
    vidstore::video::FfmpegBridge bridge;
    vidstore::pipeline::EncodeReport report =
        vidstore::pipeline::EncodeFile(parsed.input, parsed.output, bridge, parsed.options);
    progress.reset();
    vidstore::log::Info("wrote " + std::to_string(report.frames) + " frames");
    std::cout << parsed.output << "\n";
    return 0;
}

int RunDecode(const std::vector<std::string>& args) {
    vidstore::cli::DecodeArgs parsed = vidstore::cli::ParseDecodeArgs(args);
    ApplyCommon(parsed.common);
    for (const auto& flag : parsed.ignored_flags) {
        vidstore::log::Warn(flag + " is ignored when decoding; the video header defines it");
    }
    std::unique_ptr<vidstore::progress::ProgressReporter> progress;
    if (WantProgress(parsed.common)) {
        progress = std::make_unique<vidstore::progress::ProgressReporter>(parsed.input);
        parsed.options.progress = [&progress](double overall, const std::string& stage, double fraction) {
            progress->Update(overall, stage, fraction);
        };
    }
    vidstore::video::FfmpegBridge bridge;
    vidstore::pipeline::DecodeFile(parsed.input, parsed.output, bridge, parsed.options);
    progress.reset();
    std::cout << parsed.output << "\n";
    return 0;
}

int RunInfo(const std::vector<std::string>& args) {
    vidstore::cli::InfoArgs parsed = vidstore::cli::ParseInfoArgs(args);
    ApplyCommon(parsed.common);
    vidstore::video::FfmpegBridge bridge;
    vidstore::header::Header header = vidstore::pipeline::InspectVideo(parsed.input, bridge);
    for (const auto& line : vidstore::pipeline::DescribeHeader(header)) {
        std::cout << line << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    std::vector<std::string> args(argv + 2, argv + argc);
    try {
        if (command == "encode") {
            return RunEncode(args);
        }
        if (command == "decode") {
            return RunDecode(args);
        }
        if (command == "info") {
            return RunInfo(args);
        }
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const vidstore::Error& exc) {
        std::cerr << vidstore::cli::BoldRed("Error: ") << exc.what() << "\n";
        if (const char* hint = HintFor(exc.kind())) {
            std::cerr << vidstore::cli::Dim(std::string("hint: ") + hint) << "\n";
        }
        return vidstore::ExitCodeFor(exc.kind());
    } catch (const std::exception& exc) {
        std::cerr << vidstore::cli::BoldRed("Error: ") << exc.what() << "\n";
        return 1;
    }
}
