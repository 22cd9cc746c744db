#pragma once

#include "vidstore/pipeline.hpp"

#include <string>
#include <vector>

namespace vidstore::cli {

struct CommonFlags {
    bool quiet = false;
    bool verbose = false;
    bool no_color = false;
};

struct EncodeArgs {
    std::string input;
    std::string output;
    pipeline::EncodeOptions options;
    bool dry_run = false;
    CommonFlags common;
};

struct DecodeArgs {
    std::string input;
    std::string output;
    pipeline::DecodeOptions options;
    // Body parameter flags given on the command line; the header decides these.
    std::vector<std::string> ignored_flags;
    CommonFlags common;
};

struct InfoArgs {
    std::string input;
    CommonFlags common;
};

// `args` holds everything after the subcommand. Throws ParameterError on bad usage.
EncodeArgs ParseEncodeArgs(const std::vector<std::string>& args);
DecodeArgs ParseDecodeArgs(const std::vector<std::string>& args);
InfoArgs ParseInfoArgs(const std::vector<std::string>& args);

bool ParseResolution(const std::string& text, int& width, int& height);

}  // namespace vidstore::cli
