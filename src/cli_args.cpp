#include "vidstore/cli_args.hpp"

#include "vidstore/errors.hpp"

#include <cctype>
#include <stdexcept>

namespace vidstore::cli {

namespace {

const std::string& Value(const std::vector<std::string>& args, std::size_t& idx) {
    if (idx + 1 >= args.size()) {
        throw ParameterError("Missing value for " + args[idx]);
    }
    idx += 2;
    return args[idx - 1];
}

int ParseInt(const std::string& flag, const std::string& value) {
    if (value.empty() || !(std::isdigit(static_cast<unsigned char>(value[0])) || value[0] == '-')) {
        throw ParameterError("Invalid value for " + flag + ": " + value);
    }
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ParameterError("Invalid value for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ParameterError("Invalid value for " + flag + ": " + value);
    }
}

bool ParseCommon(const std::string& flag, CommonFlags& common) {
    if (flag == "-q" || flag == "--quiet") {
        common.quiet = true;
    } else if (flag == "-v" || flag == "--verbose") {
        common.verbose = true;
    } else if (flag == "--no-color") {
        common.no_color = true;
    } else {
        return false;
    }
    return true;
}

bool IsBodyFlag(const std::string& flag) {
    return flag == "--block-size" || flag == "--levels" || flag == "--ecc" || flag == "--fps" ||
           flag == "--crf" || flag == "--resolution";
}

}  // namespace

bool ParseResolution(const std::string& text, int& width, int& height) {
    auto pos = text.find_first_of("xX");
    if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
        return false;
    }
    try {
        std::size_t used_w = 0;
        std::size_t used_h = 0;
        const std::string w = text.substr(0, pos);
        const std::string h = text.substr(pos + 1);
        if (!std::isdigit(static_cast<unsigned char>(w[0])) || !std::isdigit(static_cast<unsigned char>(h[0]))) {
            return false;
        }
        int pw = std::stoi(w, &used_w);
        int ph = std::stoi(h, &used_h);
        if (used_w != w.size() || used_h != h.size()) {
            return false;
        }
        width = pw;
        height = ph;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

EncodeArgs ParseEncodeArgs(const std::vector<std::string>& args) {
    EncodeArgs out;
    std::size_t idx = 0;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-i" || flag == "--input") {
            out.input = Value(args, idx);
        } else if (flag == "-o" || flag == "--output") {
            out.output = Value(args, idx);
        } else if (flag == "-p" || flag == "--password") {
            out.options.password = Value(args, idx);
        } else if (flag == "--block-size") {
            out.options.body.block_size = ParseInt(flag, Value(args, idx));
        } else if (flag == "--levels") {
            out.options.body.levels = ParseInt(flag, Value(args, idx));
        } else if (flag == "--ecc") {
            out.options.body.ecc_parity = ParseInt(flag, Value(args, idx));
        } else if (flag == "--fps") {
            out.options.fps = ParseInt(flag, Value(args, idx));
        } else if (flag == "--crf") {
            out.options.crf = ParseInt(flag, Value(args, idx));
        } else if (flag == "--resolution") {
            const std::string& value = Value(args, idx);
            if (!ParseResolution(value, out.options.width, out.options.height)) {
                throw ParameterError("Invalid resolution (expected WxH): " + value);
            }
        } else if (flag == "--compress") {
            out.options.compress = true;
            ++idx;
        } else if (flag == "--dry-run") {
            out.dry_run = true;
            ++idx;
        } else if (ParseCommon(flag, out.common)) {
            ++idx;
        } else {
            throw ParameterError("Unknown flag: " + flag);
        }
    }
    if (out.input.empty()) {
        throw ParameterError("Missing input path (-i)");
    }
    if (out.output.empty() && !out.dry_run) {
        throw ParameterError("Missing output path (-o)");
    }
    return out;
}

DecodeArgs ParseDecodeArgs(const std::vector<std::string>& args) {
    DecodeArgs out;
    std::size_t idx = 0;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-i" || flag == "--input") {
            out.input = Value(args, idx);
        } else if (flag == "-o" || flag == "--output") {
            out.output = Value(args, idx);
        } else if (flag == "-p" || flag == "--password") {
            out.options.password = Value(args, idx);
        } else if (IsBodyFlag(flag)) {
            Value(args, idx);
            out.ignored_flags.push_back(flag);
        } else if (ParseCommon(flag, out.common)) {
            ++idx;
        } else {
            throw ParameterError("Unknown flag: " + flag);
        }
    }
    if (out.input.empty()) {
        throw ParameterError("Missing input path (-i)");
    }
    if (out.output.empty()) {
        throw ParameterError("Missing output path (-o)");
    }
    return out;
}

InfoArgs ParseInfoArgs(const std::vector<std::string>& args) {
    InfoArgs out;
    std::size_t idx = 0;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-i" || flag == "--input") {
            out.input = Value(args, idx);
        } else if (ParseCommon(flag, out.common)) {
            ++idx;
        } else if (out.input.empty() && !flag.empty() && flag[0] != '-') {
            out.input = flag;
            ++idx;
        } else {
            throw ParameterError("Unknown flag: " + flag);
        }
    }
    if (out.input.empty()) {
        throw ParameterError("Missing input path (-i)");
    }
    return out;
}

}  // namespace vidstore::cli
