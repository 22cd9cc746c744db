#include "vidstore/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace vidstore::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUnsigned(std::string_view name, std::uint64_t fallback) {
    std::string raw = Get(name);
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        std::uint64_t parsed = static_cast<std::uint64_t>(std::stoull(raw, &consumed));
        if (consumed != raw.size() || parsed == 0) {
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace vidstore::env
