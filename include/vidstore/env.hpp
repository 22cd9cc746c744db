#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace vidstore::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Positive integer from the environment; unset, zero or malformed values yield the fallback.
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t fallback);

}  // namespace vidstore::env
