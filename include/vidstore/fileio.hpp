#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace vidstore::fileio {

using Bytes = std::vector<std::uint8_t>;

Bytes ReadFileBytes(const std::filesystem::path& path);

// Writes a sibling temporary file and renames it over `path`; `path` is untouched on failure.
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);

// Hidden sibling name used for in-progress writes, keeping the extension.
std::filesystem::path TempSibling(const std::filesystem::path& path);

}  // namespace vidstore::fileio
