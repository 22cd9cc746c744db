#include "vidstore/fileio.hpp"

#include "vidstore/errors.hpp"

#include <fstream>
#include <random>
#include <string>
#include <system_error>

namespace vidstore::fileio {

Bytes ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw IoError("Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw IoError("Failed to read file: " + path.string());
        }
    }
    return data;
}

std::filesystem::path TempSibling(const std::filesystem::path& path) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::string name = "." + path.stem().string() + ".part-" + std::to_string(gen() & 0xFFFFFFu) +
                       path.extension().string();
    return path.parent_path() / name;
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    const std::filesystem::path temp = TempSibling(path);
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw IoError("Failed to open output file: " + temp.string());
        }
        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.flush();
        if (!output) {
            output.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw IoError("Failed to write output file: " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw IoError("Failed to move output into place: " + path.string() + " (" + ec.message() + ")");
    }
}

}  // namespace vidstore::fileio
