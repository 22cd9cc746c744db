#include "vidstore/compression.hpp"

#include "vidstore/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace vidstore::compression {

Bytes Deflate(const Bytes& input, int level) {
    if (input.size() > std::numeric_limits<uLong>::max()) {
        throw ParameterError("input too large for zlib");
    }
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    Bytes out(static_cast<std::size_t>(bound));
    int rc = compress2(out.data(), &bound, input.data(), static_cast<uLong>(input.size()), level);
    if (rc != Z_OK) {
        throw std::runtime_error("zlib compress failed: " + std::to_string(rc));
    }
    out.resize(static_cast<std::size_t>(bound));
    return out;
}

namespace {

Bytes InflateBounded(const Bytes& input, std::size_t limit) {
    if (input.empty()) {
        throw IntegrityError("compressed payload is empty");
    }
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }
    Bytes out;
    std::array<std::uint8_t, 16384> buffer{};
    std::size_t offset = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0 && offset < input.size()) {
            std::size_t take = std::min<std::size_t>(input.size() - offset, std::numeric_limits<uInt>::max());
            zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data() + offset));
            zs.avail_in = static_cast<uInt>(take);
            offset += take;
        }
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw IntegrityError("compressed payload is corrupt");
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        if (produced > limit - out.size()) {
            inflateEnd(&zs);
            throw IntegrityError("decompressed payload exceeds " + std::to_string(limit) + " bytes");
        }
        if (produced > 0) {
            out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        }
        if (rc == Z_OK && produced == 0 && zs.avail_in == 0 && offset >= input.size()) {
            inflateEnd(&zs);
            throw IntegrityError("compressed payload is truncated");
        }
    }
    inflateEnd(&zs);
    return out;
}

}  // namespace

Bytes Inflate(const Bytes& input) {
    return InflateBounded(input, std::numeric_limits<std::size_t>::max());
}

Bytes Inflate(const Bytes& input, std::size_t expected_size) {
    Bytes out = InflateBounded(input, expected_size);
    if (out.size() != expected_size) {
        throw IntegrityError("decompressed payload is " + std::to_string(out.size()) + " bytes, expected " +
                             std::to_string(expected_size));
    }
    return out;
}

}  // namespace vidstore::compression
