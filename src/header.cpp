#include "vidstore/header.hpp"

#include "vidstore/bitstream.hpp"
#include "vidstore/blockmap.hpp"
#include "vidstore/constants.hpp"
#include "vidstore/ecc.hpp"
#include "vidstore/errors.hpp"

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>

namespace vidstore::header {

namespace {

void WriteBe(Bytes& out, std::uint64_t value, int width) {
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

std::uint64_t ReadBe(const Bytes& data, std::size_t offset, int width) {
    std::uint64_t value = 0;
    for (int i = 0; i < width; ++i) {
        value = (value << 8) | data[offset + static_cast<std::size_t>(i)];
    }
    return value;
}

void Require(bool ok, const std::string& what) {
    if (!ok) {
        throw HeaderUnrecoverable(what);
    }
}

Bytes Slice(const Bytes& data, std::size_t offset, std::size_t len) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset),
                 data.begin() + static_cast<std::ptrdiff_t>(offset + len));
}

std::optional<Header> TryCodeword(ecc::ReedSolomon& rs, const std::uint8_t* codeword) {
    auto chunk = rs.Decode(codeword, constants::kHeaderCodewordLen);
    if (!chunk) {
        return std::nullopt;
    }
    try {
        return Parse(chunk->data);
    } catch (const HeaderUnrecoverable&) {
        return std::nullopt;
    }
}

}  // namespace

frame::BodyParams Header::body() const {
    frame::BodyParams params;
    params.block_size = block_size;
    params.levels = levels;
    params.ecc_parity = ecc_parity;
    return params;
}

Bytes Serialize(const Header& header) {
    if (header.payload_sha256.size() != constants::kSha256Len) {
        throw ParameterError("header digest must be 32 bytes");
    }
    Bytes out;
    out.reserve(constants::kHeaderFixedLen + constants::kHeaderCipherLen);
    out.insert(out.end(), constants::kMagic.begin(), constants::kMagic.end());
    out.push_back(header.version);
    std::uint8_t flags = 0;
    if (header.encrypted) flags |= constants::kFlagEncrypted;
    if (header.compressed) flags |= constants::kFlagCompressed;
    out.push_back(flags);
    out.push_back(static_cast<std::uint8_t>(header.block_size));
    WriteBe(out, static_cast<std::uint64_t>(header.levels), 2);
    out.push_back(static_cast<std::uint8_t>(header.ecc_parity));
    WriteBe(out, static_cast<std::uint64_t>(header.width), 2);
    WriteBe(out, static_cast<std::uint64_t>(header.height), 2);
    WriteBe(out, header.payload_length, 8);
    WriteBe(out, header.stream_length, 8);
    WriteBe(out, header.frame_count, 4);
    out.insert(out.end(), header.payload_sha256.begin(), header.payload_sha256.end());
    if (header.encrypted) {
        if (header.salt.size() != constants::kSaltLen || header.nonce.size() != constants::kNonceLen) {
            throw ParameterError("header salt or nonce has the wrong length");
        }
        out.push_back(static_cast<std::uint8_t>(header.kdf.kind));
        WriteBe(out, header.kdf.cost_a, 4);
        WriteBe(out, header.kdf.cost_b, 4);
        out.insert(out.end(), header.salt.begin(), header.salt.end());
        out.insert(out.end(), header.nonce.begin(), header.nonce.end());
    }
    return out;
}

Header Parse(const Bytes& data) {
    Require(data.size() >= constants::kHeaderFixedLen, "header too short");
    Require(std::equal(constants::kMagic.begin(), constants::kMagic.end(), data.begin()), "bad magic");
    Header h;
    h.version = data[4];
    Require(h.version == constants::kFormatVersion, "unsupported format version " + std::to_string(h.version));
    const std::uint8_t flags = data[5];
    Require((flags & ~(constants::kFlagEncrypted | constants::kFlagCompressed)) == 0, "unknown header flags");
    h.encrypted = (flags & constants::kFlagEncrypted) != 0;
    h.compressed = (flags & constants::kFlagCompressed) != 0;
    h.block_size = data[6];
    h.levels = static_cast<int>(ReadBe(data, 7, 2));
    h.ecc_parity = data[9];
    h.width = static_cast<int>(ReadBe(data, 10, 2));
    h.height = static_cast<int>(ReadBe(data, 12, 2));
    h.payload_length = ReadBe(data, 14, 8);
    h.stream_length = ReadBe(data, 22, 8);
    h.frame_count = static_cast<std::uint32_t>(ReadBe(data, 30, 4));
    h.payload_sha256 = Slice(data, 34, constants::kSha256Len);

    std::size_t offset = constants::kHeaderFixedLen;
    if (h.encrypted) {
        Require(data.size() >= offset + constants::kHeaderCipherLen, "header cipher fields truncated");
        const std::uint8_t kdf_id = data[offset];
        Require(kdf_id == static_cast<std::uint8_t>(cipher::KdfKind::Pbkdf2) ||
                    kdf_id == static_cast<std::uint8_t>(cipher::KdfKind::Argon2id),
                "unknown key derivation id " + std::to_string(kdf_id));
        h.kdf.kind = static_cast<cipher::KdfKind>(kdf_id);
        h.kdf.cost_a = static_cast<std::uint32_t>(ReadBe(data, offset + 1, 4));
        h.kdf.cost_b = static_cast<std::uint32_t>(ReadBe(data, offset + 5, 4));
        if (h.kdf.kind == cipher::KdfKind::Pbkdf2) {
            Require(h.kdf.cost_a > 0 && h.kdf.cost_a <= constants::kMaxPbkdf2Iterations,
                    "PBKDF2 iteration count " + std::to_string(h.kdf.cost_a) + " out of range");
        } else {
            Require(h.kdf.cost_a > 0 && h.kdf.cost_a <= constants::kMaxArgon2TimeCost,
                    "Argon2id time cost " + std::to_string(h.kdf.cost_a) + " out of range");
            Require(h.kdf.cost_b >= 8 && h.kdf.cost_b <= constants::kMaxArgon2MemoryCost,
                    "Argon2id memory cost " + std::to_string(h.kdf.cost_b) + " KiB out of range");
        }
        h.salt = Slice(data, offset + 9, constants::kSaltLen);
        h.nonce = Slice(data, offset + 9 + constants::kSaltLen, constants::kNonceLen);
        offset += constants::kHeaderCipherLen;
        Require(h.stream_length >= constants::kTagLen, "encrypted stream shorter than its tag");
    }
    Require(std::all_of(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end(),
                        [](std::uint8_t b) { return b == 0; }),
            "trailing bytes after header");
    if (!h.encrypted && !h.compressed) {
        Require(h.stream_length == h.payload_length, "stream length disagrees with payload length");
    }

    try {
        frame::FrameLayout layout(h.width, h.height, h.body());
        const std::size_t expected = layout.FrameCount(
            ecc::ProtectedSize(static_cast<std::size_t>(h.stream_length), static_cast<std::size_t>(h.ecc_parity)));
        Require(expected == h.frame_count, "frame count disagrees with stream length");
    } catch (const ParameterError& ex) {
        throw HeaderUnrecoverable(std::string("inconsistent body parameters: ") + ex.what());
    }
    return h;
}

std::size_t ProtectedSize() {
    return constants::kHeaderCodewordLen * constants::kHeaderCopies;
}

std::size_t BandBlocks() {
    const std::size_t bits = ProtectedSize() * 8;
    const std::size_t per = 3;  // levels 2: one bit per channel
    return (bits + per - 1) / per;
}

int BandHeight(int width) {
    const int per_row = width / constants::kHeaderBlockSize;
    if (per_row <= 0) {
        return 0;
    }
    const std::size_t rows = (BandBlocks() + static_cast<std::size_t>(per_row) - 1) / static_cast<std::size_t>(per_row);
    return static_cast<int>(rows) * constants::kHeaderBlockSize;
}

Bytes Protect(const Header& header) {
    Bytes plain = Serialize(header);
    if (plain.size() > constants::kHeaderCapacity) {
        throw ParameterError("serialized header exceeds capacity");
    }
    plain.resize(constants::kHeaderCapacity, 0);
    ecc::ReedSolomon rs(constants::kHeaderParity);
    Bytes codeword = rs.Encode(plain.data(), plain.size());
    Bytes out;
    out.reserve(ProtectedSize());
    for (std::size_t copy = 0; copy < constants::kHeaderCopies; ++copy) {
        out.insert(out.end(), codeword.begin(), codeword.end());
    }
    return out;
}

Header Recover(const Bytes& protected_bytes) {
    if (protected_bytes.size() < ProtectedSize()) {
        throw HeaderUnrecoverable("header band truncated");
    }
    const std::size_t len = constants::kHeaderCodewordLen;
    const std::uint8_t* a = protected_bytes.data();
    const std::uint8_t* b = a + len;
    const std::uint8_t* c = b + len;

    Bytes voted(len);
    for (std::size_t i = 0; i < len; ++i) {
        voted[i] = (a[i] == b[i] || a[i] == c[i]) ? a[i] : (b[i] == c[i] ? b[i] : a[i]);
    }

    ecc::ReedSolomon rs(constants::kHeaderParity);
    if (auto header = TryCodeword(rs, voted.data())) {
        return *header;
    }
    for (const std::uint8_t* copy : {a, b, c}) {
        if (auto header = TryCodeword(rs, copy)) {
            return *header;
        }
    }
    throw HeaderUnrecoverable("no header copy could be decoded");
}

void Paint(frame::Frame& frame, const Header& header) {
    const int band = BandHeight(frame.width);
    if (band <= 0 || band > frame.height) {
        throw ParameterError("frame too small for the header band");
    }
    const Bytes bits = Protect(header);
    const blockmap::SymbolCodec codec(constants::kHeaderLevels);
    const int per_row = frame.width / constants::kHeaderBlockSize;
    blockmap::BitReader reader(bits);
    for (std::size_t i = 0; i < BandBlocks(); ++i) {
        const int x = static_cast<int>(i % static_cast<std::size_t>(per_row)) * constants::kHeaderBlockSize;
        const int y = static_cast<int>(i / static_cast<std::size_t>(per_row)) * constants::kHeaderBlockSize;
        blockmap::PaintBlock(frame.rgb.data(), frame.width, x, y, constants::kHeaderBlockSize,
                             codec.BitsToBlock(reader.Read(codec.bits_per_block())));
    }
}

Header Read(const frame::Frame& frame) {
    const int band = BandHeight(frame.width);
    if (band <= 0 || band > frame.height || frame.rgb.size() != frame::FrameBytes(frame.width, frame.height)) {
        throw HeaderUnrecoverable("frame too small to carry a header");
    }
    const blockmap::SymbolCodec codec(constants::kHeaderLevels);
    const int per_row = frame.width / constants::kHeaderBlockSize;
    blockmap::BitWriter writer(ProtectedSize());
    for (std::size_t i = 0; i < BandBlocks(); ++i) {
        const int x = static_cast<int>(i % static_cast<std::size_t>(per_row)) * constants::kHeaderBlockSize;
        const int y = static_cast<int>(i / static_cast<std::size_t>(per_row)) * constants::kHeaderBlockSize;
        auto mean = blockmap::SampleBlock(frame.rgb.data(), frame.width, x, y, constants::kHeaderBlockSize);
        writer.Write(codec.BlockToBits(mean), codec.bits_per_block());
    }
    return Recover(writer.Take());
}

}  // namespace vidstore::header
