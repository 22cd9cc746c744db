#include "test_check.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/crypto.hpp"
#include "vidstore/ecc.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/frame.hpp"
#include "vidstore/header.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using vidstore::header::Bytes;
using vidstore::header::Header;

namespace {

Header MakeHeader(bool encrypted) {
    Header h;
    h.block_size = 8;
    h.levels = 2;
    h.ecc_parity = 64;
    h.width = 640;
    h.height = 384;
    h.payload_length = 100;
    h.stream_length = encrypted ? 116 : 100;
    const std::string text = "payload";
    h.payload_sha256 = vidstore::crypto::Sha256(Bytes(text.begin(), text.end()));
    if (encrypted) {
        h.encrypted = true;
        h.kdf.kind = vidstore::cipher::KdfKind::Pbkdf2;
        h.kdf.cost_a = 200000;
        h.salt = Bytes(16, 0x11);
        h.nonce = Bytes(12, 0x22);
    }
    vidstore::frame::FrameLayout layout(h.width, h.height, h.body());
    h.frame_count = static_cast<std::uint32_t>(
        layout.FrameCount(vidstore::ecc::ProtectedSize(h.stream_length, static_cast<std::size_t>(h.ecc_parity))));
    return h;
}

bool SameHeader(const Header& a, const Header& b) {
    return a.version == b.version && a.encrypted == b.encrypted && a.compressed == b.compressed &&
           a.block_size == b.block_size && a.levels == b.levels && a.ecc_parity == b.ecc_parity &&
           a.width == b.width && a.height == b.height && a.payload_length == b.payload_length &&
           a.stream_length == b.stream_length && a.frame_count == b.frame_count &&
           a.payload_sha256 == b.payload_sha256 && a.kdf.kind == b.kdf.kind && a.kdf.cost_a == b.kdf.cost_a &&
           a.kdf.cost_b == b.kdf.cost_b && a.salt == b.salt && a.nonce == b.nonce;
}

void TestSerializeLayout() {
    Header plain = MakeHeader(false);
    Bytes bytes = vidstore::header::Serialize(plain);
    VIDSTORE_CHECK(bytes.size() == vidstore::constants::kHeaderFixedLen);
    VIDSTORE_CHECK(bytes[0] == 'V' && bytes[1] == 'D' && bytes[2] == 'S' && bytes[3] == 'T');
    VIDSTORE_CHECK(bytes[4] == vidstore::constants::kFormatVersion);
    VIDSTORE_CHECK(bytes[5] == 0);
    VIDSTORE_CHECK(bytes[6] == 8);
    VIDSTORE_CHECK(bytes[7] == 0 && bytes[8] == 2);
    VIDSTORE_CHECK(bytes[9] == 64);
    VIDSTORE_CHECK(bytes[10] == 0x02 && bytes[11] == 0x80);
    VIDSTORE_CHECK(bytes[12] == 0x01 && bytes[13] == 0x80);
    VIDSTORE_CHECK(bytes[21] == 100);
    VIDSTORE_CHECK(SameHeader(vidstore::header::Parse(bytes), plain));

    Header sealed = MakeHeader(true);
    Bytes sealed_bytes = vidstore::header::Serialize(sealed);
    VIDSTORE_CHECK(sealed_bytes.size() ==
                   vidstore::constants::kHeaderFixedLen + vidstore::constants::kHeaderCipherLen);
    VIDSTORE_CHECK(sealed_bytes[5] == vidstore::constants::kFlagEncrypted);
    VIDSTORE_CHECK(sealed_bytes[66] == 1);
    VIDSTORE_CHECK(SameHeader(vidstore::header::Parse(sealed_bytes), sealed));
}

void TestParseRejectsBadHeaders() {
    const Bytes good = vidstore::header::Serialize(MakeHeader(false));

    Bytes magic = good;
    magic[0] = 'X';
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(magic); }));

    Bytes version = good;
    version[4] = 99;
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(version); }));

    Bytes levels = good;
    levels[8] = 3;
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(levels); }));

    Bytes frames = good;
    frames[33] = 9;
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(frames); }));

    Bytes flags = good;
    flags[5] = 0x80;
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(flags); }));

    Bytes short_bytes(good.begin(), good.begin() + 20);
    VIDSTORE_CHECK(
        vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(short_bytes); }));
}

void SetBe32(Bytes& bytes, std::size_t offset, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        bytes[offset + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(value >> (24 - 8 * i));
    }
}

void TestParseBoundsKdfCost() {
    const Bytes sealed = vidstore::header::Serialize(MakeHeader(true));
    auto rejects = [](const Bytes& bytes) {
        return vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Parse(bytes); });
    };

    Bytes iterations = sealed;
    SetBe32(iterations, 67, 0xFFFFFFFFu);
    VIDSTORE_CHECK(rejects(iterations));
    SetBe32(iterations, 67, vidstore::constants::kMaxPbkdf2Iterations + 1);
    VIDSTORE_CHECK(rejects(iterations));
    SetBe32(iterations, 67, 0);
    VIDSTORE_CHECK(rejects(iterations));
    SetBe32(iterations, 67, vidstore::constants::kMaxPbkdf2Iterations);
    VIDSTORE_CHECK(vidstore::header::Parse(iterations).kdf.cost_a == vidstore::constants::kMaxPbkdf2Iterations);

    Bytes argon = sealed;
    argon[66] = static_cast<std::uint8_t>(vidstore::cipher::KdfKind::Argon2id);
    SetBe32(argon, 67, 3);
    SetBe32(argon, 71, 0xFFFFFFFFu);
    VIDSTORE_CHECK(rejects(argon));
    SetBe32(argon, 71, vidstore::constants::kMaxArgon2MemoryCost + 1);
    VIDSTORE_CHECK(rejects(argon));
    SetBe32(argon, 71, 32768);
    SetBe32(argon, 67, 1000);
    VIDSTORE_CHECK(rejects(argon));
    SetBe32(argon, 67, 3);
    auto parsed = vidstore::header::Parse(argon);
    VIDSTORE_CHECK(parsed.kdf.kind == vidstore::cipher::KdfKind::Argon2id);
    VIDSTORE_CHECK(parsed.kdf.cost_b == 32768);
}

void TestMajorityVote() {
    const Header h = MakeHeader(true);
    Bytes protected_bytes = vidstore::header::Protect(h);
    VIDSTORE_CHECK(protected_bytes.size() == vidstore::header::ProtectedSize());
    VIDSTORE_CHECK(protected_bytes.size() == 576);
    VIDSTORE_CHECK(SameHeader(vidstore::header::Recover(protected_bytes), h));

    // one copy destroyed outright
    Bytes destroyed = protected_bytes;
    std::fill(destroyed.begin() + 192, destroyed.begin() + 384, 0xFF);
    VIDSTORE_CHECK(SameHeader(vidstore::header::Recover(destroyed), h));

    // every copy damaged beyond its own capacity, at different places
    Bytes spread = protected_bytes;
    for (std::size_t copy = 0; copy < 3; ++copy) {
        for (std::size_t i = 0; i < 50; ++i) {
            spread[copy * 192 + copy * 60 + i] ^= 0xA5;
        }
    }
    VIDSTORE_CHECK(SameHeader(vidstore::header::Recover(spread), h));

    // the vote loses but one copy is still within RS capacity
    Bytes one_good = protected_bytes;
    for (std::size_t i = 0; i < 192; ++i) {
        one_good[192 + i] ^= 0x0F;
        one_good[384 + i] ^= 0x0F;
    }
    VIDSTORE_CHECK(SameHeader(vidstore::header::Recover(one_good), h));

    std::mt19937 gen(99);
    Bytes garbage(576);
    for (auto& b : garbage) {
        b = static_cast<std::uint8_t>(gen() & 0xFF);
    }
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Recover(garbage); }));
}

void TestBandGeometry() {
    VIDSTORE_CHECK(vidstore::header::BandBlocks() == 1536);
    VIDSTORE_CHECK(vidstore::header::BandHeight(640) == 160);
    VIDSTORE_CHECK(vidstore::header::BandHeight(3840) == 32);
}

void TestPaintAndReadUnderNoise() {
    const Header h = MakeHeader(false);
    vidstore::frame::Frame frame(h.width, h.height);
    vidstore::header::Paint(frame, h);
    VIDSTORE_CHECK(SameHeader(vidstore::header::Read(frame), h));

    // Up to +/-100 of drift on every pixel, far inside the 127.5 margin of the header band.
    std::mt19937 gen(7);
    for (auto& px : frame.rgb) {
        int delta = static_cast<int>(gen() % 201) - 100;
        int v = static_cast<int>(px) + (px > 127 ? -std::abs(delta) : std::abs(delta));
        px = static_cast<std::uint8_t>(v);
    }
    VIDSTORE_CHECK(SameHeader(vidstore::header::Read(frame), h));

    // Wipe a band of header blocks completely; redundancy covers it.
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 320; ++x) {
            std::size_t off = static_cast<std::size_t>((y * h.width + x) * 3);
            frame.rgb[off] = frame.rgb[off + 1] = frame.rgb[off + 2] = 255;
        }
    }
    VIDSTORE_CHECK(SameHeader(vidstore::header::Read(frame), h));

    vidstore::frame::Frame black(h.width, h.height);
    VIDSTORE_CHECK(vidstore_test::Throws<vidstore::HeaderUnrecoverable>([&] { vidstore::header::Read(black); }));
}

}  // namespace

int main() {
    vidstore_test::Run("serialize layout", TestSerializeLayout);
    vidstore_test::Run("parse rejects bad headers", TestParseRejectsBadHeaders);
    vidstore_test::Run("parse bounds kdf cost", TestParseBoundsKdfCost);
    vidstore_test::Run("majority vote", TestMajorityVote);
    vidstore_test::Run("band geometry", TestBandGeometry);
    vidstore_test::Run("paint and read under noise", TestPaintAndReadUnderNoise);
    return vidstore_test::Summary("test_header");
}
