#include "vidstore/ecc.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/errors.hpp"
#include "vidstore/parallel.hpp"

#include <correct.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace vidstore::ecc {

namespace {

void CheckParity(std::size_t parity) {
    if (parity < static_cast<std::size_t>(constants::kMinEccParity) ||
        parity > static_cast<std::size_t>(constants::kMaxEccParity)) {
        throw ParameterError("ecc parity must be in [" + std::to_string(constants::kMinEccParity) + ", " +
                             std::to_string(constants::kMaxEccParity) + "], got " + std::to_string(parity));
    }
}

std::vector<std::unique_ptr<ReedSolomon>> MakeCodecs(std::size_t count, std::size_t parity) {
    std::vector<std::unique_ptr<ReedSolomon>> codecs;
    codecs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        codecs.push_back(std::make_unique<ReedSolomon>(parity));
    }
    return codecs;
}

}  // namespace

void ReedSolomon::Deleter::operator()(correct_reed_solomon* rs) const noexcept {
    if (rs) correct_reed_solomon_destroy(rs);
}

ReedSolomon::ReedSolomon(std::size_t parity) : parity_(parity) {
    CheckParity(parity);
    rs_.reset(correct_reed_solomon_create(constants::kRsPrimitivePolynomial,
                                          constants::kRsFirstConsecutiveRoot,
                                          constants::kRsGeneratorRootGap,
                                          parity));
    if (!rs_) {
        throw std::runtime_error("Reed-Solomon codec allocation failed");
    }
}

std::size_t ReedSolomon::max_data() const noexcept {
    return constants::kRsCodewordLen - parity_;
}

Bytes ReedSolomon::Encode(const std::uint8_t* data, std::size_t size) {
    if (size == 0 || size > max_data()) {
        throw ParameterError("Reed-Solomon message length out of range: " + std::to_string(size));
    }
    Bytes out(size + parity_);
    ssize_t written = correct_reed_solomon_encode(rs_.get(), data, size, out.data());
    if (written < 0 || static_cast<std::size_t>(written) != out.size()) {
        throw std::runtime_error("Reed-Solomon encode failed");
    }
    return out;
}

std::optional<RecoveredChunk> ReedSolomon::Decode(const std::uint8_t* codeword, std::size_t size) {
    if (size <= parity_ || size > constants::kRsCodewordLen) {
        throw ParameterError("Reed-Solomon codeword length out of range: " + std::to_string(size));
    }
    RecoveredChunk chunk;
    chunk.data.resize(size - parity_);
    ssize_t rc = correct_reed_solomon_decode(rs_.get(), codeword, size, chunk.data.data());
    if (rc < 0 || static_cast<std::size_t>(rc) != chunk.data.size()) {
        return std::nullopt;
    }
    // The decoder may land on a different codeword when the error count exceeds its
    // capacity. Re-encoding shows how far the accepted codeword is from what was received.
    Bytes check = Encode(chunk.data.data(), chunk.data.size());
    std::size_t distance = 0;
    for (std::size_t i = 0; i < size; ++i) {
        if (check[i] != codeword[i]) {
            ++distance;
        }
    }
    if (distance > parity_ / 2) {
        return std::nullopt;
    }
    chunk.corrected = distance;
    return chunk;
}

std::size_t ChunkDataSize(std::size_t parity) {
    CheckParity(parity);
    return constants::kRsCodewordLen - parity;
}

std::size_t ChunkCount(std::size_t stream_length, std::size_t parity) {
    std::size_t data = ChunkDataSize(parity);
    return (stream_length + data - 1) / data;
}

std::size_t ProtectedSize(std::size_t stream_length, std::size_t parity) {
    return ChunkCount(stream_length, parity) * constants::kRsCodewordLen;
}

std::vector<Bytes> Protect(const Bytes& stream, std::size_t parity) {
    const std::size_t data = ChunkDataSize(parity);
    const std::size_t count = ChunkCount(stream.size(), parity);
    ReedSolomon rs(parity);
    std::vector<Bytes> chunks;
    chunks.reserve(count);
    Bytes block(data);
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t offset = i * data;
        std::size_t take = std::min(data, stream.size() - offset);
        std::fill(block.begin(), block.end(), 0);
        std::memcpy(block.data(), stream.data() + offset, take);
        chunks.push_back(rs.Encode(block.data(), block.size()));
    }
    return chunks;
}

RecoveredChunk Recover(ReedSolomon& rs, const std::uint8_t* codeword, std::size_t index) {
    auto chunk = rs.Decode(codeword, constants::kRsCodewordLen);
    if (!chunk) {
        throw UncorrectableChunk(index, index * constants::kRsCodewordLen, 0);
    }
    return std::move(*chunk);
}

Bytes ProtectAll(const Bytes& stream, std::size_t parity, std::size_t workers) {
    const std::size_t data = ChunkDataSize(parity);
    const std::size_t count = ChunkCount(stream.size(), parity);
    workers = std::max<std::size_t>(1, std::min(workers, count));
    auto codecs = MakeCodecs(workers, parity);

    Bytes out(count * constants::kRsCodewordLen);
    std::vector<Bytes> staging(workers, Bytes(data));
    parallel::ParallelFor(count, workers, [&](std::size_t worker, std::size_t idx) {
        Bytes& block = staging[worker];
        std::size_t offset = idx * data;
        std::size_t take = std::min(data, stream.size() - offset);
        std::fill(block.begin(), block.end(), 0);
        std::memcpy(block.data(), stream.data() + offset, take);
        Bytes codeword = codecs[worker]->Encode(block.data(), block.size());
        std::memcpy(out.data() + idx * constants::kRsCodewordLen, codeword.data(), codeword.size());
    });
    return out;
}

RecoveryReport RecoverAll(const Bytes& protected_stream,
                          std::size_t parity,
                          std::size_t stream_length,
                          std::size_t workers,
                          const FrameLocator& locate) {
    const std::size_t data = ChunkDataSize(parity);
    const std::size_t count = ChunkCount(stream_length, parity);
    if (protected_stream.size() < count * constants::kRsCodewordLen) {
        throw ParameterError("protected stream is shorter than the declared length");
    }
    workers = std::max<std::size_t>(1, std::min(workers, count));
    auto codecs = MakeCodecs(workers, parity);

    std::vector<Bytes> results(count);
    std::vector<std::size_t> corrected(count, 0);
    parallel::ParallelFor(count, workers, [&](std::size_t worker, std::size_t idx) {
        const std::size_t offset = idx * constants::kRsCodewordLen;
        auto chunk = codecs[worker]->Decode(protected_stream.data() + offset, constants::kRsCodewordLen);
        if (!chunk) {
            throw UncorrectableChunk(idx, offset, locate ? locate(offset) : 0);
        }
        corrected[idx] = chunk->corrected;
        results[idx] = std::move(chunk->data);
    });

    RecoveryReport report;
    report.stream.reserve(count * data);
    for (std::size_t i = 0; i < count; ++i) {
        report.stream.insert(report.stream.end(), results[i].begin(), results[i].end());
        report.total_corrected += corrected[i];
        if (corrected[i] > 0) {
            ++report.chunks_with_errors;
        }
    }
    report.stream.resize(stream_length);
    report.corrected = std::move(corrected);
    return report;
}

}  // namespace vidstore::ecc
