#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zstdsafe/compression-context.hpp"
#include "zstdsafe/decompression-context.hpp"

namespace zstdsafe::test {

constexpr bool HasZstdMagic(std::string_view body) {
  // zstd frame magic little endian 0x28 B5 2F FD
  return body.size() >= 4 && static_cast<unsigned char>(body[0]) == 0x28 &&
         static_cast<unsigned char>(body[1]) == 0xB5 && static_cast<unsigned char>(body[2]) == 0x2F &&
         static_cast<unsigned char>(body[3]) == 0xFD;
}

inline std::span<const std::byte> AsBytes(std::string_view data) {
  return {reinterpret_cast<const std::byte *>(data.data()), data.size()};
}

// Repeating 0..255 pattern, highly compressible.
std::string MakePatternedPayload(std::size_t size);

// Deterministic pseudo random bytes, mostly incompressible.
std::string MakeRandomPayload(std::size_t size, std::uint64_t seed = 123456789ULL);

// Text made of words picked from a small vocabulary, compressible like real text.
std::string MakeTextPayload(std::size_t size, std::uint64_t seed = 42ULL);

// Small JSON-like records sharing most of their structure, suitable for dictionary training.
// Returns the concatenated samples and fills 'sampleSizes'.
std::string MakeDictionarySamples(std::size_t nbSamples, std::vector<std::size_t> &sampleSizes);

// Bytes carrying the structured dictionary magic and 'dictId' but garbage tables.
std::string MakeCorruptDictionary(std::uint32_t dictId = 0xC0FFEE, std::size_t size = 256);

// Compresses 'input' into a single frame through CompressionStream, feeding at most 'inChunkSize' bytes at a time
// into an output buffer of 'outChunkSize' bytes drained after each call.
// Throws std::runtime_error on any native failure.
std::string CompressAll(CompressionContext &ctx, std::string_view input, std::size_t outChunkSize = 0,
                        std::size_t inChunkSize = 0);

// Decompresses all frames of 'compressed' through DecompressionStream with the same chunking rules.
// Throws std::runtime_error on any native failure or if 'compressed' ends in the middle of a frame.
std::string DecompressAll(DecompressionContext &ctx, std::string_view compressed, std::size_t outChunkSize = 0,
                          std::size_t inChunkSize = 0);

}  // namespace zstdsafe::test
