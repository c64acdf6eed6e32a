#include "zstdsafe/compression-test-helpers.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "zstdsafe/buffer-sizes.hpp"
#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/compression-context.hpp"
#include "zstdsafe/decompression-context.hpp"
#include "zstdsafe/stream-driver.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe::test {

namespace {

template <class T>
T Checked(const Result<T> &res, std::string_view what) {
  if (res.hasError()) {
    throw std::runtime_error(std::format("{} failed: {} ({})", what, res.error().message(),
                                         ErrorKindName(res.errorKind())));
  }
  return res.value();
}

constexpr std::array<std::string_view, 16> kWords = {"stream", "frame",  "buffer", "window", "level",  "block",
                                                     "match",  "entropy", "table", "dictionary", "context",
                                                     "flush",  "checksum", "literal", "offset", "sequence"};

}  // namespace

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.resize_and_overwrite(size, [](char *data, std::size_t size) {
    std::iota(data, data + size, static_cast<unsigned char>(0));
    return size;
  });
  return payload;
}

std::string MakeRandomPayload(std::size_t size, std::uint64_t seed) {
  std::string payload(size, '\0');
  std::mt19937_64 rng{seed};
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto &ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

std::string MakeTextPayload(std::size_t size, std::uint64_t seed) {
  std::string payload;
  payload.reserve(size + 16U);
  std::mt19937_64 rng{seed};
  std::uniform_int_distribution<std::size_t> dist(0, kWords.size() - 1U);
  while (payload.size() < size) {
    payload.append(kWords[dist(rng)]);
    payload.push_back(' ');
  }
  payload.resize(size);
  return payload;
}

std::string MakeDictionarySamples(std::size_t nbSamples, std::vector<std::size_t> &sampleSizes) {
  std::string samples;
  sampleSizes.clear();
  sampleSizes.reserve(nbSamples);
  std::mt19937_64 rng{987654321ULL};
  std::uniform_int_distribution<int> idDist(1, 1000000);
  std::uniform_int_distribution<std::size_t> wordDist(0, kWords.size() - 1U);
  for (std::size_t sampleIdx = 0; sampleIdx < nbSamples; ++sampleIdx) {
    const auto before = samples.size();
    const int id = idDist(rng);
    samples.append(std::format(
        R"({{"id":{},"user":"user_{}","email":"user{}@example.com","tags":["{}","{}"],"active":{},"score":{}}})", id,
        id % 977, id, kWords[wordDist(rng)], kWords[wordDist(rng)], (id % 2) == 0 ? "true" : "false", id % 101));
    sampleSizes.push_back(samples.size() - before);
  }
  return samples;
}

std::string MakeCorruptDictionary(std::uint32_t dictId, std::size_t size) {
  std::string dict(std::max<std::size_t>(size, 8U), static_cast<char>(0xFF));
  // ZSTD_MAGIC_DICTIONARY, little endian.
  dict[0] = static_cast<char>(0x37);
  dict[1] = static_cast<char>(0xA4);
  dict[2] = static_cast<char>(0x30);
  dict[3] = static_cast<char>(0xEC);
  for (int byteIdx = 0; byteIdx < 4; ++byteIdx) {
    dict[4 + byteIdx] = static_cast<char>((dictId >> (8 * byteIdx)) & 0xFFU);
  }
  return dict;
}

std::string CompressAll(CompressionContext &ctx, std::string_view input, std::size_t outChunkSize,
                        std::size_t inChunkSize) {
  if (outChunkSize == 0) {
    outChunkSize = CStreamOutSize();
  }
  if (inChunkSize == 0) {
    inChunkSize = std::max<std::size_t>(input.size(), 1U);
  }
  std::string out;
  std::string chunk(outChunkSize, '\0');
  OutBuffer outBuf{std::span<char>(chunk)};
  CompressionStream stream(ctx);

  for (std::size_t offset = 0; offset < input.size(); offset += inChunkSize) {
    InBuffer in(input.substr(offset, inChunkSize));
    while (!in.exhausted()) {
      Checked(stream.compress(in, outBuf), "compress");
      out.append(outBuf.writtenChars());
      outBuf.rewind();
    }
  }
  for (;;) {
    const auto outcome = Checked(stream.finish(outBuf), "finish");
    out.append(outBuf.writtenChars());
    outBuf.rewind();
    if (outcome.frameComplete) {
      break;
    }
  }
  return out;
}

std::string DecompressAll(DecompressionContext &ctx, std::string_view compressed, std::size_t outChunkSize,
                          std::size_t inChunkSize) {
  if (outChunkSize == 0) {
    outChunkSize = DStreamOutSize();
  }
  if (inChunkSize == 0) {
    inChunkSize = std::max<std::size_t>(compressed.size(), 1U);
  }
  std::string out;
  std::string chunk(outChunkSize, '\0');
  OutBuffer outBuf{std::span<char>(chunk)};
  DecompressionStream stream(ctx);

  bool frameComplete = true;
  for (std::size_t offset = 0; offset < compressed.size(); offset += inChunkSize) {
    InBuffer in(compressed.substr(offset, inChunkSize));
    for (;;) {
      const auto outcome = Checked(stream.decompress(in, outBuf), "decompress");
      out.append(outBuf.writtenChars());
      const bool wasFull = outBuf.full();
      outBuf.rewind();
      frameComplete = outcome.frameComplete;
      // A complete frame is fully flushed, a full buffer may hide pending output otherwise.
      if (in.exhausted() && (frameComplete || !wasFull)) {
        break;
      }
    }
  }
  if (!frameComplete) {
    throw std::runtime_error(std::format("Truncated input: {} bytes decoded, frame not complete", out.size()));
  }
  return out;
}

}  // namespace zstdsafe::test
