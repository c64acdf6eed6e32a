#include "zstdsafe/frame-info.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

// zstd v0.1 to v0.7 frame magic numbers.
constexpr std::uint32_t kFirstLegacyMagic = 0xFD2FB51EU;
constexpr std::uint32_t kLastLegacyMagic = 0xFD2FB527U;

}  // namespace

namespace details {

std::optional<std::uint32_t> ReadMagicNumber(std::span<const std::byte> bytes) noexcept {
  if (bytes.size() < sizeof(std::uint32_t)) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8) |
         (static_cast<std::uint32_t>(bytes[2]) << 16) | (static_cast<std::uint32_t>(bytes[3]) << 24);
}

}  // namespace details

bool HasFrameMagic(std::span<const std::byte> bytes) noexcept {
  const auto magic = details::ReadMagicNumber(bytes);
  return magic && *magic == ZSTD_MAGICNUMBER;
}

bool HasLegacyFrameMagic(std::span<const std::byte> bytes) noexcept {
  const auto magic = details::ReadMagicNumber(bytes);
  return magic && *magic >= kFirstLegacyMagic && *magic <= kLastLegacyMagic;
}

Result<std::optional<std::uint64_t>> GetFrameContentSize(std::span<const std::byte> frame) noexcept {
  const unsigned long long size = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (size == ZSTD_CONTENTSIZE_ERROR) {
    return ZstdError(ErrorKind::CorruptedData, ZSTD_error_prefix_unknown);
  }
  if (size == ZSTD_CONTENTSIZE_UNKNOWN) {
    return std::optional<std::uint64_t>{};
  }
  return std::optional<std::uint64_t>{static_cast<std::uint64_t>(size)};
}

Result<std::size_t> FindFrameCompressedSize(std::span<const std::byte> bytes) noexcept {
  return TranslateReturnCode(ZSTD_findFrameCompressedSize(bytes.data(), bytes.size()));
}

}  // namespace zstdsafe
