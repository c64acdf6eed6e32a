#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "zstdsafe/result.hpp"

namespace zstdsafe {

namespace details {

// Little endian 32-bit magic number at the start of 'bytes', std::nullopt if too short.
std::optional<std::uint32_t> ReadMagicNumber(std::span<const std::byte> bytes) noexcept;

}  // namespace details

// True if 'bytes' starts with the magic number of a zstd frame (current format).
bool HasFrameMagic(std::span<const std::byte> bytes) noexcept;

// True if 'bytes' starts with the magic number of a pre-1.0 zstd frame.
bool HasLegacyFrameMagic(std::span<const std::byte> bytes) noexcept;

// Decompressed size recorded in the header of the frame starting 'frame'.
// std::nullopt if the frame does not record it, ErrorKind::CorruptedData if the header is invalid or truncated.
Result<std::optional<std::uint64_t>> GetFrameContentSize(std::span<const std::byte> frame) noexcept;

// Compressed size of the first frame of 'bytes', which must contain at least one whole frame.
Result<std::size_t> FindFrameCompressedSize(std::span<const std::byte> bytes) noexcept;

}  // namespace zstdsafe
