#pragma once

#include <zstd.h>

#include <cstddef>

namespace zstdsafe {

inline constexpr int kDefaultCLevel = ZSTD_CLEVEL_DEFAULT;

// Size hints to let callers size their buffers without guessing.
// None of them depends on any context state.

// Maximum compressed size of a single frame holding 'srcSize' bytes (worst case, incompressible data).
std::size_t CompressBound(std::size_t srcSize) noexcept;

// Recommended input chunk size for compression streaming.
std::size_t CStreamInSize() noexcept;

// Recommended output buffer size for compression streaming, guaranteed to flush at least one complete block.
std::size_t CStreamOutSize() noexcept;

// Recommended input chunk size for decompression streaming.
std::size_t DStreamInSize() noexcept;

// Recommended output buffer size for decompression streaming, guaranteed to hold at least one decoded block.
std::size_t DStreamOutSize() noexcept;

int MinCLevel() noexcept;
int MaxCLevel() noexcept;

}  // namespace zstdsafe
