#include "zstdsafe/buffer-sizes.hpp"

#include <zstd.h>

#include <cstddef>

namespace zstdsafe {

std::size_t CompressBound(std::size_t srcSize) noexcept { return ZSTD_compressBound(srcSize); }

std::size_t CStreamInSize() noexcept { return ZSTD_CStreamInSize(); }

std::size_t CStreamOutSize() noexcept { return ZSTD_CStreamOutSize(); }

std::size_t DStreamInSize() noexcept { return ZSTD_DStreamInSize(); }

std::size_t DStreamOutSize() noexcept { return ZSTD_DStreamOutSize(); }

int MinCLevel() noexcept { return ZSTD_minCLevel(); }

int MaxCLevel() noexcept { return ZSTD_maxCLevel(); }

}  // namespace zstdsafe
