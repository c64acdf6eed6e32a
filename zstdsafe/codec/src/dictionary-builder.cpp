#include "zstdsafe/dictionary-builder.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <format>
#include <limits>
#include <numeric>
#include <span>
#include <stdexcept>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/features.hpp"
#include "zstdsafe/log.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

#ifdef ZSTDSAFE_ENABLE_DICT_BUILDER
#include <zdict.h>
#endif

namespace zstdsafe {

Result<std::size_t> TrainFromBuffer([[maybe_unused]] OutBuffer &dictBuffer, std::span<const std::byte> samples,
                                    std::span<const std::size_t> sampleSizes) {
  const auto totalSize = std::accumulate(sampleSizes.begin(), sampleSizes.end(), std::size_t{0});
  if (totalSize != samples.size()) {
    throw std::logic_error(
        std::format("Sample sizes add up to {} bytes but {} sample bytes were given", totalSize, samples.size()));
  }
  if (sampleSizes.size() > std::numeric_limits<unsigned>::max()) {
    throw std::logic_error(std::format("Too many samples: {}", sampleSizes.size()));
  }

#ifdef ZSTDSAFE_ENABLE_DICT_BUILDER
  if (dictBuffer.full()) {
    return ZstdError(ZSTD_error_dstSize_tooSmall);
  }

  auto unfilled = dictBuffer.unfilled();
  const std::size_t ret = ZDICT_trainFromBuffer(unfilled.data(), unfilled.size(), samples.data(), sampleSizes.data(),
                                                static_cast<unsigned>(sampleSizes.size()));
  if (ZDICT_isError(ret) != 0U) {
    log::error("Dictionary training from {} samples ({} bytes) failed: {}", sampleSizes.size(), samples.size(),
               ZDICT_getErrorName(ret));
    const ZSTD_ErrorCode code = ZSTD_getErrorCode(ret);
    if (code == ZSTD_error_dstSize_tooSmall) {
      return ZstdError(code);
    }
    return ZstdError(ErrorKind::DictionaryProblem, code);
  }
  dictBuffer.advance(ret);
  log::debug("Trained dictionary of {} bytes from {} samples", ret, sampleSizes.size());
  return ret;
#else
  static_assert(!dictBuilderEnabled());
  log::warn("Dictionary training requested but this build has no dictionary builder");
  return ZstdError(ErrorKind::Unsupported, ZSTD_error_GENERIC);
#endif
}

}  // namespace zstdsafe
