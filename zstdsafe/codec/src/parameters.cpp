#include "zstdsafe/parameters.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "zstdsafe/features.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

Result<ParameterBounds> ToParameterBounds(ZSTD_bounds bounds) noexcept {
  if (ZSTD_isError(bounds.error) != 0U) {
    return ZstdError(ZSTD_getErrorCode(bounds.error));
  }
  return ParameterBounds{bounds.lowerBound, bounds.upperBound};
}

Status CheckInBounds(const Result<ParameterBounds> &bounds, bool zeroMeansDefault, int value) {
  if (bounds.hasError()) {
    return bounds.error();
  }
  if (value == 0 && zeroMeansDefault) {
    return Success{};
  }
  if (!bounds.value().contains(value)) {
    return ZstdError(ErrorKind::InvalidParameter, ZSTD_error_parameter_outOfBound);
  }
  return Success{};
}

}  // namespace

std::string_view ParameterName(CParameter param) {
  switch (param) {
    case CParameter::CompressionLevel:
      return "CompressionLevel";
    case CParameter::WindowLog:
      return "WindowLog";
    case CParameter::HashLog:
      return "HashLog";
    case CParameter::ChainLog:
      return "ChainLog";
    case CParameter::SearchLog:
      return "SearchLog";
    case CParameter::MinMatch:
      return "MinMatch";
    case CParameter::TargetLength:
      return "TargetLength";
    case CParameter::Strategy:
      return "Strategy";
    case CParameter::EnableLongDistanceMatching:
      return "EnableLongDistanceMatching";
    case CParameter::LdmHashLog:
      return "LdmHashLog";
    case CParameter::LdmMinMatch:
      return "LdmMinMatch";
    case CParameter::LdmBucketSizeLog:
      return "LdmBucketSizeLog";
    case CParameter::LdmHashRateLog:
      return "LdmHashRateLog";
    case CParameter::ContentSizeFlag:
      return "ContentSizeFlag";
    case CParameter::ChecksumFlag:
      return "ChecksumFlag";
    case CParameter::DictIdFlag:
      return "DictIdFlag";
    case CParameter::NbWorkers:
      return "NbWorkers";
    case CParameter::JobSize:
      return "JobSize";
    case CParameter::OverlapLog:
      return "OverlapLog";
    default:
      throw std::logic_error("Invalid compression parameter");
  }
}

std::string_view ParameterName(DParameter param) {
  switch (param) {
    case DParameter::WindowLogMax:
      return "WindowLogMax";
    default:
      throw std::logic_error("Invalid decompression parameter");
  }
}

std::optional<CParameter> CParameterFromRaw(int rawId) noexcept {
  auto it = std::ranges::find(kAllCParameters, rawId, [](CParameter param) { return static_cast<int>(param); });
  if (it == std::ranges::end(kAllCParameters)) {
    return std::nullopt;
  }
  return *it;
}

std::optional<DParameter> DParameterFromRaw(int rawId) noexcept {
  auto it = std::ranges::find(kAllDParameters, rawId, [](DParameter param) { return static_cast<int>(param); });
  if (it == std::ranges::end(kAllDParameters)) {
    return std::nullopt;
  }
  return *it;
}

Result<ParameterBounds> Bounds(CParameter param) noexcept {
  return ToParameterBounds(ZSTD_cParam_getBounds(static_cast<ZSTD_cParameter>(param)));
}

Result<ParameterBounds> Bounds(DParameter param) noexcept {
  return ToParameterBounds(ZSTD_dParam_getBounds(static_cast<ZSTD_dParameter>(param)));
}

namespace details {

Status ValidateParameter(CParameter param, int value) {
  if (RequiresMultithread(param) && value != 0) {
    if constexpr (!multithreadEnabled()) {
      return ZstdError(ErrorKind::Unsupported, ZSTD_error_parameter_unsupported);
    }
    // Library built without ZSTD_MULTITHREAD advertises an empty range for the workers count.
    auto workersBounds = Bounds(CParameter::NbWorkers);
    if (workersBounds.hasError() || workersBounds.value().upper == 0) {
      return ZstdError(ErrorKind::Unsupported, ZSTD_error_parameter_unsupported);
    }
  }
  return CheckInBounds(Bounds(param), ZeroMeansDefault(param), value);
}

Status ValidateParameter(DParameter param, int value) {
  return CheckInBounds(Bounds(param), ZeroMeansDefault(param), value);
}

}  // namespace details

}  // namespace zstdsafe
