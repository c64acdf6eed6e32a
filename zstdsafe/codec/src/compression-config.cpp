#include "zstdsafe/compression-config.hpp"

#include <zstd.h>

#include <format>
#include <stdexcept>

#include "zstdsafe/compression-context.hpp"
#include "zstdsafe/decompression-context.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

template <class Param>
void ValidateField(Param param, int value) {
  auto status = details::ValidateParameter(param, value);
  if (status.hasError()) {
    throw std::invalid_argument(std::format("Invalid {} value {}: {} ({})", ParameterName(param), value,
                                            status.error().message(), ErrorKindName(status.errorKind())));
  }
}

}  // namespace

void CompressionConfig::validate() const {
  ValidateField(CParameter::CompressionLevel, compressionLevel);
  ValidateField(CParameter::WindowLog, windowLog);
  if (strategy) {
    ValidateField(CParameter::Strategy, static_cast<int>(*strategy));
  }
  if (nbWorkers < 0) {
    throw std::invalid_argument(std::format("Invalid number of workers {}", nbWorkers));
  }
  ValidateField(CParameter::NbWorkers, nbWorkers);
}

Status CompressionConfig::applyTo(CompressionContext &ctx) const {
  Status status = Success{};
  if (compressionLevel != ZSTD_CLEVEL_DEFAULT) {
    status = ctx.setParameter(CParameter::CompressionLevel, compressionLevel);
  }
  if (!status.hasError() && windowLog != 0) {
    status = ctx.setParameter(CParameter::WindowLog, windowLog);
  }
  if (!status.hasError() && checksum) {
    status = ctx.setParameter(CParameter::ChecksumFlag, 1);
  }
  if (!status.hasError() && !contentSize) {
    status = ctx.setParameter(CParameter::ContentSizeFlag, 0);
  }
  if (!status.hasError() && !dictId) {
    status = ctx.setParameter(CParameter::DictIdFlag, 0);
  }
  if (!status.hasError() && strategy) {
    status = ctx.setParameter(*strategy);
  }
  if (!status.hasError() && longDistanceMatching) {
    status = ctx.setParameter(CParameter::EnableLongDistanceMatching, 1);
  }
  if (!status.hasError() && nbWorkers != 0) {
    status = ctx.setParameter(CParameter::NbWorkers, nbWorkers);
  }
  if (!status.hasError() && pledgedSrcSize) {
    status = ctx.setPledgedSrcSize(pledgedSrcSize);
  }
  return status;
}

void DecompressionConfig::validate() const { ValidateField(DParameter::WindowLogMax, windowLogMax); }

Status DecompressionConfig::applyTo(DecompressionContext &ctx) const {
  if (windowLogMax == 0) {
    return Success{};
  }
  return ctx.setParameter(DParameter::WindowLogMax, windowLogMax);
}

}  // namespace zstdsafe
