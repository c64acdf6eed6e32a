#include "zstdsafe/zstd-error.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <stdexcept>
#include <string_view>

#include "zstdsafe/result.hpp"

namespace zstdsafe {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameter:
      return "InvalidParameter";
    case ErrorKind::DictionaryProblem:
      return "DictionaryProblem";
    case ErrorKind::MemoryAllocation:
      return "MemoryAllocation";
    case ErrorKind::DestinationTooSmall:
      return "DestinationTooSmall";
    case ErrorKind::CorruptedData:
      return "CorruptedData";
    case ErrorKind::Unsupported:
      return "Unsupported";
    case ErrorKind::WrongStage:
      return "WrongStage";
    case ErrorKind::Generic:
      return "Generic";
    default:
      throw std::logic_error("Invalid ErrorKind");
  }
}

ErrorKind ClassifyErrorCode(ZSTD_ErrorCode code) noexcept {
  switch (code) {
    case ZSTD_error_parameter_unsupported:
    case ZSTD_error_parameter_outOfBound:
    case ZSTD_error_tableLog_tooLarge:
    case ZSTD_error_maxSymbolValue_tooLarge:
    case ZSTD_error_maxSymbolValue_tooSmall:
      return ErrorKind::InvalidParameter;
    case ZSTD_error_dictionary_corrupted:
    case ZSTD_error_dictionary_wrong:
    case ZSTD_error_dictionaryCreation_failed:
      return ErrorKind::DictionaryProblem;
    case ZSTD_error_memory_allocation:
    case ZSTD_error_workSpace_tooSmall:
      return ErrorKind::MemoryAllocation;
    case ZSTD_error_dstSize_tooSmall:
    case ZSTD_error_dstBuffer_null:
      return ErrorKind::DestinationTooSmall;
    case ZSTD_error_corruption_detected:
    case ZSTD_error_checksum_wrong:
    case ZSTD_error_prefix_unknown:
    case ZSTD_error_srcSize_wrong:
    case ZSTD_error_frameParameter_windowTooLarge:
      return ErrorKind::CorruptedData;
    case ZSTD_error_version_unsupported:
    case ZSTD_error_frameParameter_unsupported:
      return ErrorKind::Unsupported;
    case ZSTD_error_stage_wrong:
    case ZSTD_error_init_missing:
      return ErrorKind::WrongStage;
    default:
      return ErrorKind::Generic;
  }
}

std::string_view ZstdError::message() const noexcept { return ZSTD_getErrorString(_code); }

Result<std::size_t> TranslateReturnCode(std::size_t code) noexcept {
  if (ZSTD_isError(code) != 0U) [[unlikely]] {
    return ZstdError(ZSTD_getErrorCode(code));
  }
  return code;
}

Status TranslateStatus(std::size_t code) noexcept {
  if (ZSTD_isError(code) != 0U) [[unlikely]] {
    return ZstdError(ZSTD_getErrorCode(code));
  }
  return Success{};
}

}  // namespace zstdsafe
