#pragma once

#include <zstd_errors.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace zstdsafe {

// Closed set of recoverable failure categories reported by this library.
enum class ErrorKind : std::int8_t {
  InvalidParameter,
  DictionaryProblem,
  MemoryAllocation,
  DestinationTooSmall,
  CorruptedData,
  Unsupported,
  WrongStage,
  Generic
};

std::string_view ErrorKindName(ErrorKind kind);

// Maps a native error enumerator to its ErrorKind.
ErrorKind ClassifyErrorCode(ZSTD_ErrorCode code) noexcept;

// Recoverable error: a category plus the native discriminant it was built from.
// Errors detected by this library before reaching the native layer also carry the native code
// describing the same failure, so that every error has a message sourced from the native lookup.
class ZstdError {
 public:
  explicit ZstdError(ZSTD_ErrorCode code) noexcept : _code(code), _kind(ClassifyErrorCode(code)) {}

  ZstdError(ErrorKind kind, ZSTD_ErrorCode code) noexcept : _code(code), _kind(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

  [[nodiscard]] ZSTD_ErrorCode code() const noexcept { return _code; }

  // Human readable message from the native library (static storage).
  [[nodiscard]] std::string_view message() const noexcept;

  bool operator==(const ZstdError &) const noexcept = default;

 private:
  ZSTD_ErrorCode _code;
  ErrorKind _kind;
};

}  // namespace zstdsafe
