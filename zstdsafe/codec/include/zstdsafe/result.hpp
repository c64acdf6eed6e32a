#pragma once

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

// Represents the outcome of an operation crossing the native boundary: either a value, or a ZstdError.
// Raw native return codes are converted exactly once into this type (see TranslateReturnCode) and never re-decoded.
// Accessing the wrong alternative is a programming error and throws std::logic_error.
template <class T = std::size_t>
class [[nodiscard]] Result {
 public:
  using value_type = T;

  Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>) : _storage(std::in_place_index<0>, std::move(value)) {}

  Result(ZstdError error) noexcept : _storage(std::in_place_index<1>, error) {}

  [[nodiscard]] bool hasError() const noexcept { return _storage.index() == 1; }

  explicit operator bool() const noexcept { return !hasError(); }

  [[nodiscard]] T &value() & {
    checkHasValue();
    return std::get<0>(_storage);
  }

  [[nodiscard]] const T &value() const & {
    checkHasValue();
    return std::get<0>(_storage);
  }

  [[nodiscard]] T &&value() && {
    checkHasValue();
    return std::get<0>(std::move(_storage));
  }

  [[nodiscard]] const ZstdError &error() const {
    if (!hasError()) [[unlikely]] {
      throw std::logic_error("Result holds a value, not an error");
    }
    return std::get<1>(_storage);
  }

  // Shortcut for error().kind().
  [[nodiscard]] ErrorKind errorKind() const { return error().kind(); }

 private:
  void checkHasValue() const {
    if (hasError()) [[unlikely]] {
      throw std::logic_error("Result holds an error, not a value");
    }
  }

  std::variant<T, ZstdError> _storage;
};

// Result of operations that only report success or failure.
struct Success {
  bool operator==(const Success &) const noexcept = default;
};

using Status = Result<Success>;

// Interprets a native size_t return code: an error is classified into a ZstdError, otherwise the value is a
// byte count or hint meaningful to the caller. Pure function.
Result<std::size_t> TranslateReturnCode(std::size_t code) noexcept;

// Same as TranslateReturnCode, discarding the success value.
Status TranslateStatus(std::size_t code) noexcept;

}  // namespace zstdsafe
