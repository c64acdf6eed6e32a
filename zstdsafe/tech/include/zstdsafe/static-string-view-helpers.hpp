#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace zstdsafe {

// Compile time concatenation of static std::string_view objects.
// 'value' points to a static, null terminated storage.
template <std::string_view const &...Parts>
struct JoinStringView {
  static constexpr auto kChars = [] {
    std::array<char, (Parts.size() + ... + 0U) + 1U> chars{};
    std::size_t pos = 0;
    ((Parts.copy(chars.data() + pos, Parts.size()), pos += Parts.size()), ...);
    return chars;
  }();

  static constexpr std::string_view value{kChars.data(), kChars.size() - 1U};
};

// Compile time decimal representation of an unsigned value, such as a version component.
template <unsigned Value>
struct UnsignedToStringView {
  static constexpr std::size_t kNbDigits = [] {
    std::size_t nb = 1;
    for (unsigned val = Value; val >= 10U; val /= 10U) {
      ++nb;
    }
    return nb;
  }();

  static constexpr auto kChars = [] {
    std::array<char, kNbDigits> chars{};
    unsigned val = Value;
    for (auto it = chars.rbegin(); it != chars.rend(); ++it) {
      *it = static_cast<char>('0' + (val % 10U));
      val /= 10U;
    }
    return chars;
  }();

  static constexpr std::string_view value{kChars.data(), kChars.size()};
};

}  // namespace zstdsafe
