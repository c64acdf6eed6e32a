#include "zstdsafe/buffer-view.hpp"

#include <cstddef>
#include <format>
#include <stdexcept>

namespace zstdsafe::details {

void ThrowPositionOutOfRange(std::size_t pos, std::size_t capacity) {
  throw std::logic_error(std::format("Buffer position {} exceeds its capacity {}", pos, capacity));
}

void ThrowAdvanceOutOfRange(std::size_t delta, std::size_t remaining) {
  throw std::logic_error(std::format("Cannot advance buffer position by {}, only {} bytes remain", delta, remaining));
}

}  // namespace zstdsafe::details
