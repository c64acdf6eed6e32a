#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace zstdsafe {

namespace details {

[[noreturn]] void ThrowPositionOutOfRange(std::size_t pos, std::size_t capacity);
[[noreturn]] void ThrowAdvanceOutOfRange(std::size_t delta, std::size_t remaining);

}  // namespace details

// Read-only cursor over a caller-owned contiguous byte region.
// The cursor tracks how many bytes have been consumed by the native layer.
// It never owns, copies nor reallocates the underlying memory, which must outlive the view.
class InBuffer {
 public:
  InBuffer() noexcept = default;

  InBuffer(const void *data, std::size_t size, std::size_t pos = 0)
      : _data(static_cast<const std::byte *>(data)), _size(size), _pos(pos) {
    if (pos > size) [[unlikely]] {
      details::ThrowPositionOutOfRange(pos, size);
    }
  }

  explicit InBuffer(std::span<const std::byte> src, std::size_t pos = 0) : InBuffer(src.data(), src.size(), pos) {}

  explicit InBuffer(std::string_view src, std::size_t pos = 0) : InBuffer(src.data(), src.size(), pos) {}

  [[nodiscard]] const std::byte *data() const noexcept { return _data; }

  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  [[nodiscard]] std::size_t pos() const noexcept { return _pos; }

  [[nodiscard]] std::size_t remaining() const noexcept { return _size - _pos; }

  [[nodiscard]] bool exhausted() const noexcept { return _pos == _size; }

  // Bytes already consumed.
  [[nodiscard]] std::span<const std::byte> consumed() const noexcept { return {_data, _pos}; }

  // Bytes not yet consumed - this is what is handed to the native layer.
  [[nodiscard]] std::span<const std::byte> unconsumed() const noexcept { return {_data + _pos, remaining()}; }

  // Marks 'delta' more bytes as consumed.
  // Throws std::logic_error if it would move the cursor past the end of the region.
  void advance(std::size_t delta) {
    if (delta > remaining()) [[unlikely]] {
      details::ThrowAdvanceOutOfRange(delta, remaining());
    }
    _pos += delta;
  }

 private:
  const std::byte *_data{nullptr};
  std::size_t _size{0};
  std::size_t _pos{0};
};

// Writable cursor over a caller-owned contiguous byte region.
// The cursor tracks how many bytes have been produced by the native layer.
class OutBuffer {
 public:
  OutBuffer() noexcept = default;

  OutBuffer(void *data, std::size_t capacity, std::size_t pos = 0)
      : _data(static_cast<std::byte *>(data)), _capacity(capacity), _pos(pos) {
    if (pos > capacity) [[unlikely]] {
      details::ThrowPositionOutOfRange(pos, capacity);
    }
  }

  explicit OutBuffer(std::span<std::byte> dst, std::size_t pos = 0) : OutBuffer(dst.data(), dst.size(), pos) {}

  explicit OutBuffer(std::span<char> dst, std::size_t pos = 0) : OutBuffer(dst.data(), dst.size(), pos) {}

  [[nodiscard]] std::byte *data() noexcept { return _data; }
  [[nodiscard]] const std::byte *data() const noexcept { return _data; }

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] std::size_t pos() const noexcept { return _pos; }

  [[nodiscard]] std::size_t remaining() const noexcept { return _capacity - _pos; }

  [[nodiscard]] bool full() const noexcept { return _pos == _capacity; }

  // Bytes already produced.
  [[nodiscard]] std::span<const std::byte> written() const noexcept { return {_data, _pos}; }

  [[nodiscard]] std::string_view writtenChars() const noexcept {
    return {reinterpret_cast<const char *>(_data), _pos};
  }

  // Space not yet filled - this is what is handed to the native layer.
  [[nodiscard]] std::span<std::byte> unfilled() noexcept { return {_data + _pos, remaining()}; }

  // Marks 'delta' more bytes as produced.
  // Throws std::logic_error if it would move the cursor past the capacity.
  void advance(std::size_t delta) {
    if (delta > remaining()) [[unlikely]] {
      details::ThrowAdvanceOutOfRange(delta, remaining());
    }
    _pos += delta;
  }

  // Restarts filling from the beginning of the region, typically after the caller drained the produced bytes.
  void rewind() noexcept { _pos = 0; }

 private:
  std::byte *_data{nullptr};
  std::size_t _capacity{0};
  std::size_t _pos{0};
};

}  // namespace zstdsafe
