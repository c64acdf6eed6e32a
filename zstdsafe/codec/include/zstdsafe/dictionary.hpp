#pragma once

#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>

#include "zstdsafe/result.hpp"

namespace zstdsafe {

// Dictionary pre-digested once by the native layer, reusable by many compression contexts.
// Dictionary bytes are copied at creation, the caller buffer may be discarded afterwards.
// The native structure is shared with every context referencing it, so releasing this object never invalidates a
// context still using it: the native memory goes away with its last user.
// A digested compression dictionary embeds the compression level given at creation.
class CompressionDictionary {
 public:
  // Throws std::bad_alloc on allocation failure and std::invalid_argument on a corrupted dictionary.
  CompressionDictionary(std::span<const std::byte> dictBytes, int compressionLevel);

  static Result<CompressionDictionary> TryCreate(std::span<const std::byte> dictBytes, int compressionLevel);

  // Drops this object's ownership of the native structure.
  // Throws std::logic_error if called twice.
  void release();

  [[nodiscard]] bool released() const noexcept { return !_cdict; }

  // Dictionary id as stored in the dictionary header, 0 for raw content dictionaries.
  [[nodiscard]] std::uint32_t dictId() const;

  [[nodiscard]] int compressionLevel() const noexcept { return _level; }

  [[nodiscard]] std::size_t sizeOf() const;

  // Native handle (never null). Throws std::logic_error if released.
  [[nodiscard]] const ZSTD_CDict *native() const;

  [[nodiscard]] const std::shared_ptr<ZSTD_CDict> &shared() const;

 private:
  struct Digested {};

  CompressionDictionary(Digested, std::shared_ptr<ZSTD_CDict> cdict, std::uint32_t dictId, int level) noexcept
      : _cdict(std::move(cdict)), _dictId(dictId), _level(level) {}

  std::shared_ptr<ZSTD_CDict> _cdict;
  std::uint32_t _dictId{0};
  int _level{0};
};

// Dictionary pre-digested once by the native layer, reusable by many decompression contexts.
// Same ownership rules as CompressionDictionary.
class DecompressionDictionary {
 public:
  // Throws std::bad_alloc on allocation failure and std::invalid_argument on a corrupted dictionary.
  explicit DecompressionDictionary(std::span<const std::byte> dictBytes);

  static Result<DecompressionDictionary> TryCreate(std::span<const std::byte> dictBytes);

  // Drops this object's ownership of the native structure.
  // Throws std::logic_error if called twice.
  void release();

  [[nodiscard]] bool released() const noexcept { return !_ddict; }

  [[nodiscard]] std::uint32_t dictId() const;

  [[nodiscard]] std::size_t sizeOf() const;

  [[nodiscard]] const ZSTD_DDict *native() const;

  [[nodiscard]] const std::shared_ptr<ZSTD_DDict> &shared() const;

 private:
  struct Digested {};

  DecompressionDictionary(Digested, std::shared_ptr<ZSTD_DDict> ddict) noexcept : _ddict(std::move(ddict)) {}

  std::shared_ptr<ZSTD_DDict> _ddict;
};

// True if 'bytes' starts with the magic number of structured zstd dictionaries.
// Dictionaries without it are treated by the native layer as raw content.
bool HasDictionaryMagic(std::span<const std::byte> bytes) noexcept;

// Dictionary id stored in a structured dictionary, std::nullopt for raw content.
std::optional<std::uint32_t> GetDictIdFromDict(std::span<const std::byte> dictBytes) noexcept;

// Dictionary id needed to decode the frame, std::nullopt if the frame does not require one (or does not record it).
std::optional<std::uint32_t> GetDictIdFromFrame(std::span<const std::byte> frame) noexcept;

}  // namespace zstdsafe
