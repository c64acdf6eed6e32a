#include "zstdsafe/dictionary.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

#include "zstdsafe/frame-info.hpp"
#include "zstdsafe/log.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

void FreeCDict(ZSTD_CDict *cdict) { (void)ZSTD_freeCDict(cdict); }
void FreeDDict(ZSTD_DDict *ddict) { (void)ZSTD_freeDDict(ddict); }

// The native creators only report failures with a null pointer. A structured dictionary is the only input that
// can be rejected, anything else is considered as raw content.
ZstdError DigestFailure(std::span<const std::byte> dictBytes) {
  if (HasDictionaryMagic(dictBytes)) {
    return ZstdError(ZSTD_error_dictionary_corrupted);
  }
  return ZstdError(ZSTD_error_memory_allocation);
}

[[noreturn]] void ThrowDigestFailure(const ZstdError &error) {
  if (error.kind() == ErrorKind::MemoryAllocation) {
    throw std::bad_alloc();
  }
  throw std::invalid_argument(std::format("Unable to digest dictionary: {}", error.message()));
}

Result<std::shared_ptr<ZSTD_CDict>> DigestCDict(std::span<const std::byte> dictBytes, int compressionLevel) {
  std::shared_ptr<ZSTD_CDict> cdict(ZSTD_createCDict(dictBytes.data(), dictBytes.size(), compressionLevel),
                                    &FreeCDict);
  if (!cdict) {
    auto error = DigestFailure(dictBytes);
    log::error("Compression dictionary of {} bytes rejected: {}", dictBytes.size(), error.message());
    return error;
  }
  return cdict;
}

Result<std::shared_ptr<ZSTD_DDict>> DigestDDict(std::span<const std::byte> dictBytes) {
  std::shared_ptr<ZSTD_DDict> ddict(ZSTD_createDDict(dictBytes.data(), dictBytes.size()), &FreeDDict);
  if (!ddict) {
    auto error = DigestFailure(dictBytes);
    log::error("Decompression dictionary of {} bytes rejected: {}", dictBytes.size(), error.message());
    return error;
  }
  return ddict;
}

[[noreturn]] void ThrowReleased() { throw std::logic_error("Operation on a released dictionary"); }

}  // namespace

CompressionDictionary::CompressionDictionary(std::span<const std::byte> dictBytes, int compressionLevel)
    : _dictId(GetDictIdFromDict(dictBytes).value_or(0)), _level(compressionLevel) {
  auto cdict = DigestCDict(dictBytes, compressionLevel);
  if (cdict.hasError()) {
    ThrowDigestFailure(cdict.error());
  }
  _cdict = std::move(cdict).value();
}

Result<CompressionDictionary> CompressionDictionary::TryCreate(std::span<const std::byte> dictBytes,
                                                               int compressionLevel) {
  auto cdict = DigestCDict(dictBytes, compressionLevel);
  if (cdict.hasError()) {
    return cdict.error();
  }
  return CompressionDictionary(Digested{}, std::move(cdict).value(), GetDictIdFromDict(dictBytes).value_or(0),
                               compressionLevel);
}

void CompressionDictionary::release() {
  if (!_cdict) {
    throw std::logic_error("Compression dictionary released twice");
  }
  _cdict.reset();
}

std::uint32_t CompressionDictionary::dictId() const {
  if (!_cdict) {
    ThrowReleased();
  }
  return _dictId;
}

std::size_t CompressionDictionary::sizeOf() const { return ZSTD_sizeof_CDict(native()); }

const ZSTD_CDict *CompressionDictionary::native() const {
  if (!_cdict) {
    ThrowReleased();
  }
  return _cdict.get();
}

const std::shared_ptr<ZSTD_CDict> &CompressionDictionary::shared() const {
  if (!_cdict) {
    ThrowReleased();
  }
  return _cdict;
}

DecompressionDictionary::DecompressionDictionary(std::span<const std::byte> dictBytes) {
  auto ddict = DigestDDict(dictBytes);
  if (ddict.hasError()) {
    ThrowDigestFailure(ddict.error());
  }
  _ddict = std::move(ddict).value();
}

Result<DecompressionDictionary> DecompressionDictionary::TryCreate(std::span<const std::byte> dictBytes) {
  auto ddict = DigestDDict(dictBytes);
  if (ddict.hasError()) {
    return ddict.error();
  }
  return DecompressionDictionary(Digested{}, std::move(ddict).value());
}

void DecompressionDictionary::release() {
  if (!_ddict) {
    throw std::logic_error("Decompression dictionary released twice");
  }
  _ddict.reset();
}

std::uint32_t DecompressionDictionary::dictId() const { return ZSTD_getDictID_fromDDict(native()); }

std::size_t DecompressionDictionary::sizeOf() const { return ZSTD_sizeof_DDict(native()); }

const ZSTD_DDict *DecompressionDictionary::native() const {
  if (!_ddict) {
    ThrowReleased();
  }
  return _ddict.get();
}

const std::shared_ptr<ZSTD_DDict> &DecompressionDictionary::shared() const {
  if (!_ddict) {
    ThrowReleased();
  }
  return _ddict;
}

bool HasDictionaryMagic(std::span<const std::byte> bytes) noexcept {
  const auto magic = details::ReadMagicNumber(bytes);
  return magic && *magic == ZSTD_MAGIC_DICTIONARY;
}

std::optional<std::uint32_t> GetDictIdFromDict(std::span<const std::byte> dictBytes) noexcept {
  const unsigned id = ZSTD_getDictID_fromDict(dictBytes.data(), dictBytes.size());
  if (id == 0) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(id);
}

std::optional<std::uint32_t> GetDictIdFromFrame(std::span<const std::byte> frame) noexcept {
  const unsigned id = ZSTD_getDictID_fromFrame(frame.data(), frame.size());
  if (id == 0) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(id);
}

}  // namespace zstdsafe
