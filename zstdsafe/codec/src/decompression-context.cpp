#include "zstdsafe/decompression-context.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <format>
#include <new>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/compression-config.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/dictionary.hpp"
#include "zstdsafe/features.hpp"
#include "zstdsafe/frame-info.hpp"
#include "zstdsafe/log.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

void FreeNativeContext(ZSTD_DCtx *dctx) {
  const std::size_t ret = ZSTD_freeDCtx(dctx);
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    log::warn("ZSTD_freeDCtx returned {} (ignored)", ZSTD_getErrorName(ret));
  }
}

ZstdError WrongStage() { return ZstdError(ErrorKind::WrongStage, ZSTD_error_stage_wrong); }

// True if 'frameStart' begins with a legacy magic number, or with a prefix of one when fewer than 4 bytes are known.
bool StartsLikeLegacyFrame(std::span<const std::byte> frameStart) {
  if (frameStart.size() >= 4U) {
    return HasLegacyFrameMagic(frameStart);
  }
  if (frameStart.empty()) {
    return false;
  }
  // Little endian 0xFD2FB51E to 0xFD2FB527.
  static constexpr std::array<std::byte, 3> kLegacyMagicHighBytes{std::byte{0xB5}, std::byte{0x2F}, std::byte{0xFD}};
  const auto firstByte = std::to_integer<unsigned>(frameStart.front());
  return firstByte >= 0x1EU && firstByte <= 0x27U &&
         std::ranges::equal(frameStart.subspan(1), std::span(kLegacyMagicHighBytes).first(frameStart.size() - 1U));
}

// Frames of pre-1.0 formats are only understood when the native library is built with legacy support, which the
// build option cannot guarantee. An unknown prefix looking like a legacy magic is therefore unsupported, not corrupted.
ZstdError RefineDecodingError(ZstdError error, std::span<const std::byte> frameStart) {
  if (error.code() == ZSTD_error_prefix_unknown && StartsLikeLegacyFrame(frameStart)) {
    return ZstdError(ErrorKind::Unsupported, ZSTD_error_prefix_unknown);
  }
  return error;
}

// Refuses legacy frames before any native call when legacy support is disabled, even if the linked native library
// could decode them.
std::optional<ZstdError> RejectLegacyFrame([[maybe_unused]] std::span<const std::byte> frameStart) {
  if constexpr (!legacyEnabled()) {
    if (HasLegacyFrameMagic(frameStart)) {
      log::error("Legacy zstd frame rejected: legacy format support is disabled");
      return ZstdError(ErrorKind::Unsupported, ZSTD_error_prefix_unknown);
    }
  }
  return std::nullopt;
}

}  // namespace

DecompressionContext::DecompressionContext() : _dctx(ZSTD_createDCtx()) {
  if (_dctx == nullptr) [[unlikely]] {
    throw std::bad_alloc();
  }
  log::debug("Decompression context created");
}

DecompressionContext::DecompressionContext(const DecompressionConfig &config) : DecompressionContext() {
  config.validate();
  auto status = config.applyTo(*this);
  if (status.hasError()) {
    throw std::invalid_argument(std::format("Unable to apply decompression config: {}", status.error().message()));
  }
}

Result<DecompressionContext> DecompressionContext::TryCreate() {
  ZSTD_DCtx *dctx = ZSTD_createDCtx();
  if (dctx == nullptr) [[unlikely]] {
    return ZstdError(ZSTD_error_memory_allocation);
  }
  log::debug("Decompression context created");
  return DecompressionContext(dctx);
}

DecompressionContext::DecompressionContext(DecompressionContext &&other) noexcept
    : _dctx(std::exchange(other._dctx, nullptr)),
      _state(std::exchange(other._state, ContextState::Released)),
      _parameters(std::move(other._parameters)),
      _ddict(std::move(other._ddict)),
      _frameHead(other._frameHead),
      _frameHeadSize(std::exchange(other._frameHeadSize, 0)) {}

DecompressionContext &DecompressionContext::operator=(DecompressionContext &&other) noexcept {
  if (this != &other) {
    if (_dctx != nullptr) {
      FreeNativeContext(_dctx);
    }
    _dctx = std::exchange(other._dctx, nullptr);
    _state = std::exchange(other._state, ContextState::Released);
    _parameters = std::move(other._parameters);
    _ddict = std::move(other._ddict);
    _frameHead = other._frameHead;
    _frameHeadSize = std::exchange(other._frameHeadSize, 0);
  }
  return *this;
}

DecompressionContext::~DecompressionContext() {
  if (_dctx != nullptr) {
    FreeNativeContext(_dctx);
  }
}

void DecompressionContext::release() {
  if (_dctx == nullptr) {
    throw std::logic_error("Decompression context released twice");
  }
  FreeNativeContext(_dctx);
  _dctx = nullptr;
  _state = ContextState::Released;
  _parameters.clear();
  _ddict.reset();
  _frameHeadSize = 0;
  log::debug("Decompression context released");
}

ZSTD_DCtx *DecompressionContext::checkedNative(const char *operation) const {
  if (_dctx == nullptr) [[unlikely]] {
    throw std::logic_error(std::format("{} called on a released decompression context", operation));
  }
  return _dctx;
}

ZSTD_DCtx *DecompressionContext::native() { return checkedNative("native"); }

Status DecompressionContext::checkNotStreaming(const char *operation) const {
  if (_state == ContextState::Streaming || _state == ContextState::Failed) {
    log::error("{} rejected: decompression context is {}", operation, ContextStateName(_state));
    return WrongStage();
  }
  return Success{};
}

std::size_t DecompressionContext::sizeOf() const { return ZSTD_sizeof_DCtx(checkedNative("sizeOf")); }

Status DecompressionContext::setParameter(DParameter param, int value) {
  ZSTD_DCtx *dctx = checkedNative("setParameter");
  auto status = checkNotStreaming("setParameter");
  if (status.hasError()) {
    return status;
  }
  status = details::ValidateParameter(param, value);
  if (status.hasError()) {
    log::debug("Decompression parameter {}={} rejected: {}", ParameterName(param), value, status.error().message());
    return status;
  }
  status = TranslateStatus(ZSTD_DCtx_setParameter(dctx, static_cast<ZSTD_dParameter>(param), value));
  if (status.hasError()) {
    return status;
  }
  _parameters.set(param, value);
  _state = ContextState::Configured;
  return status;
}

std::optional<int> DecompressionContext::getParameter(DParameter param) const {
  checkedNative("getParameter");
  return _parameters.get(param);
}

const DParameterTable &DecompressionContext::parameters() const {
  checkedNative("parameters");
  return _parameters;
}

Status DecompressionContext::reset(ResetDirective directive) {
  ZSTD_DCtx *dctx = checkedNative("reset");
  auto status = TranslateStatus(ZSTD_DCtx_reset(dctx, static_cast<ZSTD_ResetDirective>(directive)));
  if (status.hasError()) {
    log::error("Decompression context reset failed: {}", status.error().message());
    return status;
  }
  if (directive != ResetDirective::SessionOnly) {
    _parameters.clear();
    _ddict.reset();
  }
  _frameHeadSize = 0;
  _state = ContextState::Configured;
  return status;
}

Status DecompressionContext::loadDictionary(std::span<const std::byte> dictBytes) {
  checkedNative("loadDictionary");
  auto status = checkNotStreaming("loadDictionary");
  if (status.hasError()) {
    return status;
  }
  if (dictBytes.empty()) {
    return clearDictionary();
  }
  // Digest it ourselves: the native loader reports a corrupted dictionary as an allocation failure.
  auto digested = DecompressionDictionary::TryCreate(dictBytes);
  if (digested.hasError()) {
    status = clearDictionary();
    if (status.hasError()) {
      return status;
    }
    return digested.error();
  }
  status = refDictionary(digested.value());
  if (!status.hasError()) {
    log::debug("Loaded decompression dictionary of {} bytes", dictBytes.size());
  }
  return status;
}

Status DecompressionContext::refDictionary(const DecompressionDictionary &dictionary) {
  ZSTD_DCtx *dctx = checkedNative("refDictionary");
  auto status = checkNotStreaming("refDictionary");
  if (status.hasError()) {
    return status;
  }
  status = TranslateStatus(ZSTD_DCtx_refDDict(dctx, dictionary.native()));
  if (status.hasError()) {
    return status;
  }
  _ddict = dictionary.shared();
  _state = ContextState::Configured;
  return status;
}

Status DecompressionContext::clearDictionary() {
  ZSTD_DCtx *dctx = checkedNative("clearDictionary");
  auto status = checkNotStreaming("clearDictionary");
  if (status.hasError()) {
    return status;
  }
  status = TranslateStatus(ZSTD_DCtx_loadDictionary(dctx, nullptr, 0));
  if (!status.hasError()) {
    _ddict.reset();
  }
  return status;
}

Result<std::size_t> DecompressionContext::finishOneShot(std::size_t ret, OutBuffer &dst, InBuffer &src) {
  auto written = TranslateReturnCode(ret);
  if (written.hasError()) {
    _state = ContextState::Failed;
    return RefineDecodingError(written.error(), src.unconsumed());
  }
  dst.advance(written.value());
  src.advance(src.remaining());
  _frameHeadSize = 0;
  _state = ContextState::Configured;
  return written;
}

Result<std::size_t> DecompressionContext::decompress(OutBuffer &dst, InBuffer &src) {
  ZSTD_DCtx *dctx = checkedNative("decompress");
  if (auto rejected = RejectLegacyFrame(src.unconsumed())) {
    return *rejected;
  }
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(ZSTD_decompressDCtx(dctx, output.data(), output.size(), input.data(), input.size()), dst,
                       src);
}

Result<std::size_t> DecompressionContext::decompressUsingDict(OutBuffer &dst, InBuffer &src,
                                                              std::span<const std::byte> dictBytes) {
  ZSTD_DCtx *dctx = checkedNative("decompressUsingDict");
  if (auto rejected = RejectLegacyFrame(src.unconsumed())) {
    return *rejected;
  }
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(ZSTD_decompress_usingDict(dctx, output.data(), output.size(), input.data(), input.size(),
                                                 dictBytes.data(), dictBytes.size()),
                       dst, src);
}

Result<std::size_t> DecompressionContext::decompressUsingDictionary(OutBuffer &dst, InBuffer &src,
                                                                    const DecompressionDictionary &dictionary) {
  ZSTD_DCtx *dctx = checkedNative("decompressUsingDictionary");
  if (auto rejected = RejectLegacyFrame(src.unconsumed())) {
    return *rejected;
  }
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(ZSTD_decompress_usingDDict(dctx, output.data(), output.size(), input.data(), input.size(),
                                                  dictionary.native()),
                       dst, src);
}

Result<StepOutcome> DecompressionContext::decompressStream(OutBuffer &dst, InBuffer &src) {
  ZSTD_DCtx *dctx = checkedNative("decompressStream");
  if (_state == ContextState::Failed) {
    log::error("decompressStream rejected: a previous step failed, the context must be reset");
    return WrongStage();
  }
  if (src.exhausted() && _state != ContextState::Streaming) {
    // Even an empty native call opens a session that locks parameters. Ask for input instead.
    return StepOutcome{ZSTD_DStreamInSize(), false};
  }

  const auto output = dst.unfilled();
  const auto input = src.unconsumed();

  // The magic number may be split over several steps: check it on the bytes seen so far completed by this chunk.
  const std::size_t headMissing = kFrameHeadSize - _frameHeadSize;
  const std::size_t headTaken = std::min(headMissing, input.size());
  std::array<std::byte, kFrameHeadSize> head = _frameHead;
  std::ranges::copy(input.first(headTaken), head.begin() + static_cast<std::ptrdiff_t>(_frameHeadSize));
  const std::span<const std::byte> frameHead(head.data(), _frameHeadSize + headTaken);
  if (headMissing != 0) {
    if (auto rejected = RejectLegacyFrame(frameHead)) {
      return *rejected;
    }
  }

  ZSTD_outBuffer outBuf{output.data(), output.size(), 0};
  ZSTD_inBuffer inBuf{input.data(), input.size(), 0};

  const std::size_t ret = ZSTD_decompressStream(dctx, &outBuf, &inBuf);

  dst.advance(outBuf.pos);
  src.advance(inBuf.pos);

  const std::size_t headConsumed = std::min(headMissing, inBuf.pos);
  std::ranges::copy(input.first(headConsumed), _frameHead.begin() + static_cast<std::ptrdiff_t>(_frameHeadSize));
  _frameHeadSize += headConsumed;
  if (inBuf.pos != 0 || outBuf.pos != 0) {
    _state = ContextState::Streaming;
  }

  auto hint = TranslateReturnCode(ret);
  if (hint.hasError()) [[unlikely]] {
    _state = ContextState::Failed;
    log::error("ZSTD_decompressStream failed: {}", hint.error().message());
    return RefineDecodingError(hint.error(), frameHead);
  }

  StepOutcome outcome{hint.value(), hint.value() == 0};
  if (outcome.frameComplete) {
    _frameHeadSize = 0;
    _state = ContextState::Configured;
  }
  return outcome;
}

}  // namespace zstdsafe
