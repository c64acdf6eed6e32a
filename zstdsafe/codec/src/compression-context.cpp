#include "zstdsafe/compression-context.hpp"

#include <zstd.h>
#include <zstd_errors.h>

#include <cstddef>
#include <cstdint>
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
#include "zstdsafe/log.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"
#include "zstdsafe/zstd-error.hpp"

namespace zstdsafe {

namespace {

void FreeNativeContext(ZSTD_CCtx *cctx) {
  const std::size_t ret = ZSTD_freeCCtx(cctx);
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    log::warn("ZSTD_freeCCtx returned {} (ignored)", ZSTD_getErrorName(ret));
  }
}

ZstdError WrongStage() { return ZstdError(ErrorKind::WrongStage, ZSTD_error_stage_wrong); }

}  // namespace

CompressionContext::CompressionContext() : _cctx(ZSTD_createCCtx()) {
  if (_cctx == nullptr) [[unlikely]] {
    throw std::bad_alloc();
  }
  log::debug("Compression context created");
}

CompressionContext::CompressionContext(const CompressionConfig &config) : CompressionContext() {
  config.validate();
  auto status = config.applyTo(*this);
  if (status.hasError()) {
    throw std::invalid_argument(std::format("Unable to apply compression config: {}", status.error().message()));
  }
}

Result<CompressionContext> CompressionContext::TryCreate() {
  ZSTD_CCtx *cctx = ZSTD_createCCtx();
  if (cctx == nullptr) [[unlikely]] {
    return ZstdError(ZSTD_error_memory_allocation);
  }
  log::debug("Compression context created");
  return CompressionContext(cctx);
}

CompressionContext::CompressionContext(CompressionContext &&other) noexcept
    : _cctx(std::exchange(other._cctx, nullptr)),
      _state(std::exchange(other._state, ContextState::Released)),
      _parameters(std::move(other._parameters)),
      _cdict(std::move(other._cdict)) {}

CompressionContext &CompressionContext::operator=(CompressionContext &&other) noexcept {
  if (this != &other) {
    if (_cctx != nullptr) {
      FreeNativeContext(_cctx);
    }
    _cctx = std::exchange(other._cctx, nullptr);
    _state = std::exchange(other._state, ContextState::Released);
    _parameters = std::move(other._parameters);
    _cdict = std::move(other._cdict);
  }
  return *this;
}

CompressionContext::~CompressionContext() {
  if (_cctx != nullptr) {
    FreeNativeContext(_cctx);
  }
}

void CompressionContext::release() {
  if (_cctx == nullptr) {
    throw std::logic_error("Compression context released twice");
  }
  FreeNativeContext(_cctx);
  _cctx = nullptr;
  _state = ContextState::Released;
  _parameters.clear();
  _cdict.reset();
  log::debug("Compression context released");
}

ZSTD_CCtx *CompressionContext::checkedNative(const char *operation) const {
  if (_cctx == nullptr) [[unlikely]] {
    throw std::logic_error(std::format("{} called on a released compression context", operation));
  }
  return _cctx;
}

ZSTD_CCtx *CompressionContext::native() { return checkedNative("native"); }

Status CompressionContext::checkNotStreaming(const char *operation) const {
  if (_state == ContextState::Streaming || _state == ContextState::Failed) {
    log::error("{} rejected: compression context is {}", operation, ContextStateName(_state));
    return WrongStage();
  }
  return Success{};
}

std::size_t CompressionContext::sizeOf() const { return ZSTD_sizeof_CCtx(checkedNative("sizeOf")); }

Status CompressionContext::setParameter(CParameter param, int value) {
  ZSTD_CCtx *cctx = checkedNative("setParameter");
  auto status = checkNotStreaming("setParameter");
  if (status.hasError()) {
    return status;
  }
  status = details::ValidateParameter(param, value);
  if (status.hasError()) {
    log::debug("Compression parameter {}={} rejected: {}", ParameterName(param), value, status.error().message());
    return status;
  }
  status = TranslateStatus(ZSTD_CCtx_setParameter(cctx, static_cast<ZSTD_cParameter>(param), value));
  if (status.hasError()) {
    return status;
  }
  _parameters.set(param, value);
  _state = ContextState::Configured;
  return status;
}

std::optional<int> CompressionContext::getParameter(CParameter param) const {
  checkedNative("getParameter");
  return _parameters.get(param);
}

const CParameterTable &CompressionContext::parameters() const {
  checkedNative("parameters");
  return _parameters;
}

Status CompressionContext::setPledgedSrcSize(std::optional<std::uint64_t> pledgedSrcSize) {
  ZSTD_CCtx *cctx = checkedNative("setPledgedSrcSize");
  auto status = checkNotStreaming("setPledgedSrcSize");
  if (status.hasError()) {
    return status;
  }
  const unsigned long long nativeSize = pledgedSrcSize ? *pledgedSrcSize : ZSTD_CONTENTSIZE_UNKNOWN;
  status = TranslateStatus(ZSTD_CCtx_setPledgedSrcSize(cctx, nativeSize));
  if (!status.hasError()) {
    _state = ContextState::Configured;
  }
  return status;
}

Status CompressionContext::reset(ResetDirective directive) {
  ZSTD_CCtx *cctx = checkedNative("reset");
  auto status = TranslateStatus(ZSTD_CCtx_reset(cctx, static_cast<ZSTD_ResetDirective>(directive)));
  if (status.hasError()) {
    log::error("Compression context reset failed: {}", status.error().message());
    return status;
  }
  if (directive != ResetDirective::SessionOnly) {
    // Native parameter reset also forgets any dictionary.
    _parameters.clear();
    _cdict.reset();
  }
  _state = ContextState::Configured;
  return status;
}

Status CompressionContext::loadDictionary(std::span<const std::byte> dictBytes) {
  ZSTD_CCtx *cctx = checkedNative("loadDictionary");
  auto status = checkNotStreaming("loadDictionary");
  if (status.hasError()) {
    return status;
  }
  if (HasDictionaryMagic(dictBytes)) {
    // The native context only digests a loaded dictionary when the next frame starts, validate it now instead.
    const int level = _parameters.get(CParameter::CompressionLevel).value_or(ZSTD_CLEVEL_DEFAULT);
    auto digested = CompressionDictionary::TryCreate(dictBytes, level);
    if (digested.hasError()) {
      status = clearDictionary();
      if (status.hasError()) {
        return status;
      }
      return digested.error();
    }
  }
  status = TranslateStatus(ZSTD_CCtx_loadDictionary(cctx, dictBytes.data(), dictBytes.size()));
  if (status.hasError()) {
    return status;
  }
  _cdict.reset();
  _state = ContextState::Configured;
  log::debug("Loaded compression dictionary of {} bytes", dictBytes.size());
  return status;
}

Status CompressionContext::refDictionary(const CompressionDictionary &dictionary) {
  ZSTD_CCtx *cctx = checkedNative("refDictionary");
  auto status = checkNotStreaming("refDictionary");
  if (status.hasError()) {
    return status;
  }
  status = TranslateStatus(ZSTD_CCtx_refCDict(cctx, dictionary.native()));
  if (status.hasError()) {
    return status;
  }
  _cdict = dictionary.shared();
  _state = ContextState::Configured;
  return status;
}

Status CompressionContext::clearDictionary() {
  ZSTD_CCtx *cctx = checkedNative("clearDictionary");
  auto status = checkNotStreaming("clearDictionary");
  if (status.hasError()) {
    return status;
  }
  status = TranslateStatus(ZSTD_CCtx_loadDictionary(cctx, nullptr, 0));
  if (!status.hasError()) {
    _cdict.reset();
  }
  return status;
}

Result<std::size_t> CompressionContext::finishOneShot(std::size_t ret, OutBuffer &dst, InBuffer &src) {
  auto written = TranslateReturnCode(ret);
  if (written.hasError()) {
    // The native one-shot entry points restart a session on each call, but a subsequent parameter change would be
    // refused until then.
    _state = ContextState::Failed;
    return written;
  }
  dst.advance(written.value());
  src.advance(src.remaining());
  _state = ContextState::Configured;
  return written;
}

Result<std::size_t> CompressionContext::compress(OutBuffer &dst, InBuffer &src) {
  ZSTD_CCtx *cctx = checkedNative("compress");
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(ZSTD_compress2(cctx, output.data(), output.size(), input.data(), input.size()), dst, src);
}

Result<std::size_t> CompressionContext::compressUsingDict(OutBuffer &dst, InBuffer &src,
                                                          std::span<const std::byte> dictBytes,
                                                          int compressionLevel) {
  ZSTD_CCtx *cctx = checkedNative("compressUsingDict");
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(ZSTD_compress_usingDict(cctx, output.data(), output.size(), input.data(), input.size(),
                                               dictBytes.data(), dictBytes.size(), compressionLevel),
                       dst, src);
}

Result<std::size_t> CompressionContext::compressUsingDictionary(OutBuffer &dst, InBuffer &src,
                                                                const CompressionDictionary &dictionary) {
  ZSTD_CCtx *cctx = checkedNative("compressUsingDictionary");
  const auto input = src.unconsumed();
  const auto output = dst.unfilled();
  return finishOneShot(
      ZSTD_compress_usingCDict(cctx, output.data(), output.size(), input.data(), input.size(), dictionary.native()),
      dst, src);
}

Result<StepOutcome> CompressionContext::compressStream2(OutBuffer &dst, InBuffer &src, EndDirective directive) {
  ZSTD_CCtx *cctx = checkedNative("compressStream2");
  if (_state == ContextState::Failed) {
    log::error("compressStream2 rejected: a previous step failed, the context must be reset");
    return WrongStage();
  }
  if (directive == EndDirective::Continue && src.exhausted() && _state != ContextState::Streaming) {
    // Nothing to buffer: do not open a session that would lock parameters.
    return StepOutcome{};
  }

  // Positions handed to the native layer are relative to the remaining slices, hence always 0.
  const auto output = dst.unfilled();
  const auto input = src.unconsumed();
  ZSTD_outBuffer outBuf{output.data(), output.size(), 0};
  ZSTD_inBuffer inBuf{input.data(), input.size(), 0};

  _state = ContextState::Streaming;
  const std::size_t ret =
      ZSTD_compressStream2(cctx, &outBuf, &inBuf, static_cast<ZSTD_EndDirective>(directive));

  dst.advance(outBuf.pos);
  src.advance(inBuf.pos);

  auto hint = TranslateReturnCode(ret);
  if (hint.hasError()) [[unlikely]] {
    _state = ContextState::Failed;
    log::error("ZSTD_compressStream2 failed: {}", hint.error().message());
    return hint.error();
  }

  StepOutcome outcome{hint.value(), directive == EndDirective::End && hint.value() == 0};
  if (outcome.frameComplete) {
    _state = ContextState::Configured;
  }
  return outcome;
}

}  // namespace zstdsafe
