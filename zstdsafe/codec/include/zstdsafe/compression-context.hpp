#pragma once

#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/dictionary.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

struct CompressionConfig;

// Exclusive owner of a native ZSTD_CCtx.
//
// The native context is stateful and not reentrant: this object cannot be copied, and all operations touching the
// native state are non-const, so two calls on the same context can only overlap if the caller shares it
// deliberately. Independent contexts may be used concurrently from different threads.
//
// Parameters and dictionaries can only be changed outside of a streaming session (i.e. before the first stream step
// of a frame, or after a reset). Doing so mid-session is rejected with ErrorKind::WrongStage.
//
// Any operation after release() (or on a moved-from context) throws std::logic_error.
class CompressionContext {
 public:
  // Allocates the native context. Throws std::bad_alloc on failure.
  CompressionContext();

  // Allocates the native context and applies 'config'.
  // Throws std::invalid_argument if the config is invalid, std::bad_alloc on allocation failure.
  explicit CompressionContext(const CompressionConfig &config);

  // Allocates the native context, reporting ErrorKind::MemoryAllocation on failure.
  static Result<CompressionContext> TryCreate();

  CompressionContext(const CompressionContext &) = delete;
  CompressionContext(CompressionContext &&other) noexcept;
  CompressionContext &operator=(const CompressionContext &) = delete;
  CompressionContext &operator=(CompressionContext &&other) noexcept;

  ~CompressionContext();

  // Frees the native context. Must be called at most once, throws std::logic_error otherwise.
  void release();

  [[nodiscard]] ContextState state() const noexcept { return _state; }

  [[nodiscard]] bool released() const noexcept { return _state == ContextState::Released; }

  // Current native memory footprint of the context.
  [[nodiscard]] std::size_t sizeOf() const;

  // ---- Parameters ----

  // Validates 'value' against the native bounds of 'param' and pushes it into the native context.
  // On failure, previously set parameters are unchanged.
  Status setParameter(CParameter param, int value);

  Status setParameter(Strategy strategy) { return setParameter(CParameter::Strategy, static_cast<int>(strategy)); }

  // Value explicitly set for 'param', std::nullopt if it is at its default.
  [[nodiscard]] std::optional<int> getParameter(CParameter param) const;

  [[nodiscard]] const CParameterTable &parameters() const;

  // Total uncompressed size of the next frame, written in its header when ContentSizeFlag is on.
  // std::nullopt means unknown. Frames whose content differs from the pledged size fail with CorruptedData.
  Status setPledgedSrcSize(std::optional<std::uint64_t> pledgedSrcSize);

  Status resetParameters() { return reset(ResetDirective::Parameters); }

  // Re-primes the context for a new independent frame, without reallocating.
  Status reset(ResetDirective directive);

  // ---- Dictionaries ----

  // Copies 'dictBytes' into the context, used for all following frames. An empty span detaches any dictionary.
  // Structured dictionaries are validated at load time, a corrupted one is rejected with
  // ErrorKind::DictionaryProblem and leaves the context without dictionary.
  Status loadDictionary(std::span<const std::byte> dictBytes);

  // References a digested dictionary for all following frames. The context shares its ownership.
  // Note that the digested dictionary's compression parameters take precedence over the context ones.
  Status refDictionary(const CompressionDictionary &dictionary);

  // Detaches any dictionary.
  Status clearDictionary();

  // ---- One-shot compression ----
  // Each call compresses the whole of 'src' into a single frame written in 'dst', using the current parameters and
  // dictionary. Any in-progress session is abandoned. On success, 'src' is fully consumed and 'dst' advanced by the
  // frame size.

  Result<std::size_t> compress(OutBuffer &dst, InBuffer &src);

  // One-shot compression with a raw dictionary and level, ignoring the context parameters.
  Result<std::size_t> compressUsingDict(OutBuffer &dst, InBuffer &src, std::span<const std::byte> dictBytes,
                                        int compressionLevel);

  // One-shot compression with a digested dictionary.
  Result<std::size_t> compressUsingDictionary(OutBuffer &dst, InBuffer &src, const CompressionDictionary &dictionary);

  // ---- Streaming ----

  // Issues exactly one native stream call with the remaining parts of 'src' and 'dst', and advances both cursors by
  // what the native layer consumed / produced. See CompressionStream for the loops built on top of it.
  Result<StepOutcome> compressStream2(OutBuffer &dst, InBuffer &src, EndDirective directive);

  // Native handle. Throws std::logic_error if released.
  [[nodiscard]] ZSTD_CCtx *native();

 private:
  explicit CompressionContext(ZSTD_CCtx *cctx) noexcept : _cctx(cctx) {}

  ZSTD_CCtx *checkedNative(const char *operation) const;

  Status checkNotStreaming(const char *operation) const;

  Result<std::size_t> finishOneShot(std::size_t ret, OutBuffer &dst, InBuffer &src);

  ZSTD_CCtx *_cctx{nullptr};
  ContextState _state{ContextState::Created};
  CParameterTable _parameters;
  // Keeps a referenced digested dictionary alive while the native context points to it.
  std::shared_ptr<ZSTD_CDict> _cdict;
};

}  // namespace zstdsafe
