#pragma once

#include <zstd.h>

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/dictionary.hpp"
#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

struct DecompressionConfig;

// Exclusive owner of a native ZSTD_DCtx.
// Same ownership, threading and staging rules as CompressionContext.
class DecompressionContext {
 public:
  // Allocates the native context. Throws std::bad_alloc on failure.
  DecompressionContext();

  // Allocates the native context and applies 'config'.
  // Throws std::invalid_argument if the config is invalid, std::bad_alloc on allocation failure.
  explicit DecompressionContext(const DecompressionConfig &config);

  // Allocates the native context, reporting ErrorKind::MemoryAllocation on failure.
  static Result<DecompressionContext> TryCreate();

  DecompressionContext(const DecompressionContext &) = delete;
  DecompressionContext(DecompressionContext &&other) noexcept;
  DecompressionContext &operator=(const DecompressionContext &) = delete;
  DecompressionContext &operator=(DecompressionContext &&other) noexcept;

  ~DecompressionContext();

  // Frees the native context. Must be called at most once, throws std::logic_error otherwise.
  void release();

  [[nodiscard]] ContextState state() const noexcept { return _state; }

  [[nodiscard]] bool released() const noexcept { return _state == ContextState::Released; }

  [[nodiscard]] std::size_t sizeOf() const;

  Status setParameter(DParameter param, int value);

  [[nodiscard]] std::optional<int> getParameter(DParameter param) const;

  [[nodiscard]] const DParameterTable &parameters() const;

  Status resetParameters() { return reset(ResetDirective::Parameters); }

  Status reset(ResetDirective directive);

  // Digests 'dictBytes' (copied) and uses it for all following frames. An empty span detaches any dictionary.
  // A corrupted dictionary is rejected with ErrorKind::DictionaryProblem and leaves the context without dictionary.
  Status loadDictionary(std::span<const std::byte> dictBytes);

  // References a digested dictionary for all following frames. The context shares its ownership.
  Status refDictionary(const DecompressionDictionary &dictionary);

  Status clearDictionary();

  // ---- One-shot decompression ----
  // 'src' must hold whole frames. On success, 'src' is fully consumed and 'dst' advanced by the decompressed size.
  // A too small 'dst' is reported as ErrorKind::DestinationTooSmall.

  Result<std::size_t> decompress(OutBuffer &dst, InBuffer &src);

  Result<std::size_t> decompressUsingDict(OutBuffer &dst, InBuffer &src, std::span<const std::byte> dictBytes);

  Result<std::size_t> decompressUsingDictionary(OutBuffer &dst, InBuffer &src,
                                                const DecompressionDictionary &dictionary);

  // ---- Streaming ----

  // Issues exactly one native stream call with the remaining parts of 'src' and 'dst', and advances both cursors by
  // what the native layer consumed / produced. The frame is complete when the native hint is 0.
  // The context only enters ContextState::Streaming once the native layer consumed or produced bytes, so an empty
  // step does not lock parameters.
  Result<StepOutcome> decompressStream(OutBuffer &dst, InBuffer &src);

  [[nodiscard]] ZSTD_DCtx *native();

 private:
  explicit DecompressionContext(ZSTD_DCtx *dctx) noexcept : _dctx(dctx) {}

  ZSTD_DCtx *checkedNative(const char *operation) const;

  Status checkNotStreaming(const char *operation) const;

  Result<std::size_t> finishOneShot(std::size_t ret, OutBuffer &dst, InBuffer &src);

  static constexpr std::size_t kFrameHeadSize = 4;

  ZSTD_DCtx *_dctx{nullptr};
  ContextState _state{ContextState::Created};
  DParameterTable _parameters;
  std::shared_ptr<ZSTD_DDict> _ddict;
  // Leading bytes of the frame being streamed, gathered across steps until its magic number is known.
  std::array<std::byte, kFrameHeadSize> _frameHead{};
  std::size_t _frameHeadSize{0};
};

}  // namespace zstdsafe
