#pragma once

#include <cstddef>
#include <cstdint>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/compression-context.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/decompression-context.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

// =============================================================================
// Streaming driver
// =============================================================================
// Drives repeated native stream calls over caller supplied buffer views until a directive is satisfied, or until
// more room (output) or more data (input) is needed from the caller.
//
// A full output buffer is never an error: the returned outcome tells whether the directive was satisfied, and the
// caller is expected to drain the output (for instance with OutBuffer::rewind) and call again.
//
// Streams borrow their context for their whole lifetime, the context must outlive them and must not be used
// through another path meanwhile. A failed call leaves the session in an undefined state: the context rejects
// further stream calls until it is reset. Bytes consumed or produced before the failure stay accounted for.
//
// Typical compression loop:
//
//   CompressionStream stream(ctx);
//   while (has more input) { InBuffer in(chunk); while (!in.exhausted()) { stream.compress(in, out); drain(out); } }
//   for (;;) { auto res = stream.finish(out); drain(out); if (res && res.value().frameComplete) break; }
// =============================================================================

class CompressionStream {
 public:
  explicit CompressionStream(CompressionContext &ctx) noexcept : _ctx(ctx) {}

  // Issues exactly one native call.
  Result<StepOutcome> step(InBuffer &in, OutBuffer &out, EndDirective directive);

  // Feeds 'in' with the Continue directive until it is exhausted or 'out' is full.
  // The encoder may buffer data internally, so 'out' can receive nothing at all.
  Result<StepOutcome> compress(InBuffer &in, OutBuffer &out);

  // Writes all buffered compressed data, without closing the frame.
  // Satisfied when the returned hint is 0, otherwise 'out' is full and the caller must call again.
  Result<StepOutcome> flush(OutBuffer &out);

  // Feeds the remaining 'in' and finalizes the frame.
  // Satisfied when frameComplete is true, otherwise 'out' is full and the caller must call again.
  Result<StepOutcome> finish(InBuffer &in, OutBuffer &out);

  // Finalizes the frame with no more input.
  Result<StepOutcome> finish(OutBuffer &out);

  // Total bytes consumed and produced through this stream.
  [[nodiscard]] std::uint64_t totalIn() const noexcept { return _totalIn; }
  [[nodiscard]] std::uint64_t totalOut() const noexcept { return _totalOut; }

 private:
  Result<StepOutcome> drain(InBuffer &in, OutBuffer &out, EndDirective directive);

  CompressionContext &_ctx;
  std::uint64_t _totalIn{0};
  std::uint64_t _totalOut{0};
};

class DecompressionStream {
 public:
  explicit DecompressionStream(DecompressionContext &ctx) noexcept : _ctx(ctx) {}

  // Issues exactly one native call.
  Result<StepOutcome> step(InBuffer &in, OutBuffer &out);

  // Decodes 'in' into 'out' until one of:
  //  - the frame is complete (frameComplete true), 'in' may still hold the bytes of a following frame
  //  - 'out' is full, more decoded data may be pending
  //  - 'in' is exhausted and nothing is pending: the caller must supply more compressed bytes
  Result<StepOutcome> decompress(InBuffer &in, OutBuffer &out);

  [[nodiscard]] std::uint64_t totalIn() const noexcept { return _totalIn; }
  [[nodiscard]] std::uint64_t totalOut() const noexcept { return _totalOut; }

 private:
  DecompressionContext &_ctx;
  std::uint64_t _totalIn{0};
  std::uint64_t _totalOut{0};
};

}  // namespace zstdsafe
