#include "zstdsafe/stream-driver.hpp"

#include <cstddef>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/context-state.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

Result<StepOutcome> CompressionStream::step(InBuffer &in, OutBuffer &out, EndDirective directive) {
  const auto inBefore = in.pos();
  const auto outBefore = out.pos();
  auto outcome = _ctx.compressStream2(out, in, directive);
  _totalIn += in.pos() - inBefore;
  _totalOut += out.pos() - outBefore;
  return outcome;
}

Result<StepOutcome> CompressionStream::compress(InBuffer &in, OutBuffer &out) {
  for (;;) {
    const auto inBefore = in.pos();
    const auto outBefore = out.pos();
    auto outcome = step(in, out, EndDirective::Continue);
    if (outcome.hasError() || in.exhausted() || out.full()) {
      return outcome;
    }
    if (in.pos() == inBefore && out.pos() == outBefore) {
      // No progress possible without caller action.
      return outcome;
    }
  }
}

Result<StepOutcome> CompressionStream::drain(InBuffer &in, OutBuffer &out, EndDirective directive) {
  for (;;) {
    const auto inBefore = in.pos();
    const auto outBefore = out.pos();
    auto outcome = step(in, out, directive);
    if (outcome.hasError()) {
      return outcome;
    }
    // A single call may not have had enough output room to write everything out.
    if ((outcome.value().hint == 0 && in.exhausted()) || out.full()) {
      return outcome;
    }
    if (in.pos() == inBefore && out.pos() == outBefore) {
      return outcome;
    }
  }
}

Result<StepOutcome> CompressionStream::flush(OutBuffer &out) {
  InBuffer noInput;
  return drain(noInput, out, EndDirective::Flush);
}

Result<StepOutcome> CompressionStream::finish(InBuffer &in, OutBuffer &out) {
  return drain(in, out, EndDirective::End);
}

Result<StepOutcome> CompressionStream::finish(OutBuffer &out) {
  InBuffer noInput;
  return drain(noInput, out, EndDirective::End);
}

Result<StepOutcome> DecompressionStream::step(InBuffer &in, OutBuffer &out) {
  const auto inBefore = in.pos();
  const auto outBefore = out.pos();
  auto outcome = _ctx.decompressStream(out, in);
  _totalIn += in.pos() - inBefore;
  _totalOut += out.pos() - outBefore;
  return outcome;
}

Result<StepOutcome> DecompressionStream::decompress(InBuffer &in, OutBuffer &out) {
  for (;;) {
    const auto inBefore = in.pos();
    const auto outBefore = out.pos();
    auto outcome = step(in, out);
    if (outcome.hasError() || outcome.value().frameComplete || out.full()) {
      return outcome;
    }
    // Input exhausted and nothing more was flushed: the caller has to supply more compressed bytes.
    // Note that hint != 0 with an exhausted input means 'needs more input', not 'frame complete'.
    if (in.pos() == inBefore && out.pos() == outBefore) {
      return outcome;
    }
    if (in.exhausted() && out.pos() == outBefore) {
      return outcome;
    }
  }
}

}  // namespace zstdsafe
