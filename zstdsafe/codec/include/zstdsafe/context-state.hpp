#pragma once

#include <zstd.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace zstdsafe {

// Lifecycle of a compression or decompression context.
//   Created -> Configured (parameters / dictionary applied, or after a reset)
//   Configured -> Streaming (first stream step of a frame) -> Configured (frame finished)
//   Streaming -> Failed (a stream step reported an error, reset required)
//   any -> Released (terminal)
enum class ContextState : std::uint8_t { Created, Configured, Streaming, Failed, Released };

std::string_view ContextStateName(ContextState state);

// What a reset re-initializes.
enum class ResetDirective : std::uint8_t {
  // Abandons the current frame, keeps parameters and dictionary.
  SessionOnly = ZSTD_reset_session_only,
  // Restores default parameters and drops the dictionary. Only legal outside of a session.
  Parameters = ZSTD_reset_parameters,
  SessionAndParameters = ZSTD_reset_session_and_parameters
};

// Caller's instruction to a compression stream step.
enum class EndDirective : std::uint8_t {
  // Let the encoder buffer input as it sees fit.
  Continue = ZSTD_e_continue,
  // Emit all buffered data, the frame stays open.
  Flush = ZSTD_e_flush,
  // Finalize the frame (epilogue and optional checksum).
  End = ZSTD_e_end
};

// Outcome of one streaming call.
struct StepOutcome {
  // Advisory byte count returned by the native layer:
  //  - compression with Flush / End: bytes still buffered internally, waiting to be written out.
  //  - decompression: suggested size of the next input chunk.
  std::size_t hint{0};
  // True when the frame is fully written (compression with End) or fully decoded and flushed (decompression).
  bool frameComplete{false};

  bool operator==(const StepOutcome &) const noexcept = default;
};

}  // namespace zstdsafe
