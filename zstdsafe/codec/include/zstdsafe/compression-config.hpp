#pragma once

#include <zstd.h>

#include <cstdint>
#include <optional>

#include "zstdsafe/parameters.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

class CompressionContext;
class DecompressionContext;

// Most common compression settings, applied at once to a context.
// Fields left at their default value are not pushed to the native context, which keeps its own defaults.
// Finer tuning is available through CompressionContext::setParameter.
struct CompressionConfig {
  // Throws std::invalid_argument if a field is outside of the bounds supported by the linked native library,
  // or requires a capability this build does not have.
  void validate() const;

  // Pushes the non default fields to 'ctx'. Stops at the first failure.
  Status applyTo(CompressionContext &ctx) const;

  // Negative levels are faster, higher levels compress better. 0 selects the native default level.
  int compressionLevel{ZSTD_CLEVEL_DEFAULT};

  // Log2 of the maximum back-reference distance. 0 lets the level decide.
  int windowLog{0};

  // Adds a 32-bit checksum of the content at the end of each frame.
  bool checksum{false};

  // Writes the content size in frame headers when it is known.
  bool contentSize{true};

  // Writes the dictionary id in frame headers when a dictionary is used.
  bool dictId{true};

  // If unset, the level decides.
  std::optional<Strategy> strategy;

  bool longDistanceMatching{false};

  // Number of background compression threads. 0 compresses in the calling thread.
  // Requires a build with multithreading support.
  int nbWorkers{0};

  // Expected size of the next frame, only valid for one frame.
  std::optional<std::uint64_t> pledgedSrcSize;
};

struct DecompressionConfig {
  // Throws std::invalid_argument if windowLogMax is outside of the native bounds.
  void validate() const;

  Status applyTo(DecompressionContext &ctx) const;

  // Frames requiring a larger window are refused, protecting against excessive memory usage.
  // 0 keeps the native default limit.
  int windowLogMax{0};
};

}  // namespace zstdsafe
