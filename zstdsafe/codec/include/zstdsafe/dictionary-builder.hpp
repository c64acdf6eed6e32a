#pragma once

#include <cstddef>
#include <span>

#include "zstdsafe/buffer-view.hpp"
#include "zstdsafe/result.hpp"

namespace zstdsafe {

// Trains a structured dictionary from 'samples', the concatenation of samples whose individual sizes are listed in
// 'sampleSizes', and writes it to the unfilled part of 'dictBuffer' whose remaining size is the maximum dictionary
// size (a few hundred bytes at least, ~100 KiB is a common choice).
// On success, 'dictBuffer' is advanced by the dictionary size, which is also returned.
//
// Throws std::logic_error if the sample sizes do not add up to the size of 'samples'.
// Returns ErrorKind::Unsupported if this build has no dictionary builder, ErrorKind::DestinationTooSmall if
// 'dictBuffer' has no room at all, and ErrorKind::DictionaryProblem if training failed (typically not enough samples).
Result<std::size_t> TrainFromBuffer(OutBuffer &dictBuffer, std::span<const std::byte> samples,
                                    std::span<const std::size_t> sampleSizes);

}  // namespace zstdsafe
