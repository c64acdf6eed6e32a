#pragma once

#include <zstd.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "zstdsafe/result.hpp"

namespace zstdsafe {

// Compression parameters recognized by this library, mapped onto the stable ZSTD_cParameter values.
enum class CParameter : std::int16_t {
  CompressionLevel = ZSTD_c_compressionLevel,
  WindowLog = ZSTD_c_windowLog,
  HashLog = ZSTD_c_hashLog,
  ChainLog = ZSTD_c_chainLog,
  SearchLog = ZSTD_c_searchLog,
  MinMatch = ZSTD_c_minMatch,
  TargetLength = ZSTD_c_targetLength,
  Strategy = ZSTD_c_strategy,
  EnableLongDistanceMatching = ZSTD_c_enableLongDistanceMatching,
  LdmHashLog = ZSTD_c_ldmHashLog,
  LdmMinMatch = ZSTD_c_ldmMinMatch,
  LdmBucketSizeLog = ZSTD_c_ldmBucketSizeLog,
  LdmHashRateLog = ZSTD_c_ldmHashRateLog,
  ContentSizeFlag = ZSTD_c_contentSizeFlag,
  ChecksumFlag = ZSTD_c_checksumFlag,
  DictIdFlag = ZSTD_c_dictIDFlag,
  NbWorkers = ZSTD_c_nbWorkers,
  JobSize = ZSTD_c_jobSize,
  OverlapLog = ZSTD_c_overlapLog
};

// Decompression parameters recognized by this library, mapped onto the stable ZSTD_dParameter values.
enum class DParameter : std::int16_t { WindowLogMax = ZSTD_d_windowLogMax };

// Values accepted by CParameter::Strategy, from fastest to strongest.
enum class Strategy : std::int8_t {
  Fast = ZSTD_fast,
  Dfast = ZSTD_dfast,
  Greedy = ZSTD_greedy,
  Lazy = ZSTD_lazy,
  Lazy2 = ZSTD_lazy2,
  Btlazy2 = ZSTD_btlazy2,
  Btopt = ZSTD_btopt,
  Btultra = ZSTD_btultra,
  Btultra2 = ZSTD_btultra2
};

// Which kind of context a parameter (or a context) belongs to.
enum class ContextKind : std::int8_t { Compression, Decompression };

inline constexpr CParameter kAllCParameters[] = {
    CParameter::CompressionLevel,
    CParameter::WindowLog,
    CParameter::HashLog,
    CParameter::ChainLog,
    CParameter::SearchLog,
    CParameter::MinMatch,
    CParameter::TargetLength,
    CParameter::Strategy,
    CParameter::EnableLongDistanceMatching,
    CParameter::LdmHashLog,
    CParameter::LdmMinMatch,
    CParameter::LdmBucketSizeLog,
    CParameter::LdmHashRateLog,
    CParameter::ContentSizeFlag,
    CParameter::ChecksumFlag,
    CParameter::DictIdFlag,
    CParameter::NbWorkers,
    CParameter::JobSize,
    CParameter::OverlapLog,
};

inline constexpr DParameter kAllDParameters[] = {DParameter::WindowLogMax};

std::string_view ParameterName(CParameter param);
std::string_view ParameterName(DParameter param);

// Converts a raw native identifier. Returns std::nullopt if the identifier is not a parameter of that context kind.
std::optional<CParameter> CParameterFromRaw(int rawId) noexcept;
std::optional<DParameter> DParameterFromRaw(int rawId) noexcept;

// Parameters that only make sense when the native library is built with multithreading support.
constexpr bool RequiresMultithread(CParameter param) noexcept {
  return param == CParameter::NbWorkers || param == CParameter::JobSize || param == CParameter::OverlapLog;
}

// The native setters treat 0 as "restore the default value" for these parameters, whatever their bounds.
constexpr bool ZeroMeansDefault(CParameter param) noexcept {
  switch (param) {
    case CParameter::ContentSizeFlag:
    case CParameter::ChecksumFlag:
    case CParameter::DictIdFlag:
    case CParameter::NbWorkers:
      return false;
    default:
      return true;
  }
}

constexpr bool ZeroMeansDefault(DParameter) noexcept { return true; }

// Inclusive range of legal values of a parameter, as advertised by the linked native library.
struct ParameterBounds {
  [[nodiscard]] constexpr bool contains(int value) const noexcept { return lower <= value && value <= upper; }

  bool operator==(const ParameterBounds &) const noexcept = default;

  int lower{0};
  int upper{0};
};

Result<ParameterBounds> Bounds(CParameter param) noexcept;
Result<ParameterBounds> Bounds(DParameter param) noexcept;

// Explicitly set parameter values of one context. Parameters absent from the table are at their native default.
template <class Param>
class ParameterTable {
 public:
  using entry_type = std::pair<Param, int>;

  [[nodiscard]] std::optional<int> get(Param param) const noexcept {
    auto it = find(param);
    if (it == _entries.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void set(Param param, int value) {
    auto it = std::ranges::find(_entries, param, &entry_type::first);
    if (it == _entries.end()) {
      _entries.emplace_back(param, value);
    } else {
      it->second = value;
    }
  }

  void clear() noexcept { _entries.clear(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] auto end() const noexcept { return _entries.end(); }

  bool operator==(const ParameterTable &rhs) const {
    return _entries.size() == rhs._entries.size() &&
           std::ranges::all_of(_entries, [&rhs](const entry_type &entry) {
             return rhs.get(entry.first) == std::optional<int>(entry.second);
           });
  }

 private:
  [[nodiscard]] auto find(Param param) const noexcept {
    return std::ranges::find(_entries, param, &entry_type::first);
  }

  std::vector<entry_type> _entries;
};

using CParameterTable = ParameterTable<CParameter>;
using DParameterTable = ParameterTable<DParameter>;

namespace details {

// Validates (param, value) before any native call: capability gating then native bounds.
Status ValidateParameter(CParameter param, int value);
Status ValidateParameter(DParameter param, int value);

}  // namespace details

}  // namespace zstdsafe
