#pragma once

#include <spdlog/version.h>
#include <zstd.h>

#include <string_view>

#include "zstdsafe/features.hpp"
#include "zstdsafe/static-string-view-helpers.hpp"

#ifndef ZSTDSAFE_VERSION_STR
#error "ZSTDSAFE_VERSION_STR must be defined via build system"
#endif

static_assert(ZSTD_VERSION_NUMBER >= 10400, "zstdsafe requires zstd headers 1.4.0 or newer");

namespace zstdsafe {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return ZSTDSAFE_VERSION_STR; }

// Version of the zstd headers compiled against, e.g. "1.5.6".
constexpr std::string_view zstdHeaderVersion() { return ZSTD_VERSION_STRING; }

// Version number (major * 10000 + minor * 100 + patch) of the zstd library linked at runtime.
unsigned LinkedZstdVersionNumber() noexcept;

// True if the zstd library linked at runtime has the same major and minor version as the headers.
bool LinkedVersionMatchesHeaders() noexcept;

// Compile time multiline description of the build:
//   zstdsafe <version>
//     logging: spdlog <x.y.z>
//     zstd: <x.y.z> (multithread: on|off, legacy: on|off, dict builder: on|off)
constexpr std::string_view fullVersionStringView() {
  static constexpr std::string_view _sv_name = "zstdsafe ";
  static constexpr std::string_view _sv_newline = "\n  ";
  static constexpr std::string_view _sv_version_macro = ZSTDSAFE_VERSION_STR;

  static constexpr std::string_view _sv_logging_prefix = "logging: spdlog ";
  static constexpr auto _sv_spdlog_major = UnsignedToStringView<SPDLOG_VER_MAJOR>::value;
  static constexpr auto _sv_spdlog_minor = UnsignedToStringView<SPDLOG_VER_MINOR>::value;
  static constexpr auto _sv_spdlog_patch = UnsignedToStringView<SPDLOG_VER_PATCH>::value;
  static constexpr std::string_view _sv_dot = ".";
  using logging_join_t =
      JoinStringView<_sv_logging_prefix, _sv_spdlog_major, _sv_dot, _sv_spdlog_minor, _sv_dot, _sv_spdlog_patch>;
  static constexpr std::string_view _sv_logging_section = logging_join_t::value;

  static constexpr std::string_view _sv_zstd_prefix = "zstd: ";
  static constexpr std::string_view _sv_zstd_ver = ZSTD_VERSION_STRING;
  static constexpr std::string_view _sv_mt = multithreadEnabled() ? " (multithread: on" : " (multithread: off";
  static constexpr std::string_view _sv_legacy = legacyEnabled() ? ", legacy: on" : ", legacy: off";
  static constexpr std::string_view _sv_dict_builder = dictBuilderEnabled() ? ", dict builder: on)" : ", dict builder: off)";
  using zstd_join_t = JoinStringView<_sv_zstd_prefix, _sv_zstd_ver, _sv_mt, _sv_legacy, _sv_dict_builder>;
  static constexpr std::string_view _sv_zstd_section = zstd_join_t::value;

  using full_version_join_t = JoinStringView<_sv_name, _sv_version_macro, _sv_newline, _sv_logging_section,
                                             _sv_newline, _sv_zstd_section>;
  return full_version_join_t::value;
}

}  // namespace zstdsafe
