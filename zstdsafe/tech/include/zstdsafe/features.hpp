#pragma once

namespace zstdsafe {

// Optional native capabilities, resolved once at build time.

#ifdef ZSTDSAFE_ENABLE_MULTITHREAD
constexpr bool multithreadEnabled() { return true; }
#else
constexpr bool multithreadEnabled() { return false; }
#endif

#ifdef ZSTDSAFE_ENABLE_LEGACY
constexpr bool legacyEnabled() { return true; }
#else
constexpr bool legacyEnabled() { return false; }
#endif

#ifdef ZSTDSAFE_ENABLE_DICT_BUILDER
constexpr bool dictBuilderEnabled() { return true; }
#else
constexpr bool dictBuilderEnabled() { return false; }
#endif

}  // namespace zstdsafe
