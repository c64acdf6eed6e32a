#pragma once

#include <dlfcn.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>

#ifdef __GLIBC__
extern "C" void* __libc_malloc(size_t) noexcept;  // NOLINT(bugprone-reserved-identifier)
#endif

// Allocation failure injection for tests exercising the out-of-memory paths of the native layer.
// Tests call `FailNextMalloc()` to make the next N calls to malloc return nullptr with ENOMEM.
// This header defines the malloc override itself, so it must be included by exactly one translation unit of a test
// executable. free is never overridden, it is needed by the dynamic loader and sanitizer internals.

namespace zstdsafe::test {

// Plain counter with atomic builtins: the hook may run before any C++ runtime initialization.
inline int g_malloc_failure_counter = 0;

__attribute__((no_sanitize("address"))) inline void FailNextMalloc(int count = 1) {
  __atomic_store_n(&g_malloc_failure_counter, count, __ATOMIC_RELAXED);
}

// Number of pending injected failures not consumed yet.
__attribute__((no_sanitize("address"))) inline int PendingMallocFailures() {
  return __atomic_load_n(&g_malloc_failure_counter, __ATOMIC_RELAXED);
}

[[nodiscard]] inline __attribute__((no_sanitize("address"))) bool ShouldFailMalloc() {
  int remaining = __atomic_load_n(&g_malloc_failure_counter, __ATOMIC_RELAXED);
  while (remaining > 0) {
    int desired = remaining - 1;
    if (__atomic_compare_exchange_n(&g_malloc_failure_counter, &remaining, desired, /*weak=*/true, __ATOMIC_RELAXED,
                                    __ATOMIC_RELAXED)) {
      return true;
    }
  }
  return false;
}

template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

}  // namespace zstdsafe::test

// Overrides are disabled for Clang AddressSanitizer builds (its runtime allocates very early)
// and for non glibc systems (dlsym may recurse into malloc without a __libc_malloc fallback).
#if defined(__clang__) && defined(__has_feature)
#if __has_feature(address_sanitizer)
#define ZSTDSAFE_WANT_MALLOC_OVERRIDES 0
#endif
#endif

#ifndef ZSTDSAFE_WANT_MALLOC_OVERRIDES
#ifdef __GLIBC__
#define ZSTDSAFE_WANT_MALLOC_OVERRIDES 1
#else
#define ZSTDSAFE_WANT_MALLOC_OVERRIDES 0
#endif
#endif

namespace zstdsafe::test {

// True when FailNextMalloc has an effect in this build.
constexpr bool MallocFailureInjectionAvailable() { return ZSTDSAFE_WANT_MALLOC_OVERRIDES != 0; }

}  // namespace zstdsafe::test

#if ZSTDSAFE_WANT_MALLOC_OVERRIDES
void* CallRealMalloc(size_t size) {
  using MallocFn = void* (*)(size_t);
  static MallocFn fn = nullptr;
  static volatile int resolving = 0;
  if (fn != nullptr) {
    return fn(size);
  }
  if (!__sync_bool_compare_and_swap(&resolving, 0, 1)) {
    // dlsym itself may allocate while the symbol is being resolved.
    return __libc_malloc(size);
  }
  fn = zstdsafe::test::ResolveNext<MallocFn>("malloc");
  __sync_synchronize();
  resolving = 0;
  return fn(size);
}

extern "C" void* malloc(size_t size) {
  if (zstdsafe::test::ShouldFailMalloc()) {
    errno = ENOMEM;
    return nullptr;
  }
  return CallRealMalloc(size);
}
#endif  // ZSTDSAFE_WANT_MALLOC_OVERRIDES
