#include "zstdsafe/version.hpp"

#include <zstd.h>

namespace zstdsafe {

unsigned LinkedZstdVersionNumber() noexcept { return ZSTD_versionNumber(); }

bool LinkedVersionMatchesHeaders() noexcept {
  // Patch versions are ABI compatible, only major and minor are compared.
  return LinkedZstdVersionNumber() / 100U == static_cast<unsigned>(ZSTD_VERSION_NUMBER) / 100U;
}

}  // namespace zstdsafe
