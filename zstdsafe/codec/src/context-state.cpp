#include "zstdsafe/context-state.hpp"

#include <stdexcept>
#include <string_view>

namespace zstdsafe {

std::string_view ContextStateName(ContextState state) {
  switch (state) {
    case ContextState::Created:
      return "created";
    case ContextState::Configured:
      return "configured";
    case ContextState::Streaming:
      return "streaming";
    case ContextState::Failed:
      return "failed";
    case ContextState::Released:
      return "released";
    default:
      throw std::logic_error("Invalid context state");
  }
}

}  // namespace zstdsafe
