#include "implnav/features/go_to_implementation/strategy_selector.hpp"

namespace implnav::features {

auto SelectStrategy(
    const ImplementationCapabilities& capabilities, bool streaming_enabled)
    -> LookupStrategy {
  if (streaming_enabled && capabilities.streaming) {
    return StreamingStrategy{.service = capabilities.streaming};
  }
  if (capabilities.synchronous) {
    return SynchronousStrategy{.service = capabilities.synchronous};
  }
  // Streaming-only languages still use it when the toggle is off
  if (capabilities.streaming) {
    return StreamingStrategy{.service = capabilities.streaming};
  }
  return NoStrategy{};
}

}  // namespace implnav::features
