#pragma once

#include "implnav/features/go_to_implementation/lookup_types.hpp"
#include "implnav/find_usages/language_service_registry.hpp"

namespace implnav::features {

// Streaming wins when it is enabled for the language and a streaming
// service exists; otherwise the synchronous service, if any.
[[nodiscard]] auto SelectStrategy(
    const ImplementationCapabilities& capabilities, bool streaming_enabled)
    -> LookupStrategy;

}  // namespace implnav::features
