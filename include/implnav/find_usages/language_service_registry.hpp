#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "implnav/core/document.hpp"
#include "implnav/find_usages/implementation_services.hpp"

namespace implnav {

// Lookup services available for one document. Either handle may be null.
struct ImplementationCapabilities {
  std::shared_ptr<StreamingImplementationService> streaming;
  std::shared_ptr<SynchronousImplementationService> synchronous;
};

// True if at least one lookup service is present. Only checks presence,
// never runs a search, so it is cheap enough for every command-state query.
[[nodiscard]] auto IsAvailable(const ImplementationCapabilities& capabilities)
    -> bool;

// Per-language registration of implementation lookup services
class LanguageServiceRegistry {
 public:
  explicit LanguageServiceRegistry(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto RegisterStreamingService(
      std::string language_id,
      std::shared_ptr<StreamingImplementationService> service) -> void;

  auto RegisterSynchronousService(
      std::string language_id,
      std::shared_ptr<SynchronousImplementationService> service) -> void;

  // Services for the document's language; absent services are null
  [[nodiscard]] auto Resolve(const Document& document) const
      -> ImplementationCapabilities;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, ImplementationCapabilities> services_;
};

}  // namespace implnav
