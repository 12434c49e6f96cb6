#include "implnav/find_usages/language_service_registry.hpp"

#include <mutex>

namespace implnav {

auto IsAvailable(const ImplementationCapabilities& capabilities) -> bool {
  return capabilities.streaming != nullptr ||
         capabilities.synchronous != nullptr;
}

LanguageServiceRegistry::LanguageServiceRegistry(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto LanguageServiceRegistry::RegisterStreamingService(
    std::string language_id,
    std::shared_ptr<StreamingImplementationService> service) -> void {
  logger_->debug(
      "LanguageServiceRegistry registering streaming service for '{}'",
      language_id);
  std::unique_lock lock(mutex_);
  services_[std::move(language_id)].streaming = std::move(service);
}

auto LanguageServiceRegistry::RegisterSynchronousService(
    std::string language_id,
    std::shared_ptr<SynchronousImplementationService> service) -> void {
  logger_->debug(
      "LanguageServiceRegistry registering synchronous service for '{}'",
      language_id);
  std::unique_lock lock(mutex_);
  services_[std::move(language_id)].synchronous = std::move(service);
}

auto LanguageServiceRegistry::Resolve(const Document& document) const
    -> ImplementationCapabilities {
  std::shared_lock lock(mutex_);
  auto it = services_.find(document.language_id);
  if (it == services_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace implnav
