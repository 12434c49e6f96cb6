#include "implnav/find_usages/find_usages_context.hpp"

namespace implnav {

SimpleFindUsagesContext::SimpleFindUsagesContext(
    std::stop_token cancellation_token)
    : cancellation_token_(std::move(cancellation_token)),
      search_title_(kDefaultSearchTitle) {
}

auto SimpleFindUsagesContext::ReportMessage(std::string message) -> void {
  // An empty message carries nothing to show
  if (message.empty()) {
    return;
  }
  std::lock_guard lock(mutex_);
  message_ = std::move(message);
}

auto SimpleFindUsagesContext::SetSearchTitle(std::string title) -> void {
  std::lock_guard lock(mutex_);
  search_title_ = std::move(title);
}

auto SimpleFindUsagesContext::OnDefinitionFound(DefinitionItem definition)
    -> void {
  std::lock_guard lock(mutex_);
  definitions_.push_back(std::move(definition));
}

auto SimpleFindUsagesContext::Message() const -> std::optional<std::string> {
  std::lock_guard lock(mutex_);
  return message_;
}

auto SimpleFindUsagesContext::SearchTitle() const -> std::string {
  std::lock_guard lock(mutex_);
  return search_title_;
}

auto SimpleFindUsagesContext::GetDefinitions() const
    -> std::vector<DefinitionItem> {
  std::lock_guard lock(mutex_);
  return definitions_;
}

}  // namespace implnav
