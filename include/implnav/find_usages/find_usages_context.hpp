#pragma once

#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "implnav/find_usages/definition_item.hpp"

namespace implnav {

// Sink a streaming search reports into. Implementations must accept calls
// from any thread, since a search may fan out across several sources.
class FindUsagesContext {
 public:
  FindUsagesContext() = default;
  FindUsagesContext(const FindUsagesContext&) = delete;
  FindUsagesContext(FindUsagesContext&&) = delete;
  auto operator=(const FindUsagesContext&) -> FindUsagesContext& = delete;
  auto operator=(FindUsagesContext&&) -> FindUsagesContext& = delete;
  virtual ~FindUsagesContext() = default;

  [[nodiscard]] virtual auto CancellationToken() const -> std::stop_token = 0;

  // Terminal explanation shown instead of any definitions
  virtual auto ReportMessage(std::string message) -> void = 0;

  virtual auto SetSearchTitle(std::string title) -> void = 0;

  virtual auto OnDefinitionFound(DefinitionItem definition) -> void = 0;
};

// Collects everything a search reports so the caller can decide what to do
// once the search has finished. Definitions keep the order they arrived in.
class SimpleFindUsagesContext : public FindUsagesContext {
 public:
  static constexpr std::string_view kDefaultSearchTitle = "Implementations";

  explicit SimpleFindUsagesContext(std::stop_token cancellation_token);

  [[nodiscard]] auto CancellationToken() const -> std::stop_token override {
    return cancellation_token_;
  }

  auto ReportMessage(std::string message) -> void override;
  auto SetSearchTitle(std::string title) -> void override;
  auto OnDefinitionFound(DefinitionItem definition) -> void override;

  [[nodiscard]] auto Message() const -> std::optional<std::string>;
  [[nodiscard]] auto SearchTitle() const -> std::string;
  [[nodiscard]] auto GetDefinitions() const -> std::vector<DefinitionItem>;

 private:
  std::stop_token cancellation_token_;

  mutable std::mutex mutex_;
  std::optional<std::string> message_;
  std::string search_title_;
  std::vector<DefinitionItem> definitions_;
};

}  // namespace implnav
