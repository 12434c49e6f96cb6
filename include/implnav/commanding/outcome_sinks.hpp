#pragma once

#include <string>

#include "implnav/find_usages/definition_item.hpp"

namespace implnav {

enum class NotificationSeverity {
  kInformation,
  kWarning,
  kError,
};

class NotificationSink {
 public:
  NotificationSink() = default;
  NotificationSink(const NotificationSink&) = delete;
  NotificationSink(NotificationSink&&) = delete;
  auto operator=(const NotificationSink&) -> NotificationSink& = delete;
  auto operator=(NotificationSink&&) -> NotificationSink& = delete;
  virtual ~NotificationSink() = default;

  virtual auto Notify(
      std::string message, std::string title, NotificationSeverity severity)
      -> void = 0;
};

class NavigationSink {
 public:
  NavigationSink() = default;
  NavigationSink(const NavigationSink&) = delete;
  NavigationSink(NavigationSink&&) = delete;
  auto operator=(const NavigationSink&) -> NavigationSink& = delete;
  auto operator=(NavigationSink&&) -> NavigationSink& = delete;
  virtual ~NavigationSink() = default;

  virtual auto NavigateTo(const DefinitionItem& definition) -> void = 0;
};

}  // namespace implnav
