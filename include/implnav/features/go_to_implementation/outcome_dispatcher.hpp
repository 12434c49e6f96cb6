#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "implnav/commanding/outcome_sinks.hpp"
#include "implnav/commanding/wait_context.hpp"
#include "implnav/features/go_to_implementation/result_router.hpp"
#include "implnav/find_usages/definition_presenter.hpp"

namespace implnav::features {

// Performs a routed action through exactly one collaborator
class OutcomeDispatcher {
 public:
  static constexpr std::string_view kNotificationTitle = "Go To Implementation";

  OutcomeDispatcher(
      std::shared_ptr<NotificationSink> notification_sink,
      std::shared_ptr<NavigationSink> navigation_sink,
      std::shared_ptr<PresenterProvider> presenters,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Dispatch(const OutcomeAction& action, WaitContext& wait_context)
      -> void;

 private:
  auto ShowMessage(const ShowMessageAction& action, WaitContext& wait_context)
      -> void;
  auto Present(PresentAction action) -> void;

  std::shared_ptr<NotificationSink> notification_sink_;
  std::shared_ptr<NavigationSink> navigation_sink_;
  std::shared_ptr<PresenterProvider> presenters_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace implnav::features
