#include "implnav/features/go_to_implementation/outcome_dispatcher.hpp"

#include <exception>
#include <string>

#include <asio/co_spawn.hpp>

namespace implnav::features {

OutcomeDispatcher::OutcomeDispatcher(
    std::shared_ptr<NotificationSink> notification_sink,
    std::shared_ptr<NavigationSink> navigation_sink,
    std::shared_ptr<PresenterProvider> presenters,
    std::shared_ptr<spdlog::logger> logger)
    : notification_sink_(std::move(notification_sink)),
      navigation_sink_(std::move(navigation_sink)),
      presenters_(std::move(presenters)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto OutcomeDispatcher::Dispatch(
    const OutcomeAction& action, WaitContext& wait_context) -> void {
  if (const auto* show = std::get_if<ShowMessageAction>(&action)) {
    ShowMessage(*show, wait_context);
  } else if (const auto* navigate = std::get_if<NavigateAction>(&action)) {
    logger_->debug(
        "OutcomeDispatcher navigating to {}",
        navigate->definition.location.uri);
    navigation_sink_->NavigateTo(navigate->definition);
  } else if (const auto* present = std::get_if<PresentAction>(&action)) {
    Present(*present);
  }
}

auto OutcomeDispatcher::ShowMessage(
    const ShowMessageAction& action, WaitContext& wait_context) -> void {
  // The notification is modal; the cancellable wait UI must be gone first
  wait_context.TakeOwnership();
  notification_sink_->Notify(
      action.message, std::string(kNotificationTitle),
      NotificationSeverity::kInformation);
}

auto OutcomeDispatcher::Present(PresentAction action) -> void {
  auto presenter = presenters_->TryGetPresenter();
  if (!presenter) {
    logger_->error(
        "OutcomeDispatcher has no presenter for '{}' ({} item(s))",
        action.title, action.definitions.size());
    return;
  }

  logger_->debug(
      "OutcomeDispatcher presenting '{}' ({} item(s))", action.title,
      action.definitions.size());

  // Handed off without waiting; the command's only wait is the lookup
  auto executor = (*presenter)->GetExecutor();
  asio::co_spawn(
      executor,
      (*presenter)->TryNavigateToOrPresentItems(
          std::move(action.title), std::move(action.definitions)),
      [logger = logger_, keep_alive = *presenter](
          std::exception_ptr error, bool presented) {
        if (error) {
          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            logger->error("Presenting definitions failed: {}", e.what());
          } catch (...) {
            logger->error("Presenting definitions failed: unknown error");
          }
          return;
        }
        if (!presented) {
          logger->debug("Presenter did not show any definitions");
        }
      });
}

}  // namespace implnav::features
