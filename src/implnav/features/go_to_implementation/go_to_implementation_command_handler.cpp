#include "implnav/features/go_to_implementation/go_to_implementation_command_handler.hpp"

#include "implnav/features/go_to_implementation/result_router.hpp"
#include "implnav/features/go_to_implementation/strategy_selector.hpp"

namespace implnav::features {

GoToImplementationCommandHandler::GoToImplementationCommandHandler(
    GoToImplementationCommandHandlerDeps deps,
    std::shared_ptr<spdlog::logger> logger)
    : registry_(std::move(deps.registry)),
      presenters_(std::move(deps.presenters)),
      config_manager_(std::move(deps.config_manager)),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(std::move(deps.search_executor), logger_),
      dispatcher_(
          std::move(deps.notification_sink), std::move(deps.navigation_sink),
          presenters_, logger_) {
}

auto GoToImplementationCommandHandler::GetCommandState(
    const GoToImplementationCommandArgs& args) -> CommandState {
  auto capabilities = ResolveCapabilities(args.document);
  return IsAvailable(capabilities) ? CommandState::kAvailable
                                   : CommandState::kUnavailable;
}

auto GoToImplementationCommandHandler::ExecuteCommand(
    const GoToImplementationCommandArgs& args, WaitContext& wait_context)
    -> bool {
  auto capabilities = ResolveCapabilities(args.document);
  if (!IsAvailable(capabilities)) {
    logger_->debug(
        "Go to implementation unavailable for {} ({})", args.document.uri,
        args.document.language_id);
    return false;
  }

  if (!args.caret) {
    logger_->debug("Go to implementation invoked without a caret");
    return false;
  }

  auto streaming_enabled =
      config_manager_->IsStreamingGoToImplementationEnabled(
          args.document.language_id);
  auto strategy = SelectStrategy(capabilities, streaming_enabled);

  LookupRequest request{
      .document = args.document,
      .position = *args.caret,
      .cancellation_token = wait_context.UserCancellationToken(),
  };

  logger_->debug(
      "Go to implementation at {}:{}:{} (streaming: {})", request.document.uri,
      request.position.line, request.position.character,
      std::holds_alternative<StreamingStrategy>(strategy));

  auto outcome = executor_.Execute(strategy, request, wait_context);
  if (!outcome) {
    if (outcome.error().code() == ImplnavErrorCode::Cancelled) {
      logger_->debug("Go to implementation cancelled");
    } else {
      logger_->error(
          "Go to implementation failed: {}", outcome.error().message());
    }
    return true;
  }

  if (auto action = RouteOutcome(*outcome)) {
    dispatcher_.Dispatch(*action, wait_context);
  }
  return true;
}

auto GoToImplementationCommandHandler::ResolveCapabilities(
    const Document& document) -> ImplementationCapabilities {
  auto capabilities = registry_->Resolve(document);
  if (capabilities.streaming && !presenters_->TryGetPresenter()) {
    logger_->debug(
        "No definition presenter available, ignoring streaming service for {}",
        document.language_id);
    capabilities.streaming = nullptr;
  }
  return capabilities;
}

}  // namespace implnav::features
