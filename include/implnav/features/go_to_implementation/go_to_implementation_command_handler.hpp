#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <asio/any_io_executor.hpp>
#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "implnav/commanding/outcome_sinks.hpp"
#include "implnav/commanding/wait_context.hpp"
#include "implnav/core/config_manager.hpp"
#include "implnav/core/document.hpp"
#include "implnav/features/go_to_implementation/bounded_executor.hpp"
#include "implnav/features/go_to_implementation/outcome_dispatcher.hpp"
#include "implnav/find_usages/definition_presenter.hpp"
#include "implnav/find_usages/language_service_registry.hpp"

namespace implnav::features {

enum class CommandState { kAvailable, kUnavailable };

struct GoToImplementationCommandArgs {
  Document document;
  std::optional<lsp::Position> caret;
};

struct GoToImplementationCommandHandlerDeps {
  std::shared_ptr<LanguageServiceRegistry> registry;
  std::shared_ptr<PresenterProvider> presenters;
  std::shared_ptr<ConfigManager> config_manager;
  std::shared_ptr<NotificationSink> notification_sink;
  std::shared_ptr<NavigationSink> navigation_sink;
  asio::any_io_executor search_executor;
};

// Entry point for "go to implementation". ExecuteCommand blocks the calling
// thread for the duration of the search and must not be called from a
// thread that runs the search executor.
class GoToImplementationCommandHandler {
 public:
  static constexpr std::string_view kDisplayName =
      "Go To Implementation Command Handler";

  explicit GoToImplementationCommandHandler(
      GoToImplementationCommandHandlerDeps deps,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] static auto DisplayName() -> std::string_view {
    return kDisplayName;
  }

  // Never runs a search
  [[nodiscard]] auto GetCommandState(
      const GoToImplementationCommandArgs& args) -> CommandState;

  // Returns false without side effects when the command is unavailable or
  // there is no caret. Cancelled and failed searches still count as handled.
  auto ExecuteCommand(
      const GoToImplementationCommandArgs& args, WaitContext& wait_context)
      -> bool;

 private:
  // Streaming is only usable when a presenter can show its results
  auto ResolveCapabilities(const Document& document)
      -> ImplementationCapabilities;

  std::shared_ptr<LanguageServiceRegistry> registry_;
  std::shared_ptr<PresenterProvider> presenters_;
  std::shared_ptr<ConfigManager> config_manager_;
  std::shared_ptr<spdlog::logger> logger_;

  BoundedExecutor executor_;
  OutcomeDispatcher dispatcher_;
};

}  // namespace implnav::features
