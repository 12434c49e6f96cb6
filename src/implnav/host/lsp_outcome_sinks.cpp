#include "implnav/host/lsp_outcome_sinks.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <fmt/format.h>

namespace implnav::host {

auto MakeShowDocumentParams(const DefinitionItem& definition)
    -> lsp::ShowDocumentParams {
  return lsp::ShowDocumentParams{
      .uri = definition.location.uri,
      .external = false,
      .takeFocus = true,
      .selection = definition.location.range,
  };
}

auto ToMessageType(NotificationSeverity severity) -> lsp::MessageType {
  switch (severity) {
    case NotificationSeverity::kInformation:
      return lsp::MessageType::kInfo;
    case NotificationSeverity::kWarning:
      return lsp::MessageType::kWarning;
    case NotificationSeverity::kError:
      return lsp::MessageType::kError;
  }
  return lsp::MessageType::kInfo;
}

LspNotificationSink::LspNotificationSink(
    ClientChannel& channel, std::shared_ptr<spdlog::logger> logger)
    : channel_(channel), logger_(logger ? logger : spdlog::default_logger()) {
}

auto LspNotificationSink::Notify(
    std::string message, std::string title, NotificationSeverity severity)
    -> void {
  lsp::ShowMessageParams params{
      .type = ToMessageType(severity),
      .message = title.empty() ? std::move(message)
                               : fmt::format("{}: {}", title, message),
  };

  asio::co_spawn(
      channel_.GetExecutor(),
      [&channel = channel_, logger = logger_,
       params = std::move(params)]() -> asio::awaitable<void> {
        auto result = co_await channel.SendShowMessage(params);
        if (!result) {
          logger->warn(
              "LspNotificationSink failed to show message: {}",
              result.error().Message());
        }
      },
      asio::detached);
}

LspNavigationSink::LspNavigationSink(
    ClientChannel& channel, std::shared_ptr<spdlog::logger> logger)
    : channel_(channel), logger_(logger ? logger : spdlog::default_logger()) {
}

auto LspNavigationSink::NavigateTo(const DefinitionItem& definition) -> void {
  asio::co_spawn(
      channel_.GetExecutor(),
      [&channel = channel_, logger = logger_,
       params = MakeShowDocumentParams(definition)]()
          -> asio::awaitable<void> {
        auto result = co_await channel.SendShowDocument(params);
        if (!result) {
          logger->warn(
              "LspNavigationSink failed to show {}: {}", params.uri,
              result.error().Message());
        } else if (!result->success) {
          logger->warn("LspNavigationSink client declined to show {}",
                       params.uri);
        }
      },
      asio::detached);
}

}  // namespace implnav::host
