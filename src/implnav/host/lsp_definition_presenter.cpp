#include "implnav/host/lsp_definition_presenter.hpp"

#include <fmt/format.h>

#include "implnav/host/lsp_outcome_sinks.hpp"

namespace implnav::host {

LspDefinitionPresenter::LspDefinitionPresenter(
    ClientChannel& channel, std::shared_ptr<spdlog::logger> logger)
    : channel_(channel), logger_(logger ? logger : spdlog::default_logger()) {
}

auto LspDefinitionPresenter::GetExecutor() const -> asio::any_io_executor {
  return channel_.GetExecutor();
}

auto LspDefinitionPresenter::NoResultsMessage(const std::string& title)
    -> std::string {
  return fmt::format("No results found for '{}'.", title);
}

auto LspDefinitionPresenter::TryNavigateToOrPresentItems(
    std::string title, std::vector<DefinitionItem> items)
    -> asio::awaitable<bool> {
  if (items.empty()) {
    auto result = co_await channel_.SendShowMessage(lsp::ShowMessageParams{
        .type = lsp::MessageType::kInfo,
        .message = NoResultsMessage(title),
    });
    if (!result) {
      logger_->warn(
          "LspDefinitionPresenter failed to show message: {}",
          result.error().Message());
    }
    co_return false;
  }

  if (items.size() == 1) {
    auto result =
        co_await channel_.SendShowDocument(MakeShowDocumentParams(items[0]));
    if (!result) {
      logger_->warn(
          "LspDefinitionPresenter failed to show {}: {}",
          items[0].location.uri, result.error().Message());
      co_return false;
    }
    co_return result->success;
  }

  protocol::PresentDefinitionsParams params{.title = std::move(title)};
  params.items.reserve(items.size());
  for (const auto& item : items) {
    params.items.push_back(protocol::PresentedDefinition::FromItem(item));
  }

  logger_->debug(
      "LspDefinitionPresenter presenting {} definitions for '{}'",
      params.items.size(), params.title);
  auto result = co_await channel_.SendPresentDefinitions(std::move(params));
  if (!result) {
    logger_->warn(
        "LspDefinitionPresenter failed to present definitions: {}",
        result.error().Message());
    co_return false;
  }
  co_return true;
}

}  // namespace implnav::host
