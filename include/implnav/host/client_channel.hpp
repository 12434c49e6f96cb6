#pragma once

#include <expected>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <lsp/basic.hpp>
#include <lsp/error.hpp>
#include <lsp/window.hpp>

#include "implnav/host/implnav_protocol.hpp"

namespace implnav::host {

// Outbound messages the command host sends to the editor client. All
// coroutines must run on GetExecutor().
class ClientChannel {
 public:
  ClientChannel() = default;
  ClientChannel(const ClientChannel&) = delete;
  ClientChannel(ClientChannel&&) = delete;
  auto operator=(const ClientChannel&) -> ClientChannel& = delete;
  auto operator=(ClientChannel&&) -> ClientChannel& = delete;
  virtual ~ClientChannel() = default;

  [[nodiscard]] virtual auto GetExecutor() const -> asio::any_io_executor = 0;

  virtual auto SendShowMessage(lsp::ShowMessageParams params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>> = 0;

  virtual auto SendShowDocument(lsp::ShowDocumentParams params)
      -> asio::awaitable<
          std::expected<lsp::ShowDocumentResult, lsp::error::LspError>> = 0;

  virtual auto SendWorkDoneProgressCreate(
      lsp::WorkDoneProgressCreateParams params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>> = 0;

  virtual auto SendProgressBegin(
      lsp::ProgressParams<lsp::WorkDoneProgressBegin> params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>> = 0;

  virtual auto SendProgressEnd(
      lsp::ProgressParams<lsp::WorkDoneProgressEnd> params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>> = 0;

  virtual auto SendPresentDefinitions(protocol::PresentDefinitionsParams params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>> = 0;
};

}  // namespace implnav::host
