#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include <asio/awaitable.hpp>
#include <asio/thread_pool.hpp>

#include "implnav/core/config_manager.hpp"
#include "implnav/core/document_store.hpp"
#include "implnav/error/error.hpp"
#include "implnav/features/go_to_implementation/go_to_implementation_command_handler.hpp"
#include "implnav/find_usages/definition_presenter.hpp"
#include "implnav/find_usages/language_service_registry.hpp"
#include "implnav/host/client_channel.hpp"
#include "implnav/host/lsp_wait_context.hpp"
#include "implnav/host/wait_context_registry.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"

namespace implnav::host {

class ImplnavLspServer : public lsp::LspServer, public ClientChannel {
 public:
  ImplnavLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~ImplnavLspServer() override;

  ImplnavLspServer(const ImplnavLspServer&) = delete;
  ImplnavLspServer(ImplnavLspServer&&) = delete;
  auto operator=(const ImplnavLspServer&) -> ImplnavLspServer& = delete;
  auto operator=(ImplnavLspServer&&) -> ImplnavLspServer& = delete;

  // ClientChannel
  [[nodiscard]] auto GetExecutor() const -> asio::any_io_executor override;

  auto SendShowMessage(lsp::ShowMessageParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto SendShowDocument(lsp::ShowDocumentParams params) -> asio::awaitable<
      std::expected<lsp::ShowDocumentResult, lsp::LspError>> override;

  auto SendWorkDoneProgressCreate(lsp::WorkDoneProgressCreateParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto SendProgressBegin(lsp::ProgressParams<lsp::WorkDoneProgressBegin> params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto SendProgressEnd(lsp::ProgressParams<lsp::WorkDoneProgressEnd> params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  auto SendPresentDefinitions(protocol::PresentDefinitionsParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  // Command handlers block until their search finishes, so they get their
  // own pool. Searches run on a second pool.
  std::unique_ptr<asio::thread_pool> command_pool_;
  std::unique_ptr<asio::thread_pool> search_pool_;

  std::shared_ptr<LanguageServiceRegistry> registry_;
  std::shared_ptr<DocumentStore> documents_;
  std::shared_ptr<ConfigManager> config_manager_;
  std::shared_ptr<PresenterProvider> presenters_;
  std::unique_ptr<features::GoToImplementationCommandHandler> handler_;

  // Workspace folder from initialize request
  std::optional<lsp::WorkspaceFolder> workspace_folder_;

  // Client capabilities from initialize request
  bool client_supports_progress_ = false;
  bool client_supports_show_document_ = false;

  std::atomic<std::uint64_t> next_request_id_{1};
  WaitContextRegistry wait_contexts_;

  // Resolves an open document and caret from the command arguments
  auto ParseCommandArgs(const lsp::ExecuteCommandParams& params)
      -> std::expected<features::GoToImplementationCommandArgs, ImplnavError>;

  auto RunGoToImplementation(features::GoToImplementationCommandArgs args)
      -> asio::awaitable<bool>;

  auto OnCommandState(lsp::TextDocumentIdentifier params) -> asio::awaitable<
      std::expected<protocol::CommandStateResult, lsp::LspError>>;

 protected:
  void RegisterCustomHandlers() override;

  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Open Text Document Notification
  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Change Text Document Notification
  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Close Text Document Notification
  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // DidChangeWatchedFiles Notification
  auto OnDidChangeWatchedFiles(lsp::DidChangeWatchedFilesParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Execute Command Request
  auto OnExecuteCommand(lsp::ExecuteCommandParams params) -> asio::awaitable<
      std::expected<lsp::ExecuteCommandResult, lsp::LspError>> override;

  // Work Done Progress Cancel Notification
  auto OnWorkDoneProgressCancel(lsp::WorkDoneProgressCancelParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;
};

}  // namespace implnav::host
