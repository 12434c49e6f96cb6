#pragma once

#include <memory>
#include <string>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/window.hpp"
#include "lsp/workspace.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  void RegisterHandlers();

  // Hook for subclasses that expose methods outside the LSP specification
  virtual void RegisterCustomHandlers() {
  }

  auto Endpoint() -> jsonrpc::endpoint::RpcEndpoint& {
    return *endpoint_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;

  void RegisterLifecycleHandlers();
  void RegisterDocumentSyncHandlers();
  void RegisterWorkspaceFeatureHandlers();
  void RegisterWindowFeatureHandlers();

 protected:
  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Register Capability
  auto RegisterCapability(RegistrationParams params)
      -> asio::awaitable<std::expected<RegistrationResult, LspError>> {
    auto result = co_await endpoint_
                      ->SendMethodCall<RegistrationParams, RegistrationResult>(
                          "client/registerCapability", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to register capability: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return result.value();
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // DidOpenTextDocument Notification
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidOpenTextDocument is not implemented");
  }

  // DidChangeTextDocument Notification
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeTextDocument is not implemented");
  }

  // DidCloseTextDocument Notification
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidCloseTextDocument is not implemented");
  }

  // DidChangeWatchedFiles Notification
  virtual auto OnDidChangeWatchedFiles(DidChangeWatchedFilesParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeWatchedFiles is not implemented");
  }

  // Execute Command Request
  virtual auto OnExecuteCommand(ExecuteCommandParams /*unused*/)
      -> asio::awaitable<std::expected<ExecuteCommandResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnExecuteCommand is not implemented");
  }

  // ShowMessage Notification
  auto ShowMessage(ShowMessageParams params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result = co_await endpoint_->SendNotification<ShowMessageParams>(
        "window/showMessage", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to show message: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  // Show Document Request
  auto ShowDocument(ShowDocumentParams params)
      -> asio::awaitable<std::expected<ShowDocumentResult, LspError>> {
    auto result =
        co_await endpoint_->SendMethodCall<ShowDocumentParams, ShowDocumentResult>(
            "window/showDocument", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to show document: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return result.value();
  }

  // Create Work Done Progress Request
  auto CreateWorkDoneProgress(WorkDoneProgressCreateParams params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result = co_await endpoint_->SendMethodCall<
        WorkDoneProgressCreateParams, WorkDoneProgressCreateResult>(
        "window/workDoneProgress/create", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to create work done progress: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  // Cancel a Work Done Progress Notification
  virtual auto OnWorkDoneProgressCancel(
      WorkDoneProgressCancelParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnWorkDoneProgressCancel is not implemented");
  }

  // $/progress Notification
  template <typename T>
  auto SendProgress(ProgressParams<T> params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result = co_await endpoint_->SendNotification<ProgressParams<T>>(
        "$/progress", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to send progress: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  template <typename Params>
  auto SendCustomNotification(std::string method, Params params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result =
        co_await endpoint_->SendNotification<Params>(method, params);
    if (!result) {
      Logger()->error(
          "LspServer failed to send {}: {}", method, result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }
};

}  // namespace lsp
