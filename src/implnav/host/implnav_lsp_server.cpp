#include "implnav/host/implnav_lsp_server.hpp"

#include <algorithm>
#include <exception>
#include <thread>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include "implnav/host/lsp_definition_presenter.hpp"
#include "implnav/host/lsp_outcome_sinks.hpp"
#include "implnav/utils/path_utils.hpp"

namespace implnav::host {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "implnav";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kFileWatcherId = "implnav-config-watcher";
constexpr std::string_view kDidChangeWatchedFilesMethod =
    "workspace/didChangeWatchedFiles";
constexpr unsigned int kCommandThreads = 2;

auto ToLspError(const ImplnavError& error) -> std::unexpected<LspError> {
  switch (error.code()) {
    case ImplnavErrorCode::DocumentNotOpen:
      return LspError::UnexpectedFromCode(
          LspErrorCode::kDocumentNotOpen, error.message());
    case ImplnavErrorCode::InvalidArguments:
    case ImplnavErrorCode::UnknownCommand:
      return LspError::UnexpectedFromCode(
          LspErrorCode::kInvalidParams, error.message());
    case ImplnavErrorCode::Cancelled:
      return LspError::UnexpectedFromCode(
          LspErrorCode::kRequestCancelled, error.message());
    default:
      return LspError::UnexpectedFromCode(
          LspErrorCode::kInternalError, error.message());
  }
}

}  // namespace

ImplnavLspServer::ImplnavLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      command_pool_(std::make_unique<asio::thread_pool>(kCommandThreads)),
      search_pool_(std::make_unique<asio::thread_pool>([] {
        const auto hw_threads = std::thread::hardware_concurrency();
        const auto num_threads = std::min(hw_threads / 2, 8U);
        return num_threads == 0 ? 1U : num_threads;
      }())),
      registry_(std::move(registry)),
      documents_(std::make_shared<DocumentStore>(logger_)),
      config_manager_(std::make_shared<ConfigManager>(logger_)),
      presenters_(std::make_shared<PresenterProvider>(logger_)),
      wait_contexts_(logger_) {
  // Single-item results are opened with window/showDocument, so clients
  // without it get no presenter
  presenters_->AddFactory([this]() -> std::shared_ptr<DefinitionPresenter> {
    if (!client_supports_show_document_) {
      return nullptr;
    }
    return std::make_shared<LspDefinitionPresenter>(*this, logger_);
  });

  handler_ = std::make_unique<features::GoToImplementationCommandHandler>(
      features::GoToImplementationCommandHandlerDeps{
          .registry = registry_,
          .presenters = presenters_,
          .config_manager = config_manager_,
          .notification_sink =
              std::make_shared<LspNotificationSink>(*this, logger_),
          .navigation_sink =
              std::make_shared<LspNavigationSink>(*this, logger_),
          .search_executor = search_pool_->get_executor(),
      },
      logger_);
}

ImplnavLspServer::~ImplnavLspServer() {
  wait_contexts_.CancelAll();
  command_pool_->join();
  search_pool_->join();
}

auto ImplnavLspServer::GetExecutor() const -> asio::any_io_executor {
  return executor_;
}

auto ImplnavLspServer::SendShowMessage(lsp::ShowMessageParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await ShowMessage(std::move(params));
}

auto ImplnavLspServer::SendShowDocument(lsp::ShowDocumentParams params)
    -> asio::awaitable<std::expected<lsp::ShowDocumentResult, LspError>> {
  co_return co_await ShowDocument(std::move(params));
}

auto ImplnavLspServer::SendWorkDoneProgressCreate(
    lsp::WorkDoneProgressCreateParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await CreateWorkDoneProgress(std::move(params));
}

auto ImplnavLspServer::SendProgressBegin(
    lsp::ProgressParams<lsp::WorkDoneProgressBegin> params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await SendProgress(std::move(params));
}

auto ImplnavLspServer::SendProgressEnd(
    lsp::ProgressParams<lsp::WorkDoneProgressEnd> params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await SendProgress(std::move(params));
}

auto ImplnavLspServer::SendPresentDefinitions(
    protocol::PresentDefinitionsParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await SendCustomNotification(
      std::string(protocol::kPresentDefinitionsMethod), std::move(params));
}

void ImplnavLspServer::RegisterCustomHandlers() {
  Endpoint().RegisterMethodCall<
      lsp::TextDocumentIdentifier, protocol::CommandStateResult, LspError>(
      std::string(protocol::kCommandStateMethod),
      [this](const lsp::TextDocumentIdentifier& params) {
        return OnCommandState(params);
      });
}

auto ImplnavLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, LspError>> {
  if (const auto& workspace_folders_opt = params.workspaceFolders) {
    if (workspace_folders_opt->size() > 1) {
      co_return LspError::UnexpectedFromCode(
          LspErrorCode::kInvalidRequest, "Only one workspace is supported");
    }
    if (!workspace_folders_opt->empty()) {
      workspace_folder_ = workspace_folders_opt->front();
    }
  } else if (params.rootUri) {
    workspace_folder_ =
        lsp::WorkspaceFolder{.uri = *params.rootUri, .name = "root"};
  }

  if (params.capabilities && params.capabilities->window) {
    const auto& window = *params.capabilities->window;
    client_supports_progress_ = window.workDoneProgress.value_or(false);
    client_supports_show_document_ =
        window.showDocument && window.showDocument->support;
  }
  Logger()->info(
      "Client capabilities: workDoneProgress={}, showDocument={}",
      client_supports_progress_, client_supports_show_document_);

  lsp::ServerCapabilities capabilities{
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true,
              .change = lsp::TextDocumentSyncKind::kFull,
          },
      .executeCommandProvider =
          lsp::ExecuteCommandOptions{
              .commands = {std::string(protocol::kGoToImplementationCommand)},
          },
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto ImplnavLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, LspError>> {
  initialized_ = true;

  if (!workspace_folder_.has_value()) {
    Logger()->info("No workspace folder, using default configuration");
    co_return Ok();
  }

  config_manager_->LoadFromWorkspace(utils::UriToPath(workspace_folder_->uri));

  auto register_watcher = [this]() -> asio::awaitable<void> {
    Logger()->info("Registering .implnav file watcher");

    auto registration = lsp::Registration{
        .id = std::string(kFileWatcherId) + "-" + workspace_folder_->uri,
        .method = std::string(kDidChangeWatchedFilesMethod),
        .registerOptions =
            lsp::DidChangeWatchedFilesRegistrationOptions{
                .watchers = {{.globPattern = "**/.implnav"}},
            },
    };
    auto result = co_await RegisterCapability(
        lsp::RegistrationParams{.registrations = {registration}});
    if (!result) {
      Logger()->error(
          "Failed to register file watcher: {}", result.error().Message());
    } else {
      Logger()->info("File watcher registered successfully");
    }
  };

  asio::co_spawn(executor_, register_watcher, asio::detached);
  co_return Ok();
}

auto ImplnavLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, LspError>> {
  shutdown_requested_ = true;

  wait_contexts_.CancelAll();
  co_return lsp::ShutdownResult{};
}

auto ImplnavLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_await lsp::LspServer::Shutdown();
  co_return Ok();
}

auto ImplnavLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  const auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  documents_->Open(Document{
      .uri = text_doc.uri,
      .language_id = text_doc.languageId,
      .version = text_doc.version,
      .text = text_doc.text,
  });
  co_return Ok();
}

auto ImplnavLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {}", params.textDocument.uri);
  if (params.contentChanges.empty()) {
    co_return Ok();
  }

  // Full sync: the last change carries the whole text
  if (!documents_->Update(
          params.textDocument.uri, params.contentChanges.back().text,
          params.textDocument.version)) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kDocumentNotOpen, params.textDocument.uri);
  }
  co_return Ok();
}

auto ImplnavLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  documents_->Close(params.textDocument.uri);
  co_return Ok();
}

auto ImplnavLspServer::OnDidChangeWatchedFiles(
    lsp::DidChangeWatchedFilesParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->info(
      "OnDidChangeWatchedFiles received: {} file change(s)",
      params.changes.size());

  auto has_config_change =
      std::ranges::any_of(params.changes, [](const lsp::FileEvent& change) {
        return utils::IsConfigFile(utils::UriToPath(change.uri));
      });
  if (has_config_change) {
    config_manager_->HandleConfigFileChange();
  }
  co_return Ok();
}

auto ImplnavLspServer::OnExecuteCommand(lsp::ExecuteCommandParams params)
    -> asio::awaitable<std::expected<lsp::ExecuteCommandResult, LspError>> {
  Logger()->debug("OnExecuteCommand received: {}", params.command);

  if (!initialized_ || shutdown_requested_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerNotInitialized);
  }

  auto args = ParseCommandArgs(params);
  if (!args) {
    Logger()->warn(
        "OnExecuteCommand rejected {}: {}", params.command,
        args.error().message());
    co_return ToLspError(args.error());
  }

  auto handled = co_await RunGoToImplementation(std::move(*args));
  co_return lsp::ExecuteCommandResult(handled);
}

auto ImplnavLspServer::OnWorkDoneProgressCancel(
    lsp::WorkDoneProgressCancelParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("OnWorkDoneProgressCancel received: {}", params.token);

  if (!wait_contexts_.Cancel(params.token)) {
    Logger()->debug("No running command owns progress {}", params.token);
  }
  co_return Ok();
}

auto ImplnavLspServer::OnCommandState(lsp::TextDocumentIdentifier params)
    -> asio::awaitable<
        std::expected<protocol::CommandStateResult, LspError>> {
  auto document = documents_->Get(params.uri);
  if (!document) {
    co_return protocol::CommandStateResult{.available = false};
  }

  auto state = handler_->GetCommandState(
      features::GoToImplementationCommandArgs{.document = std::move(*document)});
  co_return protocol::CommandStateResult{
      .available = state == features::CommandState::kAvailable};
}

auto ImplnavLspServer::ParseCommandArgs(
    const lsp::ExecuteCommandParams& params)
    -> std::expected<features::GoToImplementationCommandArgs, ImplnavError> {
  if (params.command != protocol::kGoToImplementationCommand) {
    return ImplnavError::Unexpected(
        ImplnavErrorCode::UnknownCommand, params.command);
  }

  if (!params.arguments || params.arguments->size() != 1) {
    return ImplnavError::Unexpected(
        ImplnavErrorCode::InvalidArguments,
        "expected a single TextDocumentPositionParams");
  }

  lsp::TextDocumentPositionParams position_params;
  try {
    position_params =
        params.arguments->front().get<lsp::TextDocumentPositionParams>();
  } catch (const nlohmann::json::exception& e) {
    return ImplnavError::Unexpected(
        ImplnavErrorCode::InvalidArguments, e.what());
  }

  auto document = documents_->Get(position_params.textDocument.uri);
  if (!document) {
    return ImplnavError::Unexpected(
        ImplnavErrorCode::DocumentNotOpen, position_params.textDocument.uri);
  }

  return features::GoToImplementationCommandArgs{
      .document = std::move(*document),
      .caret = position_params.position,
  };
}

auto ImplnavLspServer::RunGoToImplementation(
    features::GoToImplementationCommandArgs args) -> asio::awaitable<bool> {
  auto request_id = next_request_id_++;
  auto context = std::make_shared<LspWaitContext>(
      *this, request_id, client_supports_progress_, logger_);
  auto registration = wait_contexts_.Register(request_id, context);

  try {
    co_return co_await asio::co_spawn(
        command_pool_->get_executor(),
        [this, context, args = std::move(args)]() -> asio::awaitable<bool> {
          co_return handler_->ExecuteCommand(args, *context);
        },
        asio::use_awaitable);
  } catch (const std::exception& e) {
    logger_->error(
        "Go to implementation request {} failed: {}", request_id, e.what());
  }
  co_return false;
}

}  // namespace implnav::host
