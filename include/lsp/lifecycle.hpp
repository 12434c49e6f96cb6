#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/window.hpp"
#include "lsp/workspace.hpp"

namespace lsp {

// Only the client capabilities the server acts on are modelled. Everything
// else in the client's capability object is ignored on read.
struct ClientCapabilities {
  struct Window {
    std::optional<bool> workDoneProgress;
    std::optional<ShowDocumentClientCapabilities> showDocument;
  };
  std::optional<Window> window;
};

void to_json(nlohmann::json& j, const ClientCapabilities::Window& w);
void from_json(const nlohmann::json& j, ClientCapabilities::Window& w);

void to_json(nlohmann::json& j, const ClientCapabilities& c);
void from_json(const nlohmann::json& j, ClientCapabilities& c);

struct ServerCapabilities {
  std::optional<TextDocumentSyncOptions> textDocumentSync;
  std::optional<ExecuteCommandOptions> executeCommandProvider;
};

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

// Initialize Request
struct InitializeParams : WorkDoneProgressParams {
  std::optional<int> processId;
  struct ClientInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ClientInfo> clientInfo;
  std::optional<DocumentUri> rootUri;
  std::optional<nlohmann::json> initializationOptions;
  std::optional<ClientCapabilities> capabilities;
  std::optional<std::vector<WorkspaceFolder>> workspaceFolders;
};

void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p);
void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p);

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

struct InitializeResult {
  ServerCapabilities capabilities;
  struct ServerInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ServerInfo> serverInfo;
};

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p);
void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p);

void to_json(nlohmann::json& j, const InitializeResult& p);
void from_json(const nlohmann::json& j, InitializeResult& p);

// Initialized Notification
struct InitializedParams {};

void to_json(nlohmann::json& j, const InitializedParams& p);
void from_json(const nlohmann::json& j, InitializedParams& p);

// Register Capability
struct Registration {
  std::string id;
  std::string method;
  std::optional<DidChangeWatchedFilesRegistrationOptions> registerOptions;
};

void to_json(nlohmann::json& j, const Registration& p);
void from_json(const nlohmann::json& j, Registration& p);

struct RegistrationParams {
  std::vector<Registration> registrations;
};

void to_json(nlohmann::json& j, const RegistrationParams& p);
void from_json(const nlohmann::json& j, RegistrationParams& p);

struct RegistrationResult {};

void to_json(nlohmann::json& j, const RegistrationResult& p);
void from_json(const nlohmann::json& j, RegistrationResult& p);

// Shutdown Request
struct ShutdownParams {};

void to_json(nlohmann::json& j, const ShutdownParams& p);
void from_json(const nlohmann::json& j, ShutdownParams& p);

struct ShutdownResult {};

void to_json(nlohmann::json& j, const ShutdownResult& p);
void from_json(const nlohmann::json& j, ShutdownResult& p);

// Exit Notification
struct ExitParams {};

void to_json(nlohmann::json& j, const ExitParams& p);
void from_json(const nlohmann::json& j, ExitParams& p);

}  // namespace lsp
