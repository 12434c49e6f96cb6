#include "lsp/lifecycle.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Client Capabilities
void to_json(nlohmann::json& j, const ClientCapabilities::Window& w) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneProgress", w.workDoneProgress);
  to_json_optional(j, "showDocument", w.showDocument);
}

void from_json(const nlohmann::json& j, ClientCapabilities::Window& w) {
  from_json_optional(j, "workDoneProgress", w.workDoneProgress);
  from_json_optional(j, "showDocument", w.showDocument);
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "window", c.window);
}

void from_json(const nlohmann::json& j, ClientCapabilities& c) {
  from_json_optional(j, "window", c.window);
}

// Server Capabilities
void to_json(nlohmann::json& j, const ServerCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "textDocumentSync", c.textDocumentSync);
  to_json_optional(j, "executeCommandProvider", c.executeCommandProvider);
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
  from_json_optional(j, "textDocumentSync", c.textDocumentSync);
  from_json_optional(j, "executeCommandProvider", c.executeCommandProvider);
}

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "processId", p.processId);
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "rootUri", p.rootUri);
  to_json_optional(j, "initializationOptions", p.initializationOptions);
  to_json_optional(j, "capabilities", p.capabilities);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "initializationOptions", p.initializationOptions);
  from_json_optional(j, "capabilities", p.capabilities);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  j.at("capabilities").get_to(p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

// Initialized Notification
void to_json(nlohmann::json& j, const InitializedParams&) {
  j = nlohmann::json::object();
}
void from_json(const nlohmann::json&, InitializedParams&) {}

// Register Capability
void to_json(nlohmann::json& j, const Registration& p) {
  j = nlohmann::json{{"id", p.id}, {"method", p.method}};
  to_json_optional(j, "registerOptions", p.registerOptions);
}

void from_json(const nlohmann::json& j, Registration& p) {
  j.at("id").get_to(p.id);
  j.at("method").get_to(p.method);
  from_json_optional(j, "registerOptions", p.registerOptions);
}

void to_json(nlohmann::json& j, const RegistrationParams& p) {
  j = nlohmann::json{{"registrations", p.registrations}};
}

void from_json(const nlohmann::json& j, RegistrationParams& p) {
  j.at("registrations").get_to(p.registrations);
}

void to_json(nlohmann::json& j, const RegistrationResult&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, RegistrationResult&) {}

// Shutdown Request
void to_json(nlohmann::json& j, const ShutdownParams&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ShutdownParams&) {}

void to_json(nlohmann::json& j, const ShutdownResult&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ShutdownResult&) {}

// Exit Notification
void to_json(nlohmann::json& j, const ExitParams&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ExitParams&) {}

}  // namespace lsp
