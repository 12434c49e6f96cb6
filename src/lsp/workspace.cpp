#include "lsp/workspace.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  j.at("name").get_to(w.name);
}

// DidChangeWatchedFiles Notification
void to_json(nlohmann::json& j, const FileChangeType& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, FileChangeType& t) {
  auto value = j.get<int>();
  if (value < 1 || value > 3) {
    throw std::runtime_error("Invalid file change type");
  }
  t = static_cast<FileChangeType>(value);
}

void to_json(nlohmann::json& j, const FileEvent& e) {
  j = nlohmann::json{{"uri", e.uri}, {"type", e.type}};
}

void from_json(const nlohmann::json& j, FileEvent& e) {
  j.at("uri").get_to(e.uri);
  j.at("type").get_to(e.type);
}

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p) {
  j = nlohmann::json{{"changes", p.changes}};
}

void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p) {
  j.at("changes").get_to(p.changes);
}

void to_json(nlohmann::json& j, const FileSystemWatcher& w) {
  j = nlohmann::json{{"globPattern", w.globPattern}};
}

void from_json(const nlohmann::json& j, FileSystemWatcher& w) {
  j.at("globPattern").get_to(w.globPattern);
}

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o) {
  j = nlohmann::json{{"watchers", o.watchers}};
}

void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o) {
  j.at("watchers").get_to(o.watchers);
}

// Execute a command
void to_json(nlohmann::json& j, const ExecuteCommandOptions& o) {
  j = nlohmann::json{{"commands", o.commands}};
}

void from_json(const nlohmann::json& j, ExecuteCommandOptions& o) {
  j.at("commands").get_to(o.commands);
}

void to_json(nlohmann::json& j, const ExecuteCommandParams& p) {
  j = nlohmann::json{{"command", p.command}};
  to_json_optional(j, "arguments", p.arguments);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, ExecuteCommandParams& p) {
  j.at("command").get_to(p.command);
  from_json_optional(j, "arguments", p.arguments);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

}  // namespace lsp
