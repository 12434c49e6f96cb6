#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Workspace Folder
struct WorkspaceFolder {
  Uri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

// DidChangeWatchedFiles Notification
enum class FileChangeType { kCreated = 1, kChanged = 2, kDeleted = 3 };

void to_json(nlohmann::json& j, const FileChangeType& t);
void from_json(const nlohmann::json& j, FileChangeType& t);

struct FileEvent {
  DocumentUri uri;
  FileChangeType type;
};

void to_json(nlohmann::json& j, const FileEvent& e);
void from_json(const nlohmann::json& j, FileEvent& e);

struct DidChangeWatchedFilesParams {
  std::vector<FileEvent> changes;
};

void to_json(nlohmann::json& j, const DidChangeWatchedFilesParams& p);
void from_json(const nlohmann::json& j, DidChangeWatchedFilesParams& p);

struct FileSystemWatcher {
  std::string globPattern;
};

void to_json(nlohmann::json& j, const FileSystemWatcher& w);
void from_json(const nlohmann::json& j, FileSystemWatcher& w);

struct DidChangeWatchedFilesRegistrationOptions {
  std::vector<FileSystemWatcher> watchers;
};

void to_json(
    nlohmann::json& j, const DidChangeWatchedFilesRegistrationOptions& o);
void from_json(
    const nlohmann::json& j, DidChangeWatchedFilesRegistrationOptions& o);

// Execute a command
struct ExecuteCommandOptions {
  std::vector<std::string> commands;
};

void to_json(nlohmann::json& j, const ExecuteCommandOptions& o);
void from_json(const nlohmann::json& j, ExecuteCommandOptions& o);

struct ExecuteCommandParams : WorkDoneProgressParams {
  std::string command;
  std::optional<std::vector<nlohmann::json>> arguments;
};

void to_json(nlohmann::json& j, const ExecuteCommandParams& p);
void from_json(const nlohmann::json& j, ExecuteCommandParams& p);

// LSPAny
using ExecuteCommandResult = nlohmann::json;

}  // namespace lsp
