#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& k);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose;
  std::optional<TextDocumentSyncKind> change;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

// DidOpenTextDocument Notification
struct DidOpenTextDocumentParams {
  TextDocumentItem textDocument;
};

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p);

// DidChangeTextDocument Notification. Only full-text changes are
// advertised, so a change event carries the whole document.
struct TextDocumentContentChangeEvent {
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e);
void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e);

struct DidChangeTextDocumentParams {
  VersionedTextDocumentIdentifier textDocument;
  std::vector<TextDocumentContentChangeEvent> contentChanges;
};

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p);

// DidCloseTextDocument Notification
struct DidCloseTextDocumentParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p);

}  // namespace lsp
