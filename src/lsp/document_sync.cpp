#include "lsp/document_sync.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& k) {
  k = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
}

// DidOpenTextDocument Notification
void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

// DidChangeTextDocument Notification
void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e) {
  j = nlohmann::json{{"text", e.text}};
}

void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e) {
  j.at("text").get_to(e.text);
}

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"contentChanges", p.contentChanges}};
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("contentChanges").get_to(p.contentChanges);
}

// DidCloseTextDocument Notification
void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

}  // namespace lsp
