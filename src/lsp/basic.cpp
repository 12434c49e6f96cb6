#include "lsp/basic.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  j.at("uri").get_to(t.uri);
  j.at("languageId").get_to(t.languageId);
  j.at("version").get_to(t.version);
  j.at("text").get_to(t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

// Versioned Text Document Identifier
void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  j.at("uri").get_to(v.uri);
  j.at("version").get_to(v.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{{"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Work Done Progress Params
void to_json(nlohmann::json& j, const WorkDoneProgressParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, WorkDoneProgressParams& p) {
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

}  // namespace lsp
