#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Progress support
using ProgressToken = std::string;

template <typename T>
struct ProgressParams {
  ProgressToken token;
  T value;
};

template <typename T>
void to_json(nlohmann::json& j, const ProgressParams<T>& p) {
  j = nlohmann::json{{"token", p.token}, {"value", p.value}};
}

template <typename T>
void from_json(const nlohmann::json& j, ProgressParams<T>& p) {
  j.at("token").get_to(p.token);
  j.at("value").get_to(p.value);
}

// Position
struct Position {
  int line;
  int character;

  friend auto operator==(const Position&, const Position&) -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

// Range
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Location
struct Location {
  DocumentUri uri;
  Range range;

  friend auto operator==(const Location&, const Location&) -> bool = default;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Text Document Item
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Versioned Text Document Identifier
struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version;
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Work Done Progress Params
struct WorkDoneProgressParams {
  std::optional<ProgressToken> workDoneToken;
};

void to_json(nlohmann::json& j, const WorkDoneProgressParams& p);
void from_json(const nlohmann::json& j, WorkDoneProgressParams& p);

}  // namespace lsp
