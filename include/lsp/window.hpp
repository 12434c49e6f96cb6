#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// ShowMessage Notification
enum class MessageType {
  kError = 1,
  kWarning = 2,
  kInfo = 3,
  kLog = 4,
};

void to_json(nlohmann::json& j, const MessageType& t);
void from_json(const nlohmann::json& j, MessageType& t);

struct ShowMessageParams {
  MessageType type;
  std::string message;
};

void to_json(nlohmann::json& j, const ShowMessageParams& p);
void from_json(const nlohmann::json& j, ShowMessageParams& p);

// Show Document Request
struct ShowDocumentClientCapabilities {
  bool support;
};

void to_json(nlohmann::json& j, const ShowDocumentClientCapabilities& c);
void from_json(const nlohmann::json& j, ShowDocumentClientCapabilities& c);

struct ShowDocumentParams {
  Uri uri;
  std::optional<bool> external;
  std::optional<bool> takeFocus;
  std::optional<Range> selection;
};

void to_json(nlohmann::json& j, const ShowDocumentParams& p);
void from_json(const nlohmann::json& j, ShowDocumentParams& p);

struct ShowDocumentResult {
  bool success;
};

void to_json(nlohmann::json& j, const ShowDocumentResult& r);
void from_json(const nlohmann::json& j, ShowDocumentResult& r);

// Create Work Done Progress Request
struct WorkDoneProgressCreateParams {
  ProgressToken token;
};

void to_json(nlohmann::json& j, const WorkDoneProgressCreateParams& p);
void from_json(const nlohmann::json& j, WorkDoneProgressCreateParams& p);

struct WorkDoneProgressCreateResult {};

void to_json(nlohmann::json& j, const WorkDoneProgressCreateResult& r);
void from_json(const nlohmann::json& j, WorkDoneProgressCreateResult& r);

// Work Done Progress values sent through $/progress
struct WorkDoneProgressBegin {
  std::string title;
  std::optional<bool> cancellable;
  std::optional<std::string> message;
};

void to_json(nlohmann::json& j, const WorkDoneProgressBegin& p);
void from_json(const nlohmann::json& j, WorkDoneProgressBegin& p);

struct WorkDoneProgressEnd {
  std::optional<std::string> message;
};

void to_json(nlohmann::json& j, const WorkDoneProgressEnd& p);
void from_json(const nlohmann::json& j, WorkDoneProgressEnd& p);

// Cancel a Work Done Progress Notification
struct WorkDoneProgressCancelParams {
  ProgressToken token;
};

void to_json(nlohmann::json& j, const WorkDoneProgressCancelParams& p);
void from_json(const nlohmann::json& j, WorkDoneProgressCancelParams& p);

}  // namespace lsp
