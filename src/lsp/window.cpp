#include "lsp/window.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// ShowMessage Notification
void to_json(nlohmann::json& j, const MessageType& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, MessageType& t) {
  auto value = j.get<int>();
  if (value < 1 || value > 4) {
    throw std::runtime_error("Invalid message type");
  }
  t = static_cast<MessageType>(value);
}

void to_json(nlohmann::json& j, const ShowMessageParams& p) {
  j = nlohmann::json{{"type", p.type}, {"message", p.message}};
}

void from_json(const nlohmann::json& j, ShowMessageParams& p) {
  j.at("type").get_to(p.type);
  j.at("message").get_to(p.message);
}

// Show Document Request
void to_json(nlohmann::json& j, const ShowDocumentClientCapabilities& c) {
  j = nlohmann::json{{"support", c.support}};
}

void from_json(const nlohmann::json& j, ShowDocumentClientCapabilities& c) {
  j.at("support").get_to(c.support);
}

void to_json(nlohmann::json& j, const ShowDocumentParams& p) {
  j = nlohmann::json{{"uri", p.uri}};
  to_json_optional(j, "external", p.external);
  to_json_optional(j, "takeFocus", p.takeFocus);
  to_json_optional(j, "selection", p.selection);
}

void from_json(const nlohmann::json& j, ShowDocumentParams& p) {
  j.at("uri").get_to(p.uri);
  from_json_optional(j, "external", p.external);
  from_json_optional(j, "takeFocus", p.takeFocus);
  from_json_optional(j, "selection", p.selection);
}

void to_json(nlohmann::json& j, const ShowDocumentResult& r) {
  j = nlohmann::json{{"success", r.success}};
}

void from_json(const nlohmann::json& j, ShowDocumentResult& r) {
  j.at("success").get_to(r.success);
}

// Create Work Done Progress Request
void to_json(nlohmann::json& j, const WorkDoneProgressCreateParams& p) {
  j = nlohmann::json{{"token", p.token}};
}

void from_json(const nlohmann::json& j, WorkDoneProgressCreateParams& p) {
  j.at("token").get_to(p.token);
}

void to_json(nlohmann::json& j, const WorkDoneProgressCreateResult&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, WorkDoneProgressCreateResult&) {}

// Work Done Progress values
void to_json(nlohmann::json& j, const WorkDoneProgressBegin& p) {
  j = nlohmann::json{{"kind", "begin"}, {"title", p.title}};
  to_json_optional(j, "cancellable", p.cancellable);
  to_json_optional(j, "message", p.message);
}

void from_json(const nlohmann::json& j, WorkDoneProgressBegin& p) {
  if (j.at("kind").get<std::string>() != "begin") {
    throw std::runtime_error("Expected work done progress begin");
  }
  j.at("title").get_to(p.title);
  from_json_optional(j, "cancellable", p.cancellable);
  from_json_optional(j, "message", p.message);
}

void to_json(nlohmann::json& j, const WorkDoneProgressEnd& p) {
  j = nlohmann::json{{"kind", "end"}};
  to_json_optional(j, "message", p.message);
}

void from_json(const nlohmann::json& j, WorkDoneProgressEnd& p) {
  if (j.at("kind").get<std::string>() != "end") {
    throw std::runtime_error("Expected work done progress end");
  }
  from_json_optional(j, "message", p.message);
}

// Cancel a Work Done Progress Notification
void to_json(nlohmann::json& j, const WorkDoneProgressCancelParams& p) {
  j = nlohmann::json{{"token", p.token}};
}

void from_json(const nlohmann::json& j, WorkDoneProgressCancelParams& p) {
  j.at("token").get_to(p.token);
}

}  // namespace lsp
