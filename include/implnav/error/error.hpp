#pragma once

#include <expected>
#include <string>
#include <utility>

namespace implnav {

/**
 * @brief Error codes for implementation lookups and the command host
 */
enum class ImplnavErrorCode {
  // No error
  Success = 0,

  // Lookup errors
  Cancelled,
  SearchFailed,

  // Request errors
  DocumentNotOpen,
  InvalidArguments,
  UnknownCommand,

  // Configuration errors
  ConfigParseFailed,

  UnknownError
};

/**
 * @brief Error value carried through std::expected by implnav components
 */
class ImplnavError {
 public:
  ImplnavError() : code_(ImplnavErrorCode::Success) {}

  explicit ImplnavError(ImplnavErrorCode code)
      : code_(code), message_(GetDefaultMessage(code)) {}

  ImplnavError(ImplnavErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  bool ok() const { return code_ == ImplnavErrorCode::Success; }

  ImplnavErrorCode code() const { return code_; }

  const std::string& message() const { return message_; }

  explicit operator bool() const { return !ok(); }

  static std::string GetDefaultMessage(ImplnavErrorCode code) {
    switch (code) {
      case ImplnavErrorCode::Success:
        return "Success";
      case ImplnavErrorCode::Cancelled:
        return "Operation cancelled";
      case ImplnavErrorCode::SearchFailed:
        return "Implementation search failed";
      case ImplnavErrorCode::DocumentNotOpen:
        return "Document not open";
      case ImplnavErrorCode::InvalidArguments:
        return "Invalid command arguments";
      case ImplnavErrorCode::UnknownCommand:
        return "Unknown command";
      case ImplnavErrorCode::ConfigParseFailed:
        return "Failed to parse configuration";
      case ImplnavErrorCode::UnknownError:
        return "Unknown error";
    }
    return "Unknown error";
  }

  static ImplnavError Make(
      ImplnavErrorCode code, const std::string& details = "") {
    if (details.empty()) {
      return ImplnavError(code);
    }
    return ImplnavError(code, GetDefaultMessage(code) + ": " + details);
  }

  static std::unexpected<ImplnavError> Unexpected(
      ImplnavErrorCode code, const std::string& details = "") {
    return std::unexpected<ImplnavError>(Make(code, details));
  }

 private:
  ImplnavErrorCode code_ = ImplnavErrorCode::Success;
  std::string message_;
};

}  // namespace implnav
