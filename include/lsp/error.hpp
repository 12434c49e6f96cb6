#pragma once

#include <expected>
#include <string>
#include <utility>

#include <jsonrpc/error/error.hpp>
#include <nlohmann/json.hpp>

namespace lsp::error {

using RpcError = jsonrpc::error::RpcError;
using RpcErrorCode = jsonrpc::error::RpcErrorCode;

enum class LspErrorCode {
  // RPC errors passthrough
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,
  kTransportError,
  kTimeoutError,

  // LSP errors
  kServerNotInitialized,
  kRequestCancelled,
  kMethodNotImplemented,
  kDocumentNotOpen,

  kUnknownError,
};

namespace detail {

inline auto DefaultMessageFor(LspErrorCode code) -> std::string {
  switch (code) {
    case LspErrorCode::kParseError:
      return "Parse error";
    case LspErrorCode::kInvalidRequest:
      return "Invalid request";
    case LspErrorCode::kMethodNotFound:
      return "Method not found";
    case LspErrorCode::kInvalidParams:
      return "Invalid params";
    case LspErrorCode::kInternalError:
      return "Internal error";
    case LspErrorCode::kTransportError:
      return "Transport error";
    case LspErrorCode::kTimeoutError:
      return "Timeout error";
    case LspErrorCode::kServerNotInitialized:
      return "Server not initialized";
    case LspErrorCode::kRequestCancelled:
      return "Request cancelled";
    case LspErrorCode::kMethodNotImplemented:
      return "Method not implemented";
    case LspErrorCode::kDocumentNotOpen:
      return "Document not open";
    case LspErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

}  // namespace detail

class LspError {
 public:
  explicit LspError(LspErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    return {
        {"code", code_},
        {"message", message_},
    };
  }

  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError {
    if (message.empty()) {
      return LspError(code, detail::DefaultMessageFor(code));
    }
    return LspError(code, message);
  }

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

  static auto FromRpcError(const RpcError& error) -> LspError {
    switch (error.Code()) {
      case RpcErrorCode::kParseError:
        return LspError(LspErrorCode::kParseError, error.Message());
      case RpcErrorCode::kInvalidRequest:
        return LspError(LspErrorCode::kInvalidRequest, error.Message());
      case RpcErrorCode::kMethodNotFound:
        return LspError(LspErrorCode::kMethodNotFound, error.Message());
      case RpcErrorCode::kInvalidParams:
        return LspError(LspErrorCode::kInvalidParams, error.Message());
      case RpcErrorCode::kInternalError:
        return LspError(LspErrorCode::kInternalError, error.Message());
      case RpcErrorCode::kTransportError:
        return LspError(LspErrorCode::kTransportError, error.Message());
      case RpcErrorCode::kTimeoutError:
        return LspError(LspErrorCode::kTimeoutError, error.Message());
      default:
        return LspError(LspErrorCode::kUnknownError, error.Message());
    }
  }

  static auto UnexpectedFromRpcError(const RpcError& error)
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromRpcError(error));
  }

 private:
  LspErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

inline void to_json(nlohmann::json& j, const LspError& e) {
  j = e.ToJson();
}

}  // namespace lsp::error
