#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

struct JsonRpcError {
  int code;
  std::string message;
  std::optional<nlohmann::json> data{};
};

struct JsonRpcRequest {
  nlohmann::json id;
  std::string method;
  nlohmann::json params;
};

struct JsonRpcNotification {
  std::string method;
  nlohmann::json params;
};

struct JsonRpcResponse {
  nlohmann::json id;
  std::optional<nlohmann::json> result{};
  std::optional<JsonRpcError> error{};
};

using Message = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

// Throws DecodeError. The error carries the request id whenever one was recoverable.
Message decode(std::string_view frame);
Message decode_message(const nlohmann::json& message);

std::string encode(const Message& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

JsonRpcError make_error(ErrorCode code, std::string message);

}  // namespace toolwire::mcp
