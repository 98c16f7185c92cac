#include "mcp/jsonrpc.hpp"

#include <utility>

namespace toolwire::mcp {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

std::optional<nlohmann::json> recover_id(const nlohmann::json& message) {
  const auto id_it = message.find("id");
  if (id_it == message.end() || !is_valid_id(*id_it)) {
    return std::nullopt;
  }
  return *id_it;
}

JsonRpcError parse_error_object(const nlohmann::json& error, const std::optional<nlohmann::json>& id) {
  if (!error.is_object()) {
    throw DecodeError(ErrorCode::INVALID_REQUEST, "error must be an object", id);
  }

  const auto code_it = error.find("code");
  const auto message_it = error.find("message");
  JsonRpcError parsed{.code = static_cast<int>(ErrorCode::INTERNAL_ERROR), .message = {}, .data = std::nullopt};
  if (code_it != error.end() && code_it->is_number_integer()) {
    parsed.code = code_it->get<int>();
  }
  if (message_it != error.end() && message_it->is_string()) {
    parsed.message = message_it->get<std::string>();
  }
  if (const auto data_it = error.find("data"); data_it != error.end()) {
    parsed.data = *data_it;
  }
  return parsed;
}

nlohmann::json to_wire(const JsonRpcRequest& request) {
  return nlohmann::json{
      {"jsonrpc", kJsonRpcVersion}, {"id", request.id}, {"method", request.method}, {"params", request.params}};
}

nlohmann::json to_wire(const JsonRpcNotification& notification) {
  nlohmann::json out{{"jsonrpc", kJsonRpcVersion}, {"method", notification.method}};
  if (!notification.params.is_null()) {
    out["params"] = notification.params;
  }
  return out;
}

nlohmann::json to_wire(const JsonRpcResponse& response) {
  if (response.error.has_value()) {
    return make_error_response(response.id, *response.error);
  }
  return make_result_response(response.id, response.result.value_or(nlohmann::json::object()));
}

}  // namespace

Message decode(std::string_view frame) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(frame.begin(), frame.end());
  } catch (const nlohmann::json::parse_error& ex) {
    throw DecodeError(ErrorCode::PARSE_ERROR, std::string("parse error: ") + ex.what());
  }
  return decode_message(message);
}

Message decode_message(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw DecodeError(ErrorCode::INVALID_REQUEST, "message must be a JSON object");
  }

  const auto id = recover_id(message);

  const auto jsonrpc_it = message.find("jsonrpc");
  if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw DecodeError(ErrorCode::INVALID_REQUEST, "jsonrpc must be \"2.0\"", id);
  }

  const auto method_it = message.find("method");
  if (method_it == message.end()) {
    const auto result_it = message.find("result");
    const auto error_it = message.find("error");
    if (result_it == message.end() && error_it == message.end()) {
      throw DecodeError(ErrorCode::INVALID_REQUEST, "missing field: method", id);
    }
    if (!id.has_value()) {
      throw DecodeError(ErrorCode::INVALID_REQUEST, "response is missing a valid id");
    }

    JsonRpcResponse response{.id = *id};
    if (error_it != message.end()) {
      response.error = parse_error_object(*error_it, id);
    } else {
      response.result = *result_it;
    }
    return response;
  }

  if (!method_it->is_string()) {
    throw DecodeError(ErrorCode::INVALID_REQUEST, "method must be a string", id);
  }

  nlohmann::json params = nlohmann::json::object();
  const auto params_it = message.find("params");
  if (params_it != message.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw DecodeError(ErrorCode::INVALID_REQUEST, "params must be an object or an array", id);
    }
    params = *params_it;
  }

  const auto id_it = message.find("id");
  if (id_it == message.end()) {
    return JsonRpcNotification{.method = method_it->get<std::string>(), .params = std::move(params)};
  }
  if (!id.has_value()) {
    throw DecodeError(ErrorCode::INVALID_REQUEST, "id must be string, integer, or null");
  }

  return JsonRpcRequest{.id = *id, .method = method_it->get<std::string>(), .params = std::move(params)};
}

std::string encode(const Message& message) {
  const auto json = std::visit([](const auto& value) { return to_wire(value); }, message);
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json error_object{{"code", error.code}, {"message", error.message}};
  if (error.data.has_value()) {
    error_object["data"] = *error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", std::move(error_object)}};
}

JsonRpcError make_error(const ErrorCode code, std::string message) {
  return JsonRpcError{.code = static_cast<int>(code), .message = std::move(message), .data = std::nullopt};
}

}  // namespace toolwire::mcp
