#include <iostream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcp/errors.hpp"
#include "mcp/jsonrpc.hpp"

using toolwire::mcp::DecodeError;
using toolwire::mcp::ErrorCode;
using toolwire::mcp::JsonRpcNotification;
using toolwire::mcp::JsonRpcRequest;
using toolwire::mcp::JsonRpcResponse;
using toolwire::mcp::Message;
using toolwire::mcp::decode;
using toolwire::mcp::encode;
using toolwire::mcp::make_error;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_decode_request() {
  const auto message = decode(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list","params":{"cursor":"x"}})");
  const auto* request = std::get_if<JsonRpcRequest>(&message);
  if (request == nullptr) {
    return fail("test_decode_request", "expected a request");
  }
  if (request->id != "abc" || request->method != "tools/list" || request->params.value("cursor", "") != "x") {
    return fail("test_decode_request", "request fields mismatch");
  }
  return 0;
}

int test_decode_request_defaults_params() {
  const auto message = decode(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
  const auto* request = std::get_if<JsonRpcRequest>(&message);
  if (request == nullptr || !request->params.is_object() || !request->params.empty()) {
    return fail("test_decode_request_defaults_params", "expected empty object params");
  }
  return 0;
}

int test_decode_notification_without_id() {
  const auto message = decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  const auto* notification = std::get_if<JsonRpcNotification>(&message);
  if (notification == nullptr || notification->method != "notifications/initialized") {
    return fail("test_decode_notification_without_id", "expected a notification");
  }
  return 0;
}

int test_decode_response() {
  const auto message = decode(R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"nope"}})");
  const auto* response = std::get_if<JsonRpcResponse>(&message);
  if (response == nullptr || !response->error.has_value()) {
    return fail("test_decode_response", "expected an error response");
  }
  if (response->id != 9 || response->error->code != -32601 || response->error->message != "nope") {
    return fail("test_decode_response", "response fields mismatch");
  }
  return 0;
}

int test_missing_method_keeps_id() {
  try {
    (void)decode(R"({"jsonrpc":"2.0","id":42,"params":{}})");
  } catch (const DecodeError& ex) {
    if (ex.code() != ErrorCode::INVALID_REQUEST) {
      return fail("test_missing_method_keeps_id", "expected INVALID_REQUEST");
    }
    if (!ex.id().has_value() || *ex.id() != 42) {
      return fail("test_missing_method_keeps_id", "expected the id to be recovered");
    }
    if (std::string(ex.what()).find("method") == std::string::npos) {
      return fail("test_missing_method_keeps_id", "message should name the missing field");
    }
    return 0;
  }
  return fail("test_missing_method_keeps_id", "expected DecodeError");
}

int test_parse_error_has_no_id() {
  try {
    (void)decode("{\"jsonrpc\":\"2.0\",\"id\":1,");
  } catch (const DecodeError& ex) {
    if (ex.code() != ErrorCode::PARSE_ERROR || ex.id().has_value()) {
      return fail("test_parse_error_has_no_id", "expected PARSE_ERROR without id");
    }
    return 0;
  }
  return fail("test_parse_error_has_no_id", "expected DecodeError");
}

int test_rejects_wrong_version_and_bad_id() {
  bool version_rejected = false;
  try {
    (void)decode(R"({"jsonrpc":"1.0","id":1,"method":"ping"})");
  } catch (const DecodeError& ex) {
    version_rejected = ex.id().has_value() && *ex.id() == 1;
  }
  if (!version_rejected) {
    return fail("test_rejects_wrong_version_and_bad_id", "expected version rejection carrying the id");
  }

  bool id_rejected = false;
  try {
    (void)decode(R"({"jsonrpc":"2.0","id":{"nested":true},"method":"ping"})");
  } catch (const DecodeError& ex) {
    id_rejected = !ex.id().has_value();
  }
  if (!id_rejected) {
    return fail("test_rejects_wrong_version_and_bad_id", "expected object id to be unrecoverable");
  }

  bool params_rejected = false;
  try {
    (void)decode(R"({"jsonrpc":"2.0","id":2,"method":"ping","params":"text"})");
  } catch (const DecodeError& ex) {
    params_rejected = ex.code() == ErrorCode::INVALID_REQUEST;
  }
  if (!params_rejected) {
    return fail("test_rejects_wrong_version_and_bad_id", "expected string params to be rejected");
  }
  return 0;
}

int test_encode_result_and_error() {
  const auto result_frame = encode(JsonRpcResponse{.id = 1, .result = nlohmann::json{{"ok", true}}, .error = {}});
  const auto result = nlohmann::json::parse(result_frame);
  if (result.at("jsonrpc") != "2.0" || result.at("id") != 1 || result.at("result").at("ok") != true ||
      result.contains("error")) {
    return fail("test_encode_result_and_error", "result response shape mismatch");
  }

  const auto error_frame =
      encode(JsonRpcResponse{.id = "req-1", .result = {}, .error = make_error(ErrorCode::NOT_FOUND, "tool not found")});
  const auto error = nlohmann::json::parse(error_frame);
  if (error.at("id") != "req-1" || error.at("error").at("code") != -32001 ||
      error.at("error").at("message") != "tool not found" || error.contains("result")) {
    return fail("test_encode_result_and_error", "error response shape mismatch");
  }

  if (result_frame.find('\n') != std::string::npos || error_frame.find('\n') != std::string::npos) {
    return fail("test_encode_result_and_error", "encoded frames must be single-line");
  }
  return 0;
}

int test_encode_tolerates_invalid_utf8() {
  const std::string broken = std::string("bad \xff byte");
  std::string frame;
  try {
    frame = encode(JsonRpcResponse{.id = 1, .result = nlohmann::json{{"text", broken}}, .error = {}});
  } catch (const std::exception&) {
    return fail("test_encode_tolerates_invalid_utf8", "encode threw on invalid UTF-8");
  }
  if (frame.empty()) {
    return fail("test_encode_tolerates_invalid_utf8", "empty frame");
  }
  return 0;
}

int test_encode_notification_round_trips() {
  const Message sent = JsonRpcNotification{.method = "notifications/message", .params = {{"level", "info"}}};
  const auto received = decode(encode(sent));
  const auto* notification = std::get_if<JsonRpcNotification>(&received);
  if (notification == nullptr || notification->params.value("level", "") != "info") {
    return fail("test_encode_notification_round_trips", "notification did not survive encoding");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_decode_request(); rc != 0) {
    return rc;
  }
  if (int rc = test_decode_request_defaults_params(); rc != 0) {
    return rc;
  }
  if (int rc = test_decode_notification_without_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_decode_response(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_method_keeps_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_error_has_no_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_rejects_wrong_version_and_bad_id(); rc != 0) {
    return rc;
  }
  if (int rc = test_encode_result_and_error(); rc != 0) {
    return rc;
  }
  if (int rc = test_encode_tolerates_invalid_utf8(); rc != 0) {
    return rc;
  }
  if (int rc = test_encode_notification_round_trips(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] jsonrpc unit tests\n";
  return 0;
}
