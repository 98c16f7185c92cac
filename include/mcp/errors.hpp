#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace toolwire::mcp {

enum class ErrorCode : int {
  PARSE_ERROR = -32700,
  INVALID_REQUEST = -32600,
  METHOD_NOT_FOUND = -32601,
  INVALID_PARAMS = -32602,
  INTERNAL_ERROR = -32603,

  NOT_FOUND = -32001,
  SERVER_NOT_INITIALIZED = -32002,
};

// Stream broken or delimiter lost. Ends the session.
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A single frame could not be decoded. id is set when the frame carried a usable one.
class DecodeError : public std::invalid_argument {
 public:
  DecodeError(ErrorCode code, const std::string& message, std::optional<nlohmann::json> id = std::nullopt)
      : std::invalid_argument(message), code_(code), id_(std::move(id)) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] const std::optional<nlohmann::json>& id() const noexcept { return id_; }

 private:
  ErrorCode code_;
  std::optional<nlohmann::json> id_;
};

class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& message, ErrorCode code = ErrorCode::SERVER_NOT_INITIALIZED)
      : std::runtime_error(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidArgumentsError : public std::invalid_argument {
 public:
  InvalidArgumentsError(std::string field, const std::string& message)
      : std::invalid_argument(message), field_(std::move(field)) {}

  [[nodiscard]] const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

// A resource read handler failed. Tool handler failures never surface as this type.
class HandlerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DuplicateKeyError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace toolwire::mcp
