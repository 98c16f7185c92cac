#include "mcp/negotiator.hpp"

#include <algorithm>
#include <utility>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

const char* to_string(const SessionState state) noexcept {
  switch (state) {
    case SessionState::UNINITIALIZED:
      return "uninitialized";
    case SessionState::INITIALIZING:
      return "initializing";
    case SessionState::READY:
      return "ready";
    case SessionState::CLOSED:
      return "closed";
  }
  return "unknown";
}

nlohmann::json Capabilities::to_json() const {
  return nlohmann::json{
      {"tools", {{"listChanged", tools_list_changed}}},
      {"resources", {{"subscribe", resources_subscribe}, {"listChanged", resources_list_changed}}}};
}

std::string select_protocol_version(std::string_view requested) {
  const auto it = std::find_if(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(),
                               [requested](const char* version) { return requested == version; });
  return it != kSupportedProtocolVersions.end() ? std::string(*it) : std::string(kLatestProtocolVersion);
}

Negotiator::Negotiator(ServerInfo info, Capabilities capabilities)
    : info_(std::move(info)), capabilities_(capabilities) {}

nlohmann::json Negotiator::initialize(const nlohmann::json& params) {
  const auto current = state_.load();
  if (current == SessionState::CLOSED) {
    throw ProtocolError("session is closed", ErrorCode::INVALID_REQUEST);
  }
  if (current != SessionState::UNINITIALIZED) {
    throw ProtocolError("session already initialized", ErrorCode::INVALID_REQUEST);
  }

  if (!params.is_object()) {
    throw InvalidArgumentsError("params", "params must be an object");
  }

  std::string requested;
  if (const auto it = params.find("protocolVersion"); it != params.end()) {
    if (!it->is_string()) {
      throw InvalidArgumentsError("protocolVersion", "protocolVersion must be a string");
    }
    requested = it->get<std::string>();
  }

  nlohmann::json client_info = nlohmann::json::object();
  if (const auto it = params.find("clientInfo"); it != params.end()) {
    if (!it->is_object()) {
      throw InvalidArgumentsError("clientInfo", "clientInfo must be an object");
    }
    client_info = *it;
  }

  protocol_version_ = select_protocol_version(requested);
  client_info_ = std::move(client_info);

  nlohmann::json result{{"protocolVersion", protocol_version_},
                        {"capabilities", capabilities_.to_json()},
                        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}};
  if (!info_.instructions.empty()) {
    result["instructions"] = info_.instructions;
  }

  auto expected = SessionState::UNINITIALIZED;
  if (!state_.compare_exchange_strong(expected, SessionState::INITIALIZING)) {
    throw ProtocolError("session is closed", ErrorCode::INVALID_REQUEST);
  }
  return result;
}

bool Negotiator::initialized() noexcept {
  auto expected = SessionState::INITIALIZING;
  return state_.compare_exchange_strong(expected, SessionState::READY);
}

void Negotiator::require_ready(std::string_view method) const {
  switch (state_.load()) {
    case SessionState::READY:
      return;
    case SessionState::UNINITIALIZED:
      throw ProtocolError("server not initialized: " + std::string(method) + " requires initialize first");
    case SessionState::INITIALIZING:
      throw ProtocolError("server not initialized: " + std::string(method) +
                          " requires the initialized notification first");
    case SessionState::CLOSED:
      break;
  }
  throw ProtocolError("session is closed", ErrorCode::INVALID_REQUEST);
}

void Negotiator::close() noexcept { state_.store(SessionState::CLOSED); }

}  // namespace toolwire::mcp
