#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolwire::mcp {

constexpr const char* kLatestProtocolVersion = "2025-06-18";
constexpr std::array<const char*, 3> kSupportedProtocolVersions = {"2025-06-18", "2025-03-26", "2024-11-05"};

enum class SessionState : std::uint8_t {
  UNINITIALIZED = 0,
  INITIALIZING = 1,
  READY = 2,
  CLOSED = 3,
};

const char* to_string(SessionState state) noexcept;

struct ServerInfo {
  std::string name;
  std::string version;
  std::string instructions{};
};

// Fixed in this design: no runtime registration, no subscriptions.
struct Capabilities {
  bool tools_list_changed{false};
  bool resources_subscribe{false};
  bool resources_list_changed{false};

  [[nodiscard]] nlohmann::json to_json() const;
};

// Echoes a supported requested version, otherwise answers with the latest one.
std::string select_protocol_version(std::string_view requested);

// Uninitialized -> Initializing -> Ready -> Closed. Each transition happens at most once.
class Negotiator {
 public:
  explicit Negotiator(ServerInfo info, Capabilities capabilities = {});

  // Result of the initialize request. Throws ProtocolError outside UNINITIALIZED and
  // InvalidArgumentsError for malformed params; neither changes the state.
  nlohmann::json initialize(const nlohmann::json& params);

  // Returns true when the notification completed the handshake.
  bool initialized() noexcept;

  // Throws ProtocolError unless the handshake has completed.
  void require_ready(std::string_view method) const;

  void close() noexcept;

  [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
  [[nodiscard]] const Capabilities& capabilities() const noexcept { return capabilities_; }
  [[nodiscard]] const std::string& protocol_version() const noexcept { return protocol_version_; }
  [[nodiscard]] const nlohmann::json& client_info() const noexcept { return client_info_; }

 private:
  ServerInfo info_;
  Capabilities capabilities_;
  std::atomic<SessionState> state_{SessionState::UNINITIALIZED};
  std::string protocol_version_{};
  nlohmann::json client_info_ = nlohmann::json::object();
};

}  // namespace toolwire::mcp
