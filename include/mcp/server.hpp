#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/log.hpp"
#include "mcp/dispatcher.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/negotiator.hpp"
#include "mcp/registry.hpp"
#include "mcp/transport.hpp"
#include "mcp/worker_pool.hpp"

namespace toolwire::mcp {

// One transport connection: handshake state, dispatch and response writing.
class Session {
 public:
  Session(const core::ServerConfig& config, std::shared_ptr<const Registry> registry, Transport& transport,
          core::Logger& logger);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Reads frames until end of stream or a transport failure. Returns 0 or 1 respectively.
  int run();

  void handle_frame(const std::string& frame);

  // Stops accepting messages, lets in-flight handlers finish, closes the transport.
  void shutdown();

  [[nodiscard]] SessionState state() const noexcept { return negotiator_.state(); }
  [[nodiscard]] const Negotiator& negotiator() const noexcept { return negotiator_; }

 private:
  using Work = std::function<nlohmann::json()>;

  void handle_request(const JsonRpcRequest& request);
  void handle_notification(const JsonRpcNotification& notification);
  bool ensure_ready(const JsonRpcRequest& request);
  void respond(const nlohmann::json& id, const Work& work);
  void respond_async(const nlohmann::json& id, Work work);
  void send_error(const nlohmann::json& id, JsonRpcError error);
  void send(const JsonRpcResponse& response);

  core::Logger& logger_;
  Transport& transport_;
  Negotiator negotiator_;
  Dispatcher dispatcher_;
  std::atomic<bool> transport_failed_{false};
  // Declared last so its threads are joined before the members they use go away.
  WorkerPool workers_;
};

class Server {
 public:
  Server(core::ServerConfig config, Registry registry, core::Logger& logger);

  // Serves one session on the transport until it closes.
  int run(Transport& transport) const;

  [[nodiscard]] const Registry& registry() const noexcept { return *registry_; }

 private:
  core::ServerConfig config_;
  std::shared_ptr<const Registry> registry_;
  core::Logger& logger_;
};

}  // namespace toolwire::mcp
