#include "mcp/server.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

Session::Session(const core::ServerConfig& config, std::shared_ptr<const Registry> registry, Transport& transport,
                 core::Logger& logger)
    : logger_(logger),
      transport_(transport),
      negotiator_(ServerInfo{.name = config.name, .version = config.version, .instructions = config.instructions}),
      dispatcher_(std::move(registry), logger),
      workers_(config.worker_threads) {}

Session::~Session() { shutdown(); }

int Session::run() {
  logger_.info("session started with " + std::to_string(workers_.size()) + " worker threads");

  int rc = 0;
  try {
    while (negotiator_.state() != SessionState::CLOSED && !transport_failed_.load()) {
      const auto frame = transport_.receive();
      if (!frame.has_value()) {
        logger_.info("end of stream");
        break;
      }
      handle_frame(*frame);
    }
  } catch (const TransportError& ex) {
    logger_.error(std::string("transport failure: ") + ex.what());
    rc = 1;
  }

  shutdown();
  if (transport_failed_.load()) {
    rc = 1;
  }
  logger_.info("session closed");
  return rc;
}

void Session::handle_frame(const std::string& frame) {
  if (negotiator_.state() == SessionState::CLOSED) {
    logger_.debug("session closed; frame ignored");
    return;
  }

  Message message;
  try {
    message = decode(frame);
  } catch (const DecodeError& ex) {
    if (ex.id().has_value()) {
      send_error(*ex.id(), make_error(ex.code(), ex.what()));
    } else {
      logger_.warn(std::string("dropped frame: ") + ex.what());
    }
    return;
  }

  if (const auto* request = std::get_if<JsonRpcRequest>(&message); request != nullptr) {
    handle_request(*request);
    return;
  }
  if (const auto* notification = std::get_if<JsonRpcNotification>(&message); notification != nullptr) {
    handle_notification(*notification);
    return;
  }

  logger_.debug("ignoring unsolicited response for id " + std::get<JsonRpcResponse>(message).id.dump());
}

void Session::shutdown() {
  negotiator_.close();
  workers_.drain_and_stop();
  transport_.close();
}

void Session::handle_request(const JsonRpcRequest& request) {
  const auto& method = request.method;
  if (logger_.enabled(core::LogLevel::DEBUG)) {
    logger_.debug("request " + method + " id=" + request.id.dump());
  }

  if (method == "initialize") {
    respond(request.id, [this, &request]() {
      auto result = negotiator_.initialize(request.params);
      const auto& client_info = negotiator_.client_info();
      const auto name_it = client_info.find("name");
      const std::string client =
          name_it != client_info.end() && name_it->is_string() ? name_it->get<std::string>() : "unknown";
      logger_.info("initialize: protocol " + negotiator_.protocol_version() + ", client " + client);
      return result;
    });
    return;
  }

  if (method == "ping") {
    respond(request.id, []() { return nlohmann::json::object(); });
    return;
  }

  if (!ensure_ready(request)) {
    return;
  }

  if (method == "tools/list") {
    respond(request.id, [this, &request]() { return dispatcher_.list_tools(request.params); });
    return;
  }
  if (method == "resources/list") {
    respond(request.id, [this, &request]() { return dispatcher_.list_resources(request.params); });
    return;
  }
  if (method == "tools/call") {
    respond_async(request.id, [this, params = request.params]() { return dispatcher_.call_tool(params); });
    return;
  }
  if (method == "resources/read") {
    respond_async(request.id, [this, params = request.params]() { return dispatcher_.read_resource(params); });
    return;
  }

  send_error(request.id, make_error(ErrorCode::METHOD_NOT_FOUND, "method not found: " + method));
}

void Session::handle_notification(const JsonRpcNotification& notification) {
  const auto& method = notification.method;

  if (method == "notifications/initialized" || method == "initialized") {
    if (negotiator_.initialized()) {
      logger_.info("handshake complete; session ready");
    } else {
      logger_.warn(std::string("unexpected initialized notification in state ") + to_string(negotiator_.state()));
    }
    return;
  }

  if (method == "notifications/cancelled") {
    logger_.debug("cancellation ignored; handlers run to completion");
    return;
  }

  logger_.debug("ignoring notification " + method);
}

bool Session::ensure_ready(const JsonRpcRequest& request) {
  try {
    negotiator_.require_ready(request.method);
  } catch (const ProtocolError& ex) {
    logger_.warn(ex.what());
    send_error(request.id, make_error(ex.code(), ex.what()));
    return false;
  }
  return true;
}

void Session::respond(const nlohmann::json& id, const Work& work) {
  JsonRpcResponse response{.id = id};
  try {
    response.result = work();
  } catch (const ProtocolError& ex) {
    response.error = make_error(ex.code(), ex.what());
  } catch (const InvalidArgumentsError& ex) {
    auto error = make_error(ErrorCode::INVALID_PARAMS, ex.what());
    error.data = nlohmann::json{{"field", ex.field()}};
    response.error = std::move(error);
  } catch (const NotFoundError& ex) {
    response.error = make_error(ErrorCode::NOT_FOUND, ex.what());
  } catch (const HandlerError& ex) {
    response.error = make_error(ErrorCode::INTERNAL_ERROR, ex.what());
  } catch (const std::exception& ex) {
    logger_.error(std::string("request failed: ") + ex.what());
    response.error = make_error(ErrorCode::INTERNAL_ERROR, std::string("internal error: ") + ex.what());
  } catch (...) {
    logger_.error("request failed with a non-standard exception");
    response.error = make_error(ErrorCode::INTERNAL_ERROR, "internal error");
  }

  send(response);
}

void Session::respond_async(const nlohmann::json& id, Work work) {
  auto task = [this, id, work = std::move(work)]() {
    try {
      respond(id, work);
    } catch (const TransportError& ex) {
      transport_failed_.store(true);
      logger_.error(std::string("transport failure while responding: ") + ex.what());
    }
  };

  if (!workers_.submit(std::move(task))) {
    send_error(id, make_error(ErrorCode::INVALID_REQUEST, "session is closing"));
  }
}

void Session::send_error(const nlohmann::json& id, JsonRpcError error) {
  send(JsonRpcResponse{.id = id, .result = std::nullopt, .error = std::move(error)});
}

void Session::send(const JsonRpcResponse& response) {
  if (!transport_.send(encode(response))) {
    logger_.warn("transport closed; dropped response for id " + response.id.dump());
  }
}

Server::Server(core::ServerConfig config, Registry registry, core::Logger& logger)
    : config_(std::move(config)), registry_(std::make_shared<const Registry>(std::move(registry))), logger_(logger) {}

int Server::run(Transport& transport) const {
  Session session(config_, registry_, transport, logger_);
  return session.run();
}

}  // namespace toolwire::mcp
