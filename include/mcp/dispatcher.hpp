#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "mcp/registry.hpp"

namespace toolwire::mcp {

// Steady-state request handling against a read-only registry. Each method returns the
// response result or throws; the session turns exceptions into error responses.
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<const Registry> registry, core::Logger& logger);

  [[nodiscard]] nlohmann::json list_tools(const nlohmann::json& params) const;
  [[nodiscard]] nlohmann::json list_resources(const nlohmann::json& params) const;

  // Throws InvalidArgumentsError, NotFoundError, or HandlerError when the read handler fails.
  [[nodiscard]] nlohmann::json read_resource(const nlohmann::json& params) const;

  // Throws InvalidArgumentsError or NotFoundError before any handler runs. A failing handler
  // produces a normal result with isError set and the failure as text content.
  [[nodiscard]] nlohmann::json call_tool(const nlohmann::json& params) const;

 private:
  std::shared_ptr<const Registry> registry_;
  core::Logger& logger_;
};

}  // namespace toolwire::mcp
