#include "mcp/dispatcher.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

namespace {

const std::string& require_string(const nlohmann::json& params, const char* field) {
  if (!params.is_object()) {
    throw InvalidArgumentsError("params", "params must be an object");
  }

  const auto it = params.find(field);
  if (it == params.end()) {
    throw InvalidArgumentsError(field, std::string("missing required parameter: ") + field);
  }
  if (!it->is_string()) {
    throw InvalidArgumentsError(field, std::string(field) + " must be a string");
  }
  return it->get_ref<const std::string&>();
}

nlohmann::json tool_error_result(const std::string& message) {
  return nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", "Error: " + message}}})},
                        {"isError", true}};
}

}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<const Registry> registry, core::Logger& logger)
    : registry_(std::move(registry)), logger_(logger) {
  if (!registry_) {
    throw std::invalid_argument("registry cannot be null");
  }
}

nlohmann::json Dispatcher::list_tools(const nlohmann::json& /*params*/) const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : registry_->list_tools()) {
    tools.push_back(tool.to_json());
  }
  return nlohmann::json{{"tools", std::move(tools)}};
}

nlohmann::json Dispatcher::list_resources(const nlohmann::json& /*params*/) const {
  nlohmann::json resources = nlohmann::json::array();
  for (const auto& resource : registry_->list_resources()) {
    resources.push_back(resource.to_json());
  }
  return nlohmann::json{{"resources", std::move(resources)}};
}

nlohmann::json Dispatcher::read_resource(const nlohmann::json& params) const {
  const auto& uri = require_string(params, "uri");

  const auto* resource = registry_->find_resource(uri);
  if (resource == nullptr) {
    throw NotFoundError("resource not found: " + uri);
  }

  std::string text;
  try {
    text = resource->handler(uri);
  } catch (const NotFoundError&) {
    throw;
  } catch (const std::exception& ex) {
    logger_.warn("resource handler for " + uri + " failed: " + ex.what());
    throw HandlerError("failed to read resource " + uri + ": " + ex.what());
  } catch (...) {
    logger_.warn("resource handler for " + uri + " failed with a non-standard exception");
    throw HandlerError("failed to read resource " + uri);
  }

  return nlohmann::json{
      {"contents",
       nlohmann::json::array({{{"uri", uri}, {"mimeType", resource->descriptor.mime_type}, {"text", std::move(text)}}})}};
}

nlohmann::json Dispatcher::call_tool(const nlohmann::json& params) const {
  const auto& name = require_string(params, "name");

  const auto* tool = registry_->find_tool(name);
  if (tool == nullptr) {
    throw NotFoundError("tool not found: " + name);
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw InvalidArgumentsError("arguments", "arguments must be an object");
    }
    arguments = *it;
  }

  tool->descriptor.input_schema.validate(arguments);
  arguments = tool->descriptor.input_schema.apply_defaults(std::move(arguments));

  std::vector<ContentItem> content;
  try {
    content = tool->handler(arguments);
  } catch (const std::exception& ex) {
    logger_.warn("tool " + name + " failed: " + ex.what());
    return tool_error_result(ex.what());
  } catch (...) {
    logger_.warn("tool " + name + " failed with a non-standard exception");
    return tool_error_result("unknown error");
  }

  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : content) {
    items.push_back(item.to_json());
  }
  return nlohmann::json{{"content", std::move(items)}, {"isError", false}};
}

}  // namespace toolwire::mcp
