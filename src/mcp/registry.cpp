#include "mcp/registry.hpp"

#include <stdexcept>
#include <utility>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

nlohmann::json Tool::to_json() const {
  return nlohmann::json{{"name", descriptor.name},
                        {"description", descriptor.description},
                        {"inputSchema", descriptor.input_schema.to_json()}};
}

nlohmann::json Resource::to_json() const {
  return nlohmann::json{{"uri", descriptor.uri},
                        {"name", descriptor.name},
                        {"description", descriptor.description},
                        {"mimeType", descriptor.mime_type}};
}

void Registry::register_tool(ToolDescriptor descriptor, ToolHandler handler) {
  if (descriptor.name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (!handler) {
    throw std::invalid_argument("tool " + descriptor.name + " has no handler");
  }
  if (tool_index_.find(descriptor.name) != tool_index_.end()) {
    throw DuplicateKeyError("tool already registered: " + descriptor.name);
  }

  tool_index_.emplace(descriptor.name, tools_.size());
  tools_.push_back(Tool{.descriptor = std::move(descriptor), .handler = std::move(handler)});
}

void Registry::register_resource(ResourceDescriptor descriptor, ResourceHandler handler) {
  if (descriptor.uri.empty()) {
    throw std::invalid_argument("resource uri must not be empty");
  }
  if (!handler) {
    throw std::invalid_argument("resource " + descriptor.uri + " has no handler");
  }
  if (resource_index_.find(descriptor.uri) != resource_index_.end()) {
    throw DuplicateKeyError("resource already registered: " + descriptor.uri);
  }

  resource_index_.emplace(descriptor.uri, resources_.size());
  resources_.push_back(Resource{.descriptor = std::move(descriptor), .handler = std::move(handler)});
}

const Tool* Registry::find_tool(const std::string& name) const {
  const auto it = tool_index_.find(name);
  return it == tool_index_.end() ? nullptr : &tools_[it->second];
}

const Resource* Registry::find_resource(const std::string& uri) const {
  const auto it = resource_index_.find(uri);
  return it == resource_index_.end() ? nullptr : &resources_[it->second];
}

}  // namespace toolwire::mcp
