#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcp/content.hpp"
#include "mcp/schema.hpp"

namespace toolwire::mcp {

struct ToolDescriptor {
  std::string name;
  std::string description;
  InputSchema input_schema{};
};

struct ResourceDescriptor {
  std::string uri;
  std::string name;
  std::string description{};
  std::string mime_type{"text/plain"};
};

// Receives arguments with defaults already applied. May throw anything.
using ToolHandler = std::function<std::vector<ContentItem>(const nlohmann::json&)>;
// May throw NotFoundError for a uri it no longer serves.
using ResourceHandler = std::function<std::string(const std::string&)>;

struct Tool {
  ToolDescriptor descriptor;
  ToolHandler handler;

  [[nodiscard]] nlohmann::json to_json() const;
};

struct Resource {
  ResourceDescriptor descriptor;
  ResourceHandler handler;

  [[nodiscard]] nlohmann::json to_json() const;
};

// Filled once before the server starts; read-only afterwards.
class Registry {
 public:
  // Both throw DuplicateKeyError on a repeated key and std::invalid_argument on an empty key or handler.
  void register_tool(ToolDescriptor descriptor, ToolHandler handler);
  void register_resource(ResourceDescriptor descriptor, ResourceHandler handler);

  [[nodiscard]] const std::vector<Tool>& list_tools() const noexcept { return tools_; }
  [[nodiscard]] const std::vector<Resource>& list_resources() const noexcept { return resources_; }

  [[nodiscard]] const Tool* find_tool(const std::string& name) const;
  [[nodiscard]] const Resource* find_resource(const std::string& uri) const;

 private:
  std::vector<Tool> tools_;
  std::vector<Resource> resources_;
  std::unordered_map<std::string, std::size_t> tool_index_;
  std::unordered_map<std::string, std::size_t> resource_index_;
};

}  // namespace toolwire::mcp
