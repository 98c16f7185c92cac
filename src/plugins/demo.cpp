#include "plugins/demo.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire::plugins {

namespace {

constexpr const char* kServerInfoUri = "toolwire://server/info";

std::vector<mcp::ContentItem> handle_echo(const nlohmann::json& arguments) {
  const auto& msg = arguments.at("msg").get_ref<const std::string&>();
  const auto repeat = arguments.at("repeat").get<std::int64_t>();

  std::string text;
  for (std::int64_t i = 0; i < repeat; ++i) {
    if (i > 0) {
      text.push_back('\n');
    }
    text += msg;
  }
  return {mcp::ContentItem::make_text(std::move(text))};
}

std::string format_iso8601(const std::chrono::system_clock::time_point now) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    throw std::runtime_error("unable to convert current time to UTC");
  }

  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
    throw std::runtime_error("unable to format current time");
  }
  return buffer;
}

std::vector<mcp::ContentItem> handle_server_time(const nlohmann::json& arguments) {
  const auto& format = arguments.at("format").get_ref<const std::string&>();
  const auto now = std::chrono::system_clock::now();

  if (format == "epoch_ms") {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return {mcp::ContentItem::make_text(std::to_string(ms))};
  }
  return {mcp::ContentItem::make_text(format_iso8601(now))};
}

}  // namespace

mcp::Registry build_demo_registry(const core::ServerConfig& config) {
  mcp::Registry registry;

  registry.register_tool(
      mcp::ToolDescriptor{.name = "echo",
                          .description = "Return the given message, optionally repeated on separate lines.",
                          .input_schema = mcp::InputSchema::from_json(nlohmann::json{
                              {"type", "object"},
                              {"properties",
                               {{"msg", {{"type", "string"}, {"description", "Message to echo back"}}},
                                {"repeat",
                                 {{"type", "integer"},
                                  {"minimum", 1},
                                  {"maximum", 10},
                                  {"default", 1},
                                  {"description", "Number of copies"}}}}},
                              {"required", nlohmann::json::array({"msg"})}})},
      handle_echo);

  registry.register_tool(
      mcp::ToolDescriptor{.name = "server_time",
                          .description = "Current server time in UTC.",
                          .input_schema = mcp::InputSchema::from_json(nlohmann::json{
                              {"type", "object"},
                              {"properties",
                               {{"format",
                                 {{"type", "string"},
                                  {"enum", nlohmann::json::array({"iso8601", "epoch_ms"})},
                                  {"default", "iso8601"},
                                  {"description", "Output format"}}}}}})},
      handle_server_time);

  const nlohmann::json info{
      {"name", config.name}, {"version", config.version}, {"tools", registry.list_tools().size()}};
  registry.register_resource(
      mcp::ResourceDescriptor{.uri = kServerInfoUri,
                              .name = "Server Info",
                              .description = "Name, version and tool count of this server",
                              .mime_type = "application/json"},
      [info](const std::string& /*uri*/) { return info.dump(2); });

  return registry;
}

}  // namespace toolwire::plugins
