#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace toolwire::mcp {

enum class ContentType : std::uint8_t {
  TEXT = 0,
  IMAGE = 1,
  RESOURCE = 2,
};

// One item of tool output.
struct ContentItem {
  ContentType type{ContentType::TEXT};
  std::string text{};
  std::string data{};
  std::string mime_type{};
  std::string uri{};

  static ContentItem make_text(std::string text);
  // Structured values are carried as their compact JSON text.
  static ContentItem make_json(const nlohmann::json& value);
  static ContentItem make_image(std::string base64_data, std::string mime_type);
  static ContentItem make_resource(std::string uri, std::string mime_type, std::string text);

  [[nodiscard]] nlohmann::json to_json() const;
};

}  // namespace toolwire::mcp
