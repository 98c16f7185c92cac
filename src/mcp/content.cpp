#include "mcp/content.hpp"

#include <utility>

namespace toolwire::mcp {

ContentItem ContentItem::make_text(std::string text) {
  return ContentItem{.type = ContentType::TEXT, .text = std::move(text)};
}

ContentItem ContentItem::make_json(const nlohmann::json& value) {
  return make_text(value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

ContentItem ContentItem::make_image(std::string base64_data, std::string mime_type) {
  return ContentItem{
      .type = ContentType::IMAGE, .text = {}, .data = std::move(base64_data), .mime_type = std::move(mime_type)};
}

ContentItem ContentItem::make_resource(std::string uri, std::string mime_type, std::string text) {
  return ContentItem{.type = ContentType::RESOURCE,
                     .text = std::move(text),
                     .data = {},
                     .mime_type = std::move(mime_type),
                     .uri = std::move(uri)};
}

nlohmann::json ContentItem::to_json() const {
  switch (type) {
    case ContentType::IMAGE:
      return nlohmann::json{{"type", "image"}, {"data", data}, {"mimeType", mime_type}};
    case ContentType::RESOURCE: {
      nlohmann::json resource{{"uri", uri}, {"text", text}};
      if (!mime_type.empty()) {
        resource["mimeType"] = mime_type;
      }
      return nlohmann::json{{"type", "resource"}, {"resource", std::move(resource)}};
    }
    case ContentType::TEXT:
      break;
  }
  return nlohmann::json{{"type", "text"}, {"text", text}};
}

}  // namespace toolwire::mcp
