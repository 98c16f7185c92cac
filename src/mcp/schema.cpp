#include "mcp/schema.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

namespace {

std::string format_number(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

std::size_t utf8_length(const std::string& value) {
  return static_cast<std::size_t>(std::count_if(value.begin(), value.end(), [](const char c) {
    return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
  }));
}

std::optional<std::string> find_violation(const PropertySchema& property, const nlohmann::json& value) {
  const std::string prefix = "argument '" + property.name + "' ";

  if (!matches_type(value, property.type)) {
    return prefix + "must be of type " + to_string(property.type);
  }

  if (!property.enum_values.empty() &&
      std::find(property.enum_values.begin(), property.enum_values.end(), value) == property.enum_values.end()) {
    return prefix + "must be one of " + nlohmann::json(property.enum_values).dump();
  }

  if (value.is_number()) {
    const auto number = value.get<double>();
    if (property.minimum.has_value() && number < *property.minimum) {
      return prefix + "must be >= " + format_number(*property.minimum);
    }
    if (property.maximum.has_value() && number > *property.maximum) {
      return prefix + "must be <= " + format_number(*property.maximum);
    }
  }

  if (value.is_string()) {
    const auto length = utf8_length(value.get_ref<const std::string&>());
    if (property.min_length.has_value() && length < *property.min_length) {
      return prefix + "must be at least " + std::to_string(*property.min_length) + " characters";
    }
    if (property.max_length.has_value() && length > *property.max_length) {
      return prefix + "must be at most " + std::to_string(*property.max_length) + " characters";
    }
  }

  if (value.is_array() && property.items.has_value()) {
    for (const auto& item : value) {
      if (!matches_type(item, *property.items)) {
        return prefix + "items must be of type " + to_string(*property.items);
      }
    }
  }

  return std::nullopt;
}

std::optional<double> optional_number(const nlohmann::json& node, const char* key) {
  const auto it = node.find(key);
  if (it == node.end()) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a number");
  }
  return it->get<double>();
}

std::optional<std::size_t> optional_length(const nlohmann::json& node, const char* key) {
  const auto it = node.find(key);
  if (it == node.end()) {
    return std::nullopt;
  }
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
    throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
  }
  return it->get<std::size_t>();
}

ValueType schema_type(const nlohmann::json& node) {
  const auto it = node.find("type");
  if (it == node.end()) {
    return ValueType::ANY;
  }
  if (!it->is_string()) {
    throw std::invalid_argument("type must be a string");
  }
  return parse_value_type(it->get_ref<const std::string&>());
}

}  // namespace

const char* to_string(const ValueType type) noexcept {
  switch (type) {
    case ValueType::STRING:
      return "string";
    case ValueType::INTEGER:
      return "integer";
    case ValueType::NUMBER:
      return "number";
    case ValueType::BOOLEAN:
      return "boolean";
    case ValueType::ARRAY:
      return "array";
    case ValueType::OBJECT:
      return "object";
    case ValueType::ANY:
      break;
  }
  return "any";
}

ValueType parse_value_type(std::string_view name) {
  if (name == "string") {
    return ValueType::STRING;
  }
  if (name == "integer") {
    return ValueType::INTEGER;
  }
  if (name == "number") {
    return ValueType::NUMBER;
  }
  if (name == "boolean") {
    return ValueType::BOOLEAN;
  }
  if (name == "array") {
    return ValueType::ARRAY;
  }
  if (name == "object") {
    return ValueType::OBJECT;
  }
  if (name == "any") {
    return ValueType::ANY;
  }
  throw std::invalid_argument("unsupported schema type: " + std::string(name));
}

bool matches_type(const nlohmann::json& value, const ValueType type) noexcept {
  switch (type) {
    case ValueType::STRING:
      return value.is_string();
    case ValueType::INTEGER:
      if (value.is_number_integer() || value.is_number_unsigned()) {
        return true;
      }
      if (value.is_number_float()) {
        const auto number = value.get<double>();
        return std::isfinite(number) && std::trunc(number) == number;
      }
      return false;
    case ValueType::NUMBER:
      return value.is_number();
    case ValueType::BOOLEAN:
      return value.is_boolean();
    case ValueType::ARRAY:
      return value.is_array();
    case ValueType::OBJECT:
      return value.is_object();
    case ValueType::ANY:
      break;
  }
  return true;
}

InputSchema::InputSchema(std::vector<PropertySchema> properties) : properties_(std::move(properties)) {
  std::unordered_set<std::string> seen;
  for (const auto& property : properties_) {
    if (property.name.empty()) {
      throw std::invalid_argument("property name must not be empty");
    }
    if (!seen.insert(property.name).second) {
      throw std::invalid_argument("duplicate property: " + property.name);
    }
    if (property.default_value.has_value()) {
      if (const auto violation = find_violation(property, *property.default_value); violation.has_value()) {
        throw std::invalid_argument("invalid default: " + *violation);
      }
    }
  }
}

InputSchema InputSchema::from_json(const nlohmann::json& schema) {
  if (!schema.is_object()) {
    throw std::invalid_argument("input schema must be an object");
  }
  if (schema_type(schema) != ValueType::OBJECT && schema.contains("type")) {
    throw std::invalid_argument("input schema type must be \"object\"");
  }

  std::vector<PropertySchema> properties;
  const auto properties_it = schema.find("properties");
  if (properties_it != schema.end()) {
    if (!properties_it->is_object()) {
      throw std::invalid_argument("properties must be an object");
    }

    for (const auto& [name, node] : properties_it->items()) {
      if (!node.is_object()) {
        throw std::invalid_argument("property " + name + " must be an object");
      }

      PropertySchema property{.name = name, .type = schema_type(node)};
      property.description = node.value("description", std::string{});
      if (const auto it = node.find("default"); it != node.end()) {
        property.default_value = *it;
      }
      if (const auto it = node.find("enum"); it != node.end()) {
        if (!it->is_array()) {
          throw std::invalid_argument("enum of " + name + " must be an array");
        }
        property.enum_values.assign(it->begin(), it->end());
      }
      property.minimum = optional_number(node, "minimum");
      property.maximum = optional_number(node, "maximum");
      property.min_length = optional_length(node, "minLength");
      property.max_length = optional_length(node, "maxLength");
      if (const auto it = node.find("items"); it != node.end()) {
        if (!it->is_object()) {
          throw std::invalid_argument("items of " + name + " must be an object");
        }
        property.items = schema_type(*it);
      }
      properties.push_back(std::move(property));
    }
  }

  const auto required_it = schema.find("required");
  if (required_it != schema.end()) {
    if (!required_it->is_array()) {
      throw std::invalid_argument("required must be an array of strings");
    }
    for (const auto& entry : *required_it) {
      if (!entry.is_string()) {
        throw std::invalid_argument("required must be an array of strings");
      }
      const auto& name = entry.get_ref<const std::string&>();
      auto it = std::find_if(properties.begin(), properties.end(),
                             [&name](const PropertySchema& property) { return property.name == name; });
      if (it == properties.end()) {
        properties.push_back(PropertySchema{.name = name, .type = ValueType::ANY, .required = true});
      } else {
        it->required = true;
      }
    }
  }

  return InputSchema(std::move(properties));
}

nlohmann::json InputSchema::to_json() const {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();

  for (const auto& property : properties_) {
    nlohmann::json node = nlohmann::json::object();
    if (property.type != ValueType::ANY) {
      node["type"] = to_string(property.type);
    }
    if (!property.description.empty()) {
      node["description"] = property.description;
    }
    if (property.default_value.has_value()) {
      node["default"] = *property.default_value;
    }
    if (!property.enum_values.empty()) {
      node["enum"] = property.enum_values;
    }
    if (property.minimum.has_value()) {
      node["minimum"] = *property.minimum;
    }
    if (property.maximum.has_value()) {
      node["maximum"] = *property.maximum;
    }
    if (property.min_length.has_value()) {
      node["minLength"] = *property.min_length;
    }
    if (property.max_length.has_value()) {
      node["maxLength"] = *property.max_length;
    }
    if (property.items.has_value()) {
      node["items"] = *property.items == ValueType::ANY ? nlohmann::json::object()
                                                        : nlohmann::json{{"type", to_string(*property.items)}};
    }

    properties[property.name] = std::move(node);
    if (property.required) {
      required.push_back(property.name);
    }
  }

  nlohmann::json schema{{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty()) {
    schema["required"] = std::move(required);
  }
  return schema;
}

const PropertySchema* InputSchema::find(std::string_view name) const noexcept {
  const auto it = std::find_if(properties_.begin(), properties_.end(),
                               [name](const PropertySchema& property) { return property.name == name; });
  return it == properties_.end() ? nullptr : &*it;
}

void InputSchema::validate(const nlohmann::json& arguments) const {
  if (!arguments.is_object()) {
    throw InvalidArgumentsError("arguments", "arguments must be an object");
  }

  for (const auto& property : properties_) {
    const auto it = arguments.find(property.name);
    if (it == arguments.end()) {
      if (property.required) {
        throw InvalidArgumentsError(property.name, "missing required argument: " + property.name);
      }
      continue;
    }

    if (const auto violation = find_violation(property, *it); violation.has_value()) {
      throw InvalidArgumentsError(property.name, *violation);
    }
  }
}

nlohmann::json InputSchema::apply_defaults(nlohmann::json arguments) const {
  for (const auto& property : properties_) {
    if (property.default_value.has_value() && !arguments.contains(property.name)) {
      arguments[property.name] = *property.default_value;
    }
  }
  return arguments;
}

}  // namespace toolwire::mcp
