#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire::mcp {

enum class ValueType : std::uint8_t {
  ANY = 0,
  STRING = 1,
  INTEGER = 2,
  NUMBER = 3,
  BOOLEAN = 4,
  ARRAY = 5,
  OBJECT = 6,
};

const char* to_string(ValueType type) noexcept;
ValueType parse_value_type(std::string_view name);

[[nodiscard]] bool matches_type(const nlohmann::json& value, ValueType type) noexcept;

struct PropertySchema {
  std::string name;
  ValueType type{ValueType::ANY};
  std::string description{};
  bool required{false};
  std::optional<nlohmann::json> default_value{};
  std::vector<nlohmann::json> enum_values{};
  std::optional<double> minimum{};
  std::optional<double> maximum{};
  std::optional<std::size_t> min_length{};
  std::optional<std::size_t> max_length{};
  std::optional<ValueType> items{};
};

// Input contract of a tool: an object with named, typed properties.
class InputSchema {
 public:
  InputSchema() = default;

  // Throws std::invalid_argument on duplicate names or a default that violates its own property.
  explicit InputSchema(std::vector<PropertySchema> properties);

  // Builds from a JSON Schema object literal ({"type": "object", "properties": ..., "required": ...}).
  static InputSchema from_json(const nlohmann::json& schema);

  [[nodiscard]] nlohmann::json to_json() const;

  [[nodiscard]] const std::vector<PropertySchema>& properties() const noexcept { return properties_; }
  [[nodiscard]] const PropertySchema* find(std::string_view name) const noexcept;

  // Throws InvalidArgumentsError naming the first offending property. Undeclared properties pass.
  void validate(const nlohmann::json& arguments) const;

  [[nodiscard]] nlohmann::json apply_defaults(nlohmann::json arguments) const;

 private:
  std::vector<PropertySchema> properties_;
};

}  // namespace toolwire::mcp
