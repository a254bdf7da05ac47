#pragma once

#include "llmws/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmws::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (\uXXXX sequences become UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

enum class JsonKind { String, Number, Bool, Null, Object, Array };

/// One parsed JSON value. Strings hold their unescaped text; every other kind
/// holds the raw JSON source of the value.
struct JsonValue {
  JsonKind kind = JsonKind::Null;
  std::string text;

  [[nodiscard]] bool is_string() const { return kind == JsonKind::String; }
  [[nodiscard]] bool is_object() const { return kind == JsonKind::Object; }
  [[nodiscard]] bool is_array() const { return kind == JsonKind::Array; }
  [[nodiscard]] bool is_null() const { return kind == JsonKind::Null; }
};

/// Top-level members of a JSON object.
using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Validate and split a complete JSON object. Trailing garbage is an error.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

/// Validate and split a complete JSON array.
[[nodiscard]] Result<std::vector<JsonValue>> json_parse_array(const std::string &json);

[[nodiscard]] std::optional<std::string> json_string_field(const JsonObject &object,
                                                           const std::string &key);
[[nodiscard]] std::optional<double> json_number_field(const JsonObject &object,
                                                      const std::string &key);
[[nodiscard]] std::optional<bool> json_bool_field(const JsonObject &object,
                                                  const std::string &key);
/// Nested object member, or nullopt when absent or not an object.
[[nodiscard]] std::optional<JsonObject> json_object_field(const JsonObject &object,
                                                          const std::string &key);
/// Nested array member, or nullopt when absent or not an array.
[[nodiscard]] std::optional<std::vector<JsonValue>> json_array_field(const JsonObject &object,
                                                                     const std::string &key);

/// Shortest round-trip rendering; integral values print without a fraction.
[[nodiscard]] std::string json_number(double value);

/// `"value"` with escaping applied.
[[nodiscard]] std::string json_quote(const std::string &value);

} // namespace llmws::common
