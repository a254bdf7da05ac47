#include "llmws/common/json_util.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace llmws::common {

namespace {

constexpr int kMaxDepth = 64;

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool read_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(text[i]);
    if (digit < 0) {
      return false;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  out = value;
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  }
}

std::size_t scan_value(const std::string &text, std::size_t pos, int depth);

std::size_t scan_string(const std::string &text, const std::size_t pos) {
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '"') {
      return i + 1;
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      return std::string::npos;
    }
    if (ch != '\\') {
      continue;
    }
    if (i + 1 >= text.size()) {
      return std::string::npos;
    }
    const char next = text[i + 1];
    if (next == 'u') {
      std::uint32_t ignored = 0;
      if (!read_hex4(text, i + 2, ignored)) {
        return std::string::npos;
      }
      i += 5;
      continue;
    }
    switch (next) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
      ++i;
      break;
    default:
      return std::string::npos;
    }
  }
  return std::string::npos;
}

bool is_digit(const std::string &text, const std::size_t pos) {
  return pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0;
}

std::size_t scan_number(const std::string &text, std::size_t pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (!is_digit(text, pos)) {
    return std::string::npos;
  }
  if (text[pos] == '0') {
    ++pos;
  } else {
    while (is_digit(text, pos)) {
      ++pos;
    }
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    if (!is_digit(text, pos)) {
      return std::string::npos;
    }
    while (is_digit(text, pos)) {
      ++pos;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    if (!is_digit(text, pos)) {
      return std::string::npos;
    }
    while (is_digit(text, pos)) {
      ++pos;
    }
  }
  return pos;
}

std::size_t scan_literal(const std::string &text, const std::size_t pos, const char *literal) {
  const std::string word(literal);
  if (text.compare(pos, word.size(), word) != 0) {
    return std::string::npos;
  }
  return pos + word.size();
}

std::size_t scan_container(const std::string &text, std::size_t pos, const int depth,
                           const bool object) {
  const char close = object ? '}' : ']';
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == close) {
    return pos + 1;
  }
  while (pos < text.size()) {
    if (object) {
      if (text[pos] != '"') {
        return std::string::npos;
      }
      pos = scan_string(text, pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text, pos);
      if (pos >= text.size() || text[pos] != ':') {
        return std::string::npos;
      }
      pos = json_skip_ws(text, pos + 1);
    }
    pos = scan_value(text, pos, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::string::npos;
    }
    if (text[pos] == close) {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return std::string::npos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return std::string::npos;
}

std::size_t scan_value(const std::string &text, const std::size_t pos, const int depth) {
  if (depth > kMaxDepth || pos >= text.size()) {
    return std::string::npos;
  }
  switch (text[pos]) {
  case '"':
    return scan_string(text, pos);
  case '{':
    return scan_container(text, pos, depth, true);
  case '[':
    return scan_container(text, pos, depth, false);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
  }
}

JsonValue make_value(const std::string &text, const std::size_t start, const std::size_t end) {
  JsonValue value;
  switch (text[start]) {
  case '"':
    value.kind = JsonKind::String;
    value.text = json_unescape(text.substr(start + 1, end - start - 2));
    return value;
  case '{':
    value.kind = JsonKind::Object;
    break;
  case '[':
    value.kind = JsonKind::Array;
    break;
  case 't':
  case 'f':
    value.kind = JsonKind::Bool;
    break;
  case 'n':
    value.kind = JsonKind::Null;
    break;
  default:
    value.kind = JsonKind::Number;
    break;
  }
  value.text = text.substr(start, end - start);
  return value;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        std::array<char, 8> buffer{};
        std::snprintf(buffer.data(), buffer.size(), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(ch)));
        escaped += buffer.data();
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!read_hex4(raw, i + 1, cp)) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        std::uint32_t low = 0;
        if (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u' &&
            read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        } else {
          cp = 0xFFFD;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  const std::size_t open = json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '{') {
    return Result<JsonObject>::failure("expected JSON object");
  }
  const std::size_t end = scan_value(json, open, 0);
  if (end == std::string::npos || json_skip_ws(json, end) != json.size()) {
    return Result<JsonObject>::failure("malformed JSON object");
  }

  // The scan above validated the document, so member walking can be lenient.
  JsonObject object;
  std::size_t pos = json_skip_ws(json, open + 1);
  while (pos < json.size() && json[pos] == '"') {
    const std::size_t key_end = scan_string(json, pos);
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 2));
    pos = json_skip_ws(json, json_skip_ws(json, key_end) + 1);
    const std::size_t value_end = scan_value(json, pos, 1);
    object[key] = make_value(json, pos, value_end);
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return Result<JsonObject>::success(std::move(object));
}

Result<std::vector<JsonValue>> json_parse_array(const std::string &json) {
  const std::size_t open = json_skip_ws(json, 0);
  if (open >= json.size() || json[open] != '[') {
    return Result<std::vector<JsonValue>>::failure("expected JSON array");
  }
  const std::size_t end = scan_value(json, open, 0);
  if (end == std::string::npos || json_skip_ws(json, end) != json.size()) {
    return Result<std::vector<JsonValue>>::failure("malformed JSON array");
  }

  std::vector<JsonValue> items;
  std::size_t pos = json_skip_ws(json, open + 1);
  while (pos < json.size() && json[pos] != ']') {
    const std::size_t value_end = scan_value(json, pos, 1);
    items.push_back(make_value(json, pos, value_end));
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return Result<std::vector<JsonValue>>::success(std::move(items));
}

std::optional<std::string> json_string_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.text;
}

std::optional<double> json_number_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.kind != JsonKind::Number) {
    return std::nullopt;
  }
  const std::string &text = it->second.text;
  double parsed = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> json_bool_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.kind != JsonKind::Bool) {
    return std::nullopt;
  }
  return it->second.text == "true";
}

std::optional<JsonObject> json_object_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_object()) {
    return std::nullopt;
  }
  auto parsed = json_parse_object(it->second.text);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return std::move(parsed.value());
}

std::optional<std::vector<JsonValue>> json_array_field(const JsonObject &object,
                                                       const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_array()) {
    return std::nullopt;
  }
  auto parsed = json_parse_array(it->second.text);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  return std::move(parsed.value());
}

std::string json_number(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (std::trunc(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer.data(), ptr);
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

} // namespace llmws::common
