#include "llmws/common/toml.hpp"

#include "llmws/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace llmws::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

/// `a."b.c" . d` -> `a.b.c.d`; empty string when malformed.
std::string normalize_section_path(const std::string &raw) {
  std::string out;
  std::string segment;
  bool in_quotes = false;
  bool quoted_segment = false;
  auto flush = [&]() {
    const std::string value = quoted_segment ? segment : trim(segment);
    if (value.empty()) {
      return false;
    }
    if (!out.empty()) {
      out.push_back('.');
    }
    out += value;
    segment.clear();
    quoted_segment = false;
    return true;
  };

  for (const char ch : raw) {
    if (ch == '"') {
      in_quotes = !in_quotes;
      quoted_segment = true;
      continue;
    }
    if (ch == '.' && !in_quotes) {
      if (!flush()) {
        return "";
      }
      continue;
    }
    if (!in_quotes && quoted_segment) {
      if (ch == ' ') {
        continue;
      }
      return "";
    }
    if (!in_quotes && ch == ' ' && segment.empty()) {
      continue;
    }
    segment.push_back(ch);
  }
  if (in_quotes || !flush()) {
    return "";
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::size_t TomlDocument::table_array_size(const std::string &key) const {
  const auto it = table_arrays.find(key);
  return it == table_arrays.end() ? 0 : it->second;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.size() >= 4 && clean_line.starts_with("[[") &&
        clean_line.ends_with("]]")) {
      const std::string name = normalize_section_path(clean_line.substr(2, clean_line.size() - 4));
      if (name.empty()) {
        return Result<TomlDocument>::failure("Invalid table array at line " +
                                             std::to_string(line_number));
      }
      const std::size_t index = document.table_arrays[name]++;
      current_section = name + "." + std::to_string(index);
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = normalize_section_path(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid section at line " +
                                             std::to_string(line_number));
      }
      if (std::find(document.sections.begin(), document.sections.end(), current_section) ==
          document.sections.end()) {
        document.sections.push_back(current_section);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace llmws::common
