#include "llmws/common/text.hpp"

#include "llmws/common/fs.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace llmws::common {

namespace {

const std::array<std::string, 4> kReasoningTags = {"think", "thinking", "thought",
                                                   "antthinking"};

bool is_word_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

struct Tag {
  std::size_t begin = 0;
  std::size_t end = 0; // one past '>'
  bool closing = false;
  std::string name;
};

/// Parses `<name ...>` / `</name>` at `pos`. `lower` is the lower-cased text.
bool parse_tag(const std::string &lower, const std::size_t pos, Tag &tag) {
  std::size_t i = pos + 1;
  while (i < lower.size() && lower[i] == ' ') {
    ++i;
  }
  tag.closing = i < lower.size() && lower[i] == '/';
  if (tag.closing) {
    ++i;
    while (i < lower.size() && lower[i] == ' ') {
      ++i;
    }
  }
  const std::size_t name_start = i;
  while (i < lower.size() && lower[i] >= 'a' && lower[i] <= 'z') {
    ++i;
  }
  if (i == name_start || (i < lower.size() && is_word_char(lower[i]))) {
    return false;
  }
  const std::size_t close = lower.find_first_of("<>", i);
  if (close == std::string::npos || lower[close] != '>') {
    return false;
  }
  tag.begin = pos;
  tag.end = close + 1;
  tag.name = lower.substr(name_start, i - name_start);
  return true;
}

/// Byte ranges covered by ``` fences; tags inside them are literal text.
std::vector<std::pair<std::size_t, std::size_t>> fenced_ranges(const std::string &text) {
  std::vector<std::pair<std::size_t, std::size_t>> ranges;
  std::size_t pos = 0;
  while (true) {
    const std::size_t open = text.find("```", pos);
    if (open == std::string::npos) {
      break;
    }
    const std::size_t close = text.find("```", open + 3);
    if (close == std::string::npos) {
      ranges.emplace_back(open, text.size());
      break;
    }
    ranges.emplace_back(open, close + 3);
    pos = close + 3;
  }
  return ranges;
}

bool in_ranges(const std::vector<std::pair<std::size_t, std::size_t>> &ranges,
               const std::size_t pos) {
  for (const auto &[begin, end] : ranges) {
    if (pos >= begin && pos < end) {
      return true;
    }
  }
  return false;
}

std::string remove_final_tags(const std::string &text) {
  const std::string lower = to_lower(text);
  const auto fences = fenced_ranges(text);
  std::string out;
  out.reserve(text.size());
  std::size_t last = 0;
  for (std::size_t pos = lower.find('<'); pos != std::string::npos;
       pos = lower.find('<', pos + 1)) {
    Tag tag;
    if (!parse_tag(lower, pos, tag) || tag.name != "final" || in_ranges(fences, pos)) {
      continue;
    }
    out.append(text, last, tag.begin - last);
    last = tag.end;
    pos = tag.end - 1;
  }
  out.append(text, last, std::string::npos);
  return out;
}

} // namespace

std::vector<std::string> split_trimmed(const std::string &value, const char delimiter) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string piece;
  while (std::getline(stream, piece, delimiter)) {
    piece = trim(piece);
    if (!piece.empty()) {
      out.push_back(piece);
    }
  }
  return out;
}

std::string replace_all(std::string value, const std::string &from, const std::string &to) {
  if (from.empty()) {
    return value;
  }
  std::size_t pos = 0;
  while ((pos = value.find(from, pos)) != std::string::npos) {
    value.replace(pos, from.size(), to);
    pos += to.size();
  }
  return value;
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::vector<std::string> &parts, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

std::size_t utf8_length(const std::string &value) {
  std::size_t count = 0;
  for (const char ch : value) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

std::string utf8_prefix(const std::string &value, const std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if ((static_cast<unsigned char>(value[i]) & 0xC0U) != 0x80U) {
      if (seen == count) {
        return value.substr(0, i);
      }
      ++seen;
    }
  }
  return value;
}

std::string clip_with_ellipsis(const std::string &value, const std::size_t limit) {
  if (utf8_length(value) <= limit) {
    return value;
  }
  return utf8_prefix(value, limit > 0 ? limit - 1 : 0) + "\xE2\x80\xA6";
}

std::string strip_reasoning_tags(const std::string &text) {
  const std::string cleaned = remove_final_tags(text);
  const std::string lower = to_lower(cleaned);
  const auto fences = fenced_ranges(cleaned);

  std::string out;
  out.reserve(cleaned.size());
  std::size_t last = 0;
  bool in_reasoning = false;
  for (std::size_t pos = lower.find('<'); pos != std::string::npos;
       pos = lower.find('<', pos + 1)) {
    Tag tag;
    if (!parse_tag(lower, pos, tag) || in_ranges(fences, pos)) {
      continue;
    }
    bool reasoning = false;
    for (const auto &name : kReasoningTags) {
      reasoning = reasoning || tag.name == name;
    }
    if (!reasoning) {
      continue;
    }
    if (!tag.closing) {
      if (!in_reasoning) {
        out.append(cleaned, last, tag.begin - last);
        in_reasoning = true;
      }
    } else if (in_reasoning) {
      in_reasoning = false;
      last = tag.end;
    } else {
      // Stray closer without an opener.
      out.append(cleaned, last, tag.begin - last);
      last = tag.end;
    }
    pos = tag.end - 1;
  }
  if (!in_reasoning) {
    out.append(cleaned, last, std::string::npos);
  }
  return trim(out);
}

bool is_silent_reply(const std::string &text, const std::string &token) {
  if (text.empty() || token.empty()) {
    return false;
  }
  std::size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
    ++start;
  }
  if (text.compare(start, token.size(), token) == 0) {
    const std::size_t after = start + token.size();
    if (after >= text.size() || !is_word_char(text[after])) {
      return true;
    }
  }

  std::size_t end = text.size();
  while (end > 0 && !is_word_char(text[end - 1])) {
    --end;
  }
  if (end < token.size() || text.compare(end - token.size(), token.size(), token) != 0) {
    return false;
  }
  const std::size_t before = end - token.size();
  return before == 0 || !is_word_char(text[before - 1]);
}

std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::string generate_uuid() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::array<unsigned char, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    const auto value = rng();
    for (std::size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<unsigned char>((value >> (j * 8U)) & 0xFFULL);
    }
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream out;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << "0123456789abcdef"[bytes[i] >> 4U] << "0123456789abcdef"[bytes[i] & 0x0FU];
  }
  return out.str();
}

} // namespace llmws::common
