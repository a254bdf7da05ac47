#include "llmws/client/protocol.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"

#include <cmath>
#include <sstream>

namespace llmws::client {

std::string encode_hello(const std::string &resume_session_id) {
  const std::string id = common::trim(resume_session_id);
  if (id.empty()) {
    return "{}";
  }
  return "{\"session_id\":" + common::json_quote(id) + "}";
}

std::string media_to_json(const std::vector<MediaItem> &media) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < media.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"type\":" << common::json_quote(media[i].type)
        << ",\"data\":" << common::json_quote(media[i].data)
        << ",\"name\":" << common::json_quote(media[i].name) << "}";
  }
  out << "]";
  return out.str();
}

std::string encode_inference(const std::string &system_prompt, const std::string &user_prompt,
                             const std::vector<MediaItem> &media,
                             const GenerationConfig &generation) {
  std::ostringstream out;
  out << "{\"type\":\"inference\",\"prompt\":{\"system\":" << common::json_quote(system_prompt)
      << ",\"user\":" << common::json_quote(user_prompt) << "},\"media\":" << media_to_json(media)
      << ",\"config\":" << generation_to_json(generation) << "}";
  return out.str();
}

std::string encode_get_resources() { return "{\"type\":\"get_resources\"}"; }

std::optional<std::string> read_string(const transport::ParsedMessage &message,
                                       const std::string &key) {
  const auto value = common::json_string_field(message, key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = common::trim(*value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::optional<double> read_number(const transport::ParsedMessage &message, const std::string &key) {
  const auto value = common::json_number_field(message, key);
  if (!value.has_value() || !std::isfinite(*value)) {
    return std::nullopt;
  }
  return value;
}

std::string message_type(const transport::ParsedMessage &message) {
  return read_string(message, "type").value_or("");
}

} // namespace llmws::client
