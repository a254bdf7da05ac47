#pragma once

#include "llmws/client/settings.hpp"
#include "llmws/transport/message_queue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace llmws::client {

/// One entry of the request's `media` array.
struct MediaItem {
  std::string type = "image";
  /// Raw base64 payload.
  std::string data;
  std::string name;
};

/// `{}` or `{"session_id":"<id>"}`; the id is trimmed and omitted when blank.
[[nodiscard]] std::string encode_hello(const std::string &resume_session_id);

[[nodiscard]] std::string encode_inference(const std::string &system_prompt,
                                           const std::string &user_prompt,
                                           const std::vector<MediaItem> &media,
                                           const GenerationConfig &generation);

[[nodiscard]] std::string encode_get_resources();

[[nodiscard]] std::string media_to_json(const std::vector<MediaItem> &media);

/// Trimmed string member; nullopt when missing, not a string or blank.
[[nodiscard]] std::optional<std::string> read_string(const transport::ParsedMessage &message,
                                                     const std::string &key);
[[nodiscard]] std::optional<double> read_number(const transport::ParsedMessage &message,
                                                const std::string &key);
[[nodiscard]] std::string message_type(const transport::ParsedMessage &message);

} // namespace llmws::client
