#pragma once

#include "llmws/common/json_util.hpp"
#include "llmws/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace llmws::sessions {

constexpr int kTranscriptVersion = 7;

/// One `"type":"message"` line of a transcript.
struct TranscriptMessage {
  std::string id;
  std::optional<std::string> parent_id;
  std::string timestamp;
  /// Lower-cased role as written by the producer.
  std::string role;
  /// Text of the content blocks, joined by newlines.
  std::string text;
};

struct TurnRecord {
  std::filesystem::path session_file;
  std::string session_id;
  std::filesystem::path workspace_dir;
  std::string user_text;
  std::string assistant_text;
};

/// Text of a message `content` value: a plain string, an array of blocks
/// carrying `text`, `content` or `thinking`, or a single such block.
[[nodiscard]] std::string extract_content_text(const common::JsonValue &content);

/// Every well-formed message entry in file order. A missing file yields an
/// empty list; unparsable lines are skipped.
[[nodiscard]] common::Result<std::vector<TranscriptMessage>>
read_transcript_messages(const std::filesystem::path &session_file);

/// Appends a user message and its assistant reply under the session write
/// lock, writing the session header first when the file has none. The user
/// message is parented to the last message already in the file.
[[nodiscard]] common::Status append_turn(const TurnRecord &turn,
                                         std::chrono::milliseconds lock_timeout);
[[nodiscard]] common::Status append_turn(const TurnRecord &turn);

} // namespace llmws::sessions
