#include "llmws/sessions/transcript.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/text.hpp"
#include "llmws/sessions/write_lock.hpp"

#include <fstream>
#include <sstream>

namespace llmws::sessions {

namespace {

struct TranscriptState {
  std::vector<std::string> lines;
  bool has_header = false;
  std::optional<std::string> last_message_id;
};

std::vector<std::string> non_empty_lines(const std::string &content) {
  std::vector<std::string> lines;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    line = common::trim(line);
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

TranscriptState scan_transcript(const std::string &content) {
  TranscriptState state;
  state.lines = non_empty_lines(content);
  for (const auto &line : state.lines) {
    auto parsed = common::json_parse_object(line);
    if (!parsed.ok()) {
      continue;
    }
    const auto type = common::json_string_field(parsed.value(), "type");
    if (type == "session") {
      state.has_header = true;
    } else if (type == "message") {
      const auto id = common::json_string_field(parsed.value(), "id");
      if (id.has_value() && !common::trim(*id).empty()) {
        state.last_message_id = common::trim(*id);
      }
    }
  }
  return state;
}

std::string text_message_line(const std::string &id, const std::optional<std::string> &parent_id,
                              const std::string &role, const std::string &text) {
  std::ostringstream out;
  out << "{\"type\":\"message\",\"id\":" << common::json_quote(id) << ",\"parentId\":"
      << (parent_id.has_value() ? common::json_quote(*parent_id) : "null")
      << ",\"timestamp\":" << common::json_quote(common::now_iso8601())
      << ",\"message\":{\"role\":" << common::json_quote(role)
      << ",\"content\":[{\"type\":\"text\",\"text\":" << common::json_quote(text) << "}]}}";
  return out.str();
}

std::string session_header_line(const std::string &session_id,
                                const std::filesystem::path &workspace_dir) {
  std::error_code ec;
  auto cwd = std::filesystem::absolute(workspace_dir, ec);
  if (ec) {
    cwd = workspace_dir;
  }
  std::ostringstream out;
  out << "{\"type\":\"session\",\"version\":" << kTranscriptVersion
      << ",\"id\":" << common::json_quote(session_id)
      << ",\"timestamp\":" << common::json_quote(common::now_iso8601())
      << ",\"cwd\":" << common::json_quote(cwd.lexically_normal().string()) << "}";
  return out.str();
}

std::optional<std::string> block_text(const common::JsonObject &block) {
  for (const char *key : {"text", "content", "thinking"}) {
    if (auto value = common::json_string_field(block, key); value.has_value()) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

std::string extract_content_text(const common::JsonValue &content) {
  if (content.is_string()) {
    return content.text;
  }
  if (content.is_array()) {
    auto blocks = common::json_parse_array(content.text);
    if (!blocks.ok()) {
      return "";
    }
    std::vector<std::string> parts;
    for (const auto &block : blocks.value()) {
      if (!block.is_object()) {
        continue;
      }
      auto object = common::json_parse_object(block.text);
      if (!object.ok()) {
        continue;
      }
      if (auto text = block_text(object.value()); text.has_value()) {
        parts.push_back(std::move(*text));
      }
    }
    return common::join(parts, "\n");
  }
  if (content.is_object()) {
    auto object = common::json_parse_object(content.text);
    if (!object.ok()) {
      return "";
    }
    for (const char *key : {"text", "content"}) {
      if (auto value = common::json_string_field(object.value(), key); value.has_value()) {
        return *value;
      }
    }
  }
  return "";
}

common::Result<std::vector<TranscriptMessage>>
read_transcript_messages(const std::filesystem::path &session_file) {
  using Out = common::Result<std::vector<TranscriptMessage>>;
  std::vector<TranscriptMessage> messages;
  std::error_code ec;
  if (!std::filesystem::exists(session_file, ec)) {
    return Out::success(std::move(messages));
  }
  auto content = common::read_file(session_file);
  if (!content.ok()) {
    return Out::failure(content.error());
  }

  for (const auto &line : non_empty_lines(content.value())) {
    auto entry = common::json_parse_object(line);
    if (!entry.ok() || common::json_string_field(entry.value(), "type") != "message") {
      continue;
    }
    const auto message = common::json_object_field(entry.value(), "message");
    if (!message.has_value()) {
      continue;
    }
    TranscriptMessage out;
    out.id = common::json_string_field(entry.value(), "id").value_or("");
    out.parent_id = common::json_string_field(entry.value(), "parentId");
    out.timestamp = common::json_string_field(entry.value(), "timestamp").value_or("");
    out.role = common::to_lower(common::trim(common::json_string_field(*message, "role").value_or("")));
    if (const auto it = message->find("content"); it != message->end()) {
      out.text = extract_content_text(it->second);
    }
    messages.push_back(std::move(out));
  }
  return Out::success(std::move(messages));
}

common::Status append_turn(const TurnRecord &turn) { return append_turn(turn, kDefaultLockTimeout); }

common::Status append_turn(const TurnRecord &turn, const std::chrono::milliseconds lock_timeout) {
  if (turn.session_file.empty()) {
    return common::Status::error("session file is required");
  }
  if (turn.user_text.empty() || turn.assistant_text.empty()) {
    return common::Status::error("transcript turns need both user and assistant text");
  }

  auto lock = SessionWriteLock::acquire(turn.session_file, lock_timeout);
  if (!lock.ok()) {
    return common::Status::error(lock.error());
  }

  std::string existing;
  std::error_code ec;
  if (std::filesystem::exists(turn.session_file, ec)) {
    auto content = common::read_file(turn.session_file);
    if (!content.ok()) {
      return common::Status::error(content.error());
    }
    existing = std::move(content.value());
  }
  const TranscriptState state = scan_transcript(existing);

  std::vector<std::string> additions;
  if (!state.has_header) {
    additions.push_back(session_header_line(turn.session_id, turn.workspace_dir));
  }
  const std::string user_id = common::generate_uuid();
  additions.push_back(text_message_line(user_id, state.last_message_id, "user", turn.user_text));
  additions.push_back(
      text_message_line(common::generate_uuid(), user_id, "assistant", turn.assistant_text));

  const std::string prefix = !state.lines.empty() && !existing.ends_with('\n') ? "\n" : "";
  std::ofstream out(turn.session_file, std::ios::app | std::ios::binary);
  if (!out) {
    return common::Status::error("failed to open transcript: " + turn.session_file.string());
  }
  out << prefix << common::join(additions, "\n") << "\n";
  out.flush();
  if (!out) {
    return common::Status::error("failed to write transcript: " + turn.session_file.string());
  }
  return common::Status::success();
}

} // namespace llmws::sessions
