#include "llmws/client/request_builder.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <algorithm>
#include <string_view>

namespace llmws::client {

namespace {

constexpr const char *kEllipsis = "\xE2\x80\xA6";
constexpr const char *kDefaultBasePrompt =
    "You are a helpful assistant answering through a local inference server.";

} // namespace

std::string normalize_transcript_text(const std::string &text) {
  const std::string trimmed = common::trim(common::replace_all(text, "\r", ""));
  std::string out;
  out.reserve(trimmed.size());
  std::size_t newline_run = 0;
  for (const char ch : trimmed) {
    if (ch == '\n') {
      ++newline_run;
      if (newline_run > 2) {
        continue;
      }
    } else {
      newline_run = 0;
    }
    out.push_back(ch);
  }
  return out;
}

std::optional<std::string> render_history(const std::vector<sessions::TranscriptMessage> &messages,
                                          const std::size_t turns, const std::size_t chars,
                                          const std::string &silent_token) {
  if (turns == 0 || chars == 0) {
    return std::nullopt;
  }

  std::vector<std::string> blocks;
  for (const auto &message : messages) {
    const bool user = message.role == "user";
    if (!user && message.role != "assistant") {
      continue;
    }
    const std::string text = normalize_transcript_text(message.text);
    if (text.empty()) {
      continue;
    }
    if (!user && !silent_token.empty() && common::is_silent_reply(text, silent_token)) {
      continue;
    }
    blocks.push_back((user ? "User: " : "Assistant: ") + text);
  }

  std::vector<std::string> selected;
  std::size_t used = 0;
  for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
    if (selected.size() >= turns) {
      break;
    }
    const std::size_t length = common::utf8_length(*it);
    if (used > 0 && used + length + 2 > chars) {
      break;
    }
    if (used == 0 && length > chars) {
      selected.push_back(common::utf8_prefix(*it, chars - 1) + kEllipsis);
      break;
    }
    selected.push_back(*it);
    used += length + 2;
  }

  if (selected.empty()) {
    return std::nullopt;
  }
  std::reverse(selected.begin(), selected.end());
  return "Conversation history:\n" + common::join(selected, "\n\n");
}

std::optional<std::string> read_history_context(const std::filesystem::path &session_file,
                                                const std::size_t turns, const std::size_t chars,
                                                const std::string &silent_token) {
  if (turns == 0 || chars == 0 || session_file.empty()) {
    return std::nullopt;
  }
  auto messages = sessions::read_transcript_messages(session_file);
  if (!messages.ok()) {
    observability::log_debug("llmws", "history unavailable: " + messages.error());
    return std::nullopt;
  }
  return render_history(messages.value(), turns, chars, silent_token);
}

MemoryInjectionLimits memory_injection_limits(const config::EnvironmentProvider &env) {
  MemoryInjectionLimits limits;
  limits.max_results = config::env_positive_int(
      env, {"LLMWS_MEMORY_INJECTION_MAX_RESULTS", "MEMORY_INJECTION_MAX_RESULTS"},
      kDefaultMemoryInjectionMaxResults);
  limits.max_chars = config::env_positive_int(
      env, {"LLMWS_MEMORY_INJECTION_MAX_CHARS", "MEMORY_INJECTION_MAX_CHARS"},
      kDefaultMemoryInjectionMaxChars);
  return limits;
}

std::optional<std::string> format_memory_injection(const std::vector<memory::MemorySnippet> &snippets,
                                                   const std::size_t budget,
                                                   const std::string &header) {
  if (budget == 0) {
    return std::nullopt;
  }
  std::string header_text = common::trim(header);
  if (header_text.empty()) {
    header_text = kMemoryInjectionHeader;
  }

  std::vector<std::string> lines{header_text};
  std::size_t used = common::utf8_length(header_text) + 1;
  for (const auto &entry : snippets) {
    if (used >= budget) {
      break;
    }
    const std::string snippet = common::trim(entry.snippet);
    if (snippet.empty()) {
      continue;
    }
    if (budget <= used + 2) {
      break;
    }
    const std::size_t available = budget - used - 2;
    const std::string clipped = common::clip_with_ellipsis(snippet, available);
    lines.push_back("- " + clipped);
    used += 2 + common::utf8_length(clipped) + 1;
  }

  if (lines.size() <= 1) {
    return std::nullopt;
  }
  return common::join(lines, "\n");
}

std::optional<std::string> resolve_memory_injection(memory::MemorySearch *search,
                                                    const std::string &query,
                                                    const MemoryInjectionLimits &limits) {
  if (search == nullptr) {
    return std::nullopt;
  }
  const std::string cleaned = common::trim(query);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  memory::SearchOptions options;
  options.max_results = limits.max_results;
  auto results = search->search(cleaned, options);
  if (!results.ok()) {
    observability::log_debug("llmws", "memory injection skipped: " + results.error());
    return std::nullopt;
  }
  if (results.value().empty()) {
    return std::nullopt;
  }
  return format_memory_injection(results.value(), limits.max_chars);
}

std::string build_user_prompt(const std::optional<std::string> &history,
                              const std::optional<std::string> &memory,
                              const std::string &prompt) {
  std::vector<std::string> parts;
  if (history.has_value() && !history->empty()) {
    parts.push_back(*history);
  }
  if (memory.has_value() && !memory->empty()) {
    parts.push_back(*memory);
  }
  if (parts.empty()) {
    return prompt;
  }
  parts.push_back("Current user request:\n" + prompt);
  return common::join(parts, "\n\n");
}

std::string normalize_image_base64(const std::string &raw) {
  const std::string trimmed = common::trim(raw);
  static constexpr std::string_view kMarker = ";base64,";
  const auto marker = trimmed.find(kMarker);
  if (marker == std::string::npos) {
    return trimmed;
  }
  return trimmed.substr(marker + kMarker.size());
}

std::string image_extension(const std::string &mime_type) {
  const std::string normalized = common::to_lower(common::trim(mime_type));
  if (normalized == "image/jpeg" || normalized == "image/jpg") {
    return ".jpg";
  }
  if (normalized == "image/webp") {
    return ".webp";
  }
  if (normalized == "image/gif") {
    return ".gif";
  }
  return ".png";
}

std::vector<MediaItem> build_media_payload(const std::vector<ImageInput> &images) {
  std::vector<MediaItem> out;
  for (std::size_t i = 0; i < images.size(); ++i) {
    std::string data = normalize_image_base64(images[i].data);
    if (data.empty()) {
      continue;
    }
    out.push_back(MediaItem{.type = "image",
                            .data = std::move(data),
                            .name = "image-" + std::to_string(i + 1) +
                                    image_extension(images[i].mime_type)});
  }
  return out;
}

std::vector<ContextFile> load_context_files(const std::filesystem::path &workspace,
                                            const std::vector<std::string> &names) {
  std::vector<ContextFile> files;
  for (const auto &name : names) {
    const auto path = workspace / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      continue;
    }
    auto content = common::read_file(path);
    if (!content.ok()) {
      observability::log_warn("llmws", "skipping context file " + name + ": " + content.error());
      continue;
    }
    files.push_back(ContextFile{.path = name, .content = std::move(content.value())});
  }
  return files;
}

std::vector<ContextFile> clamp_context_files(const std::vector<ContextFile> &files,
                                             const std::size_t max_total_chars,
                                             const std::size_t max_file_chars) {
  std::vector<ContextFile> out;
  if (max_total_chars == 0 || max_file_chars == 0) {
    return out;
  }
  std::size_t used = 0;
  for (const auto &file : files) {
    if (used >= max_total_chars) {
      break;
    }
    const std::string path = common::trim(file.path);
    const std::string content = common::trim(file.content);
    if (path.empty() || content.empty()) {
      continue;
    }
    const std::size_t available = std::min(max_file_chars, max_total_chars - used);
    std::string clipped = common::clip_with_ellipsis(content, available);
    if (clipped.empty()) {
      continue;
    }
    used += common::utf8_length(clipped);
    out.push_back(ContextFile{.path = path, .content = std::move(clipped)});
  }
  return out;
}

ContextFileLimits context_file_limits(const config::EnvironmentProvider &env) {
  ContextFileLimits limits;
  limits.max_total_chars = config::env_positive_int(env, {"LLMWS_CONTEXT_FILES_MAX_CHARS"},
                                                    kDefaultContextFilesMaxChars);
  limits.max_file_chars = config::env_positive_int(env, {"LLMWS_CONTEXT_FILE_MAX_CHARS"},
                                                   kDefaultContextFileMaxChars);
  return limits;
}

std::string build_system_prompt(const SystemPromptOptions &options) {
  std::string prompt;
  prompt.reserve(8192);

  const std::string base = common::trim(options.base_prompt);
  prompt += base.empty() ? kDefaultBasePrompt : base;
  prompt += "\n";

  for (const auto &file : options.context_files) {
    prompt += "\n## ";
    prompt += file.path;
    prompt += "\n";
    prompt += file.content;
    prompt += "\n";
  }

  std::vector<std::string> extra;
  if (const std::string trimmed = common::trim(options.extra_system_prompt); !trimmed.empty()) {
    extra.push_back(trimmed);
  }
  extra.emplace_back(kToolsDisabledNotice);
  prompt += "\n";
  prompt += common::join(extra, "\n");
  prompt += "\n";

  if (!options.model_display.empty()) {
    prompt += "\n## Runtime\n";
    prompt += "- Model: " + options.model_display + "\n";
  }
  return common::trim(prompt);
}

} // namespace llmws::client
