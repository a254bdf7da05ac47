#pragma once

#include "llmws/client/protocol.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/memory/memory.hpp"
#include "llmws/sessions/transcript.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace llmws::client {

constexpr const char *kMemoryInjectionHeader =
    "Relevant memory snippets (ZigMem). Use only if helpful; ignore if irrelevant:";
constexpr std::size_t kDefaultMemoryInjectionMaxResults = 4;
constexpr std::size_t kDefaultMemoryInjectionMaxChars = 1800;
constexpr std::size_t kDefaultContextFilesMaxChars = 6000;
constexpr std::size_t kDefaultContextFileMaxChars = 4000;
constexpr const char *kToolsDisabledNotice = "Tools are disabled in this session. Do not call tools.";

/// Drops carriage returns, trims, and collapses runs of three or more newlines
/// to a single blank line.
[[nodiscard]] std::string normalize_transcript_text(const std::string &text);

/// `Conversation history:` section built from the newest user/assistant
/// messages that fit both the turn and the character budget.
[[nodiscard]] std::optional<std::string>
render_history(const std::vector<sessions::TranscriptMessage> &messages, std::size_t turns,
               std::size_t chars, const std::string &silent_token);

/// render_history over a transcript file. Missing or unreadable files yield
/// no section.
[[nodiscard]] std::optional<std::string>
read_history_context(const std::filesystem::path &session_file, std::size_t turns,
                     std::size_t chars, const std::string &silent_token);

struct MemoryInjectionLimits {
  std::size_t max_results = kDefaultMemoryInjectionMaxResults;
  std::size_t max_chars = kDefaultMemoryInjectionMaxChars;
};

[[nodiscard]] MemoryInjectionLimits memory_injection_limits(const config::EnvironmentProvider &env);

[[nodiscard]] std::optional<std::string>
format_memory_injection(const std::vector<memory::MemorySnippet> &snippets, std::size_t budget,
                        const std::string &header = kMemoryInjectionHeader);

/// Searches memory for `query` and formats the hits. Failures are logged at
/// debug level and produce no section; a null `search` means injection is off.
[[nodiscard]] std::optional<std::string>
resolve_memory_injection(memory::MemorySearch *search, const std::string &query,
                         const MemoryInjectionLimits &limits);

[[nodiscard]] std::string build_user_prompt(const std::optional<std::string> &history,
                                            const std::optional<std::string> &memory,
                                            const std::string &prompt);

struct ImageInput {
  /// Base64 data, optionally as a `data:<mime>;base64,` URL.
  std::string data;
  std::string mime_type;
};

[[nodiscard]] std::string normalize_image_base64(const std::string &raw);
[[nodiscard]] std::string image_extension(const std::string &mime_type);
[[nodiscard]] std::vector<MediaItem> build_media_payload(const std::vector<ImageInput> &images);

struct ContextFile {
  std::string path;
  std::string content;
};

/// Reads the named files from the workspace, skipping missing ones.
[[nodiscard]] std::vector<ContextFile> load_context_files(const std::filesystem::path &workspace,
                                                          const std::vector<std::string> &names);

/// Trims each file and clips it to the per-file limit and to what is left of
/// the total budget. Files with no path or no content are dropped.
[[nodiscard]] std::vector<ContextFile> clamp_context_files(const std::vector<ContextFile> &files,
                                                           std::size_t max_total_chars,
                                                           std::size_t max_file_chars);

struct ContextFileLimits {
  std::size_t max_total_chars = kDefaultContextFilesMaxChars;
  std::size_t max_file_chars = kDefaultContextFileMaxChars;
};

[[nodiscard]] ContextFileLimits context_file_limits(const config::EnvironmentProvider &env);

struct SystemPromptOptions {
  std::string base_prompt;
  std::string extra_system_prompt;
  std::vector<ContextFile> context_files;
  std::string model_display;
};

[[nodiscard]] std::string build_system_prompt(const SystemPromptOptions &options);

} // namespace llmws::client
