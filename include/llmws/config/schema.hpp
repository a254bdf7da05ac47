#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmws::config {

struct ServerEntry {
  std::string url;
  std::vector<std::string> capabilities;
};

/// Sampling knobs as written in one config block. Unset fields fall through to
/// the next layer during resolution.
struct GenerationParams {
  std::optional<double> max_new_tokens;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<double> top_k;
  std::optional<double> repetition_penalty;
  std::optional<bool> do_sample;
};

/// Parameters of `[llmws]` (deployment defaults) or `[models."provider/model"]`.
struct ParamBlock {
  std::vector<ServerEntry> servers;
  std::optional<std::string> server;
  std::vector<std::string> server_capabilities;
  std::vector<std::string> preferred_server_capabilities;
  std::vector<std::string> preferred_capabilities;
  std::optional<double> connect_timeout_ms;
  std::optional<double> read_timeout_ms;
  std::optional<bool> include_history;
  std::optional<double> history_turns;
  std::optional<double> history_chars;
  GenerationParams generation;
  /// Nested `config` table; wins over `generation` of the same block.
  GenerationParams config;
};

struct LlmwsConfig {
  ParamBlock defaults;
  /// Keyed by "provider/model".
  std::map<std::string, ParamBlock> models;
};

struct MemoryHttpConfig {
  std::string base_url = "http://127.0.0.1:8000";
  std::string api_key;
  std::map<std::string, std::string> headers;
  std::uint64_t timeout_ms = 8000;
  std::string mode = "hybrid";
  std::uint32_t max_results = 6;
  std::string path_prefix = "zigmem";
};

struct MemoryConfig {
  /// "builtin" disables prompt injection; "http" queries the search service.
  std::string backend = "builtin";
  MemoryHttpConfig http;
};

struct ObservabilityConfig {
  std::string log_level = "info";
};

struct Config {
  std::string default_provider = "llmws";
  std::string default_model = "default";
  std::string workspace;
  std::string sessions_dir;
  std::string system_prompt;
  std::string silent_reply_token = "NO_REPLY";
  std::vector<std::string> context_files = {"SOUL.md", "IDENTITY.md", "AGENTS.md", "USER.md"};
  std::uint64_t timeout_ms = 120'000;
  LlmwsConfig llmws;
  MemoryConfig memory;
  ObservabilityConfig observability;
};

} // namespace llmws::config
