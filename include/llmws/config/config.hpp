#pragma once

#include "llmws/common/result.hpp"
#include "llmws/common/toml.hpp"
#include "llmws/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace llmws::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);

/// Workspace used for context files and transcript `cwd`; falls back to the
/// current directory.
[[nodiscard]] std::filesystem::path resolve_workspace(const Config &config);
/// Directory holding `<session-id>.jsonl` transcripts.
[[nodiscard]] common::Result<std::filesystem::path> resolve_sessions_dir(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
/// Builds a config from already-parsed TOML. No environment access.
[[nodiscard]] Config config_from_toml(const common::TomlDocument &doc);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Parameter block for `provider/model`, or an empty block when none is configured.
[[nodiscard]] ParamBlock model_params(const Config &config, const std::string &provider,
                                      const std::string &model);

} // namespace llmws::config
