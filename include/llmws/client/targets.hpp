#pragma once

#include "llmws/config/environment.hpp"
#include "llmws/config/schema.hpp"

#include <string>
#include <vector>

namespace llmws::client {

constexpr const char *kDefaultEndpoint = "ws://127.0.0.1:8765";

/// One candidate server endpoint.
struct Target {
  std::string url;
  /// Normalised capability tags (lower-case, whitespace runs replaced by '-').
  std::vector<std::string> capabilities;
};

/// Repairs common endpoint typos: backslashes become slashes, `ws:/host` gains
/// its second slash and a bare `host:port` gets `ws://`. Blank input yields "".
[[nodiscard]] std::string normalize_ws_url(const std::string &value);

[[nodiscard]] std::string normalize_capability_tag(const std::string &value);

/// Normalises and dedupes tags, dropping empty ones. First occurrence wins.
[[nodiscard]] std::vector<std::string> dedupe_capability_tags(const std::vector<std::string> &tags);

/// Normalises every url and drops blanks and repeats. First occurrence wins.
[[nodiscard]] std::vector<Target> dedupe_targets(const std::vector<Target> &targets);

/// Stable reorder: targets carrying every preferred tag first, then by number
/// of matching tags. No-op for an empty preference list or a single target.
[[nodiscard]] std::vector<Target> sort_targets_by_capabilities(std::vector<Target> targets,
                                                               const std::vector<std::string> &preferred);

/// `server_capabilities`, `preferred_server_capabilities` and
/// `preferred_capabilities` of a model block, merged and deduped.
[[nodiscard]] std::vector<std::string> preferred_capabilities(const config::ParamBlock &model);

/// Ordered, deduplicated endpoint list for one call. Never empty.
[[nodiscard]] std::vector<Target> resolve_targets(const config::ParamBlock &model,
                                                  const config::ParamBlock &defaults,
                                                  const config::EnvironmentProvider &env);

} // namespace llmws::client
