#include "llmws/client/targets.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/text.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_set>

namespace llmws::client {

namespace {

std::string strip_leading_slashes(const std::string &value) {
  const auto first = value.find_first_not_of('/');
  return first == std::string::npos ? std::string() : value.substr(first);
}

std::optional<Target> parse_server_entry(const config::ServerEntry &entry) {
  const std::string url = normalize_ws_url(entry.url);
  if (url.empty()) {
    return std::nullopt;
  }
  return Target{.url = url, .capabilities = dedupe_capability_tags(entry.capabilities)};
}

void append_block(std::vector<Target> &out, const config::ParamBlock &block) {
  for (const auto &entry : block.servers) {
    if (auto target = parse_server_entry(entry)) {
      out.push_back(std::move(*target));
    }
  }
  if (block.server.has_value()) {
    if (auto target = parse_server_entry(config::ServerEntry{.url = *block.server})) {
      out.push_back(std::move(*target));
    }
  }
}

std::size_t count_matches(const Target &target, const std::vector<std::string> &preferred) {
  std::unordered_set<std::string> caps;
  for (const auto &tag : target.capabilities) {
    caps.insert(normalize_capability_tag(tag));
  }
  return static_cast<std::size_t>(std::count_if(
      preferred.begin(), preferred.end(), [&](const std::string &tag) { return caps.contains(tag); }));
}

} // namespace

std::string normalize_ws_url(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return "";
  }
  const std::string slashed = common::replace_all(trimmed, "\\", "/");
  if (slashed.find("://") != std::string::npos) {
    return slashed;
  }

  // `scheme:/rest`
  const auto colon = slashed.find(':');
  if (colon != std::string::npos && colon > 0 && colon + 2 < slashed.size() &&
      slashed[colon + 1] == '/') {
    const std::string scheme = slashed.substr(0, colon);
    const bool alphabetic = std::all_of(scheme.begin(), scheme.end(), [](const unsigned char ch) {
      return std::isalpha(ch) != 0;
    });
    if (alphabetic) {
      return common::to_lower(scheme) + "://" + strip_leading_slashes(slashed.substr(colon + 2));
    }
  }
  return "ws://" + strip_leading_slashes(slashed);
}

std::string normalize_capability_tag(const std::string &value) {
  const std::string trimmed = common::to_lower(common::trim(value));
  std::string out;
  out.reserve(trimmed.size());
  bool in_space = false;
  for (const char ch : trimmed) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_space) {
        out.push_back('-');
      }
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(ch);
  }
  return out;
}

std::vector<std::string> dedupe_capability_tags(const std::vector<std::string> &tags) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto &raw : tags) {
    std::string tag = normalize_capability_tag(raw);
    if (tag.empty() || !seen.insert(tag).second) {
      continue;
    }
    out.push_back(std::move(tag));
  }
  return out;
}

std::vector<Target> dedupe_targets(const std::vector<Target> &targets) {
  std::vector<Target> out;
  std::unordered_set<std::string> seen;
  for (const auto &raw : targets) {
    std::string url = normalize_ws_url(raw.url);
    if (url.empty() || !seen.insert(url).second) {
      continue;
    }
    out.push_back(Target{.url = std::move(url), .capabilities = dedupe_capability_tags(raw.capabilities)});
  }
  return out;
}

std::vector<Target> sort_targets_by_capabilities(std::vector<Target> targets,
                                                 const std::vector<std::string> &preferred) {
  const std::vector<std::string> wanted = dedupe_capability_tags(preferred);
  if (wanted.empty() || targets.size() <= 1) {
    return targets;
  }
  std::stable_sort(targets.begin(), targets.end(), [&](const Target &left, const Target &right) {
    const std::size_t left_matches = count_matches(left, wanted);
    const std::size_t right_matches = count_matches(right, wanted);
    const bool left_all = left_matches == wanted.size();
    const bool right_all = right_matches == wanted.size();
    if (left_all != right_all) {
      return left_all;
    }
    return left_matches > right_matches;
  });
  return targets;
}

std::vector<std::string> preferred_capabilities(const config::ParamBlock &model) {
  std::vector<std::string> merged = model.server_capabilities;
  merged.insert(merged.end(), model.preferred_server_capabilities.begin(),
                model.preferred_server_capabilities.end());
  merged.insert(merged.end(), model.preferred_capabilities.begin(),
                model.preferred_capabilities.end());
  return dedupe_capability_tags(merged);
}

std::vector<Target> resolve_targets(const config::ParamBlock &model,
                                    const config::ParamBlock &defaults,
                                    const config::EnvironmentProvider &env) {
  std::vector<Target> candidates;
  append_block(candidates, model);
  append_block(candidates, defaults);

  if (const auto list = env.get("LLMWS_SERVERS"); list.has_value()) {
    for (auto &url : common::split_trimmed(*list, ',')) {
      candidates.push_back(Target{.url = std::move(url), .capabilities = {}});
    }
  }
  if (const auto single = env.get("LLMWS_SERVER"); single.has_value()) {
    const std::string url = common::trim(*single);
    if (!url.empty()) {
      candidates.push_back(Target{.url = url, .capabilities = {}});
    }
  }
  candidates.push_back(Target{.url = kDefaultEndpoint, .capabilities = {}});

  return sort_targets_by_capabilities(dedupe_targets(candidates), preferred_capabilities(model));
}

} // namespace llmws::client
