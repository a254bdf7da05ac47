#include "llmws/config/environment.hpp"

#include "llmws/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace llmws::config {

std::optional<std::string> ProcessEnvironment::get(const std::string &name) const {
  if (const char *value = std::getenv(name.c_str()); value != nullptr) {
    return std::string(value);
  }
  return std::nullopt;
}

MapEnvironment::MapEnvironment(std::unordered_map<std::string, std::string> values)
    : values_(std::move(values)) {}

void MapEnvironment::set(const std::string &name, std::string value) {
  values_[name] = std::move(value);
}

std::optional<std::string> MapEnvironment::get(const std::string &name) const {
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::uint64_t env_positive_int(const EnvironmentProvider &env,
                               const std::vector<std::string> &names,
                               const std::uint64_t fallback) {
  for (const auto &name : names) {
    const auto raw = env.get(name);
    if (!raw.has_value()) {
      continue;
    }
    const std::string value = common::trim(*raw);
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() ||
        !std::isfinite(parsed) || parsed <= 0.0) {
      continue;
    }
    parsed = std::min(parsed, 1e15);
    return std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::floor(parsed)));
  }
  return fallback;
}

} // namespace llmws::config
