#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmws::config {

/// Read access to environment variables. Resolution code never calls getenv
/// directly so tests can supply their own values.
class EnvironmentProvider {
public:
  virtual ~EnvironmentProvider() = default;
  [[nodiscard]] virtual std::optional<std::string> get(const std::string &name) const = 0;
};

class ProcessEnvironment final : public EnvironmentProvider {
public:
  [[nodiscard]] std::optional<std::string> get(const std::string &name) const override;
};

class MapEnvironment final : public EnvironmentProvider {
public:
  MapEnvironment() = default;
  explicit MapEnvironment(std::unordered_map<std::string, std::string> values);

  void set(const std::string &name, std::string value);
  [[nodiscard]] std::optional<std::string> get(const std::string &name) const override;

private:
  std::unordered_map<std::string, std::string> values_;
};

/// First variable in `names` holding a positive number, floored; `fallback`
/// otherwise.
[[nodiscard]] std::uint64_t env_positive_int(const EnvironmentProvider &env,
                                             const std::vector<std::string> &names,
                                             std::uint64_t fallback);

} // namespace llmws::config
