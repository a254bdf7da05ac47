#pragma once

#include "llmws/client/targets.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/config/schema.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmws::client {

constexpr std::chrono::milliseconds kDefaultConnectTimeout{8000};
constexpr std::size_t kDefaultHistoryTurns = 12;
constexpr std::size_t kDefaultHistoryChars = 12000;

/// Generation knobs sent as the request's `config` object.
struct GenerationConfig {
  std::optional<double> max_new_tokens;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<double> top_k;
  std::optional<double> repetition_penalty;
  std::optional<bool> do_sample;
};

/// Caller-supplied sampling overrides; they beat every configured value.
struct StreamOverrides {
  std::optional<double> temperature;
  std::optional<double> max_tokens;
};

struct RuntimeSettings {
  std::vector<Target> targets;
  std::chrono::milliseconds connect_timeout{kDefaultConnectTimeout};
  std::chrono::milliseconds read_timeout{0};
  bool include_history = true;
  std::size_t history_turns = kDefaultHistoryTurns;
  std::size_t history_chars = kDefaultHistoryChars;
  GenerationConfig generation;
};

/// Layers, highest first: model `config`, model block, deployment `config`,
/// deployment block; the overrides are applied last.
[[nodiscard]] GenerationConfig resolve_generation(const config::ParamBlock &model,
                                                  const config::ParamBlock &defaults,
                                                  const StreamOverrides &overrides);

/// JSON object holding only the knobs that are set, in a fixed key order.
[[nodiscard]] std::string generation_to_json(const GenerationConfig &generation);

[[nodiscard]] RuntimeSettings resolve_runtime_settings(const config::ParamBlock &model,
                                                       const config::ParamBlock &defaults,
                                                       std::chrono::milliseconds call_timeout,
                                                       const StreamOverrides &overrides,
                                                       const config::EnvironmentProvider &env);

} // namespace llmws::client
