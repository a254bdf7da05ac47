#include "llmws/client/settings.hpp"

#include "llmws/common/json_util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <sstream>

namespace llmws::client {

namespace {

template <typename T>
std::optional<T> first_set(std::initializer_list<const std::optional<T> *> layers) {
  for (const auto *layer : layers) {
    if (layer->has_value()) {
      return *layer;
    }
  }
  return std::nullopt;
}

std::optional<double> finite(std::optional<double> value) {
  if (value.has_value() && !std::isfinite(*value)) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
std::optional<T> model_or_default(const std::optional<T> &model, const std::optional<T> &defaults) {
  return model.has_value() ? model : defaults;
}

std::chrono::milliseconds clamp_timeout(const double value) {
  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::max(1.0, std::floor(std::min(value, 1e15)))));
}

std::size_t clamp_count(const double value) {
  return static_cast<std::size_t>(std::max(0.0, std::floor(std::min(value, 1e15))));
}

} // namespace

GenerationConfig resolve_generation(const config::ParamBlock &model,
                                    const config::ParamBlock &defaults,
                                    const StreamOverrides &overrides) {
  const auto layered = [&](auto member) {
    return finite(first_set({&(model.config.*member), &(model.generation.*member),
                             &(defaults.config.*member), &(defaults.generation.*member)}));
  };

  GenerationConfig out;
  out.max_new_tokens = layered(&config::GenerationParams::max_new_tokens);
  out.temperature = layered(&config::GenerationParams::temperature);
  out.top_p = layered(&config::GenerationParams::top_p);
  out.top_k = layered(&config::GenerationParams::top_k);
  out.repetition_penalty = layered(&config::GenerationParams::repetition_penalty);
  out.do_sample = first_set({&model.config.do_sample, &model.generation.do_sample,
                             &defaults.config.do_sample, &defaults.generation.do_sample});

  if (const auto temperature = finite(overrides.temperature)) {
    out.temperature = temperature;
  }
  if (const auto max_tokens = finite(overrides.max_tokens)) {
    out.max_new_tokens = max_tokens;
  }
  return out;
}

std::string generation_to_json(const GenerationConfig &generation) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  const auto field = [&](const char *key, const std::string &value) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(key) << ":" << value;
  };
  const auto number = [&](const char *key, const std::optional<double> &value) {
    if (value.has_value()) {
      field(key, common::json_number(*value));
    }
  };
  number("max_new_tokens", generation.max_new_tokens);
  number("temperature", generation.temperature);
  number("top_p", generation.top_p);
  number("top_k", generation.top_k);
  number("repetition_penalty", generation.repetition_penalty);
  if (generation.do_sample.has_value()) {
    field("do_sample", *generation.do_sample ? "true" : "false");
  }
  out << "}";
  return out.str();
}

RuntimeSettings resolve_runtime_settings(const config::ParamBlock &model,
                                         const config::ParamBlock &defaults,
                                         const std::chrono::milliseconds call_timeout,
                                         const StreamOverrides &overrides,
                                         const config::EnvironmentProvider &env) {
  RuntimeSettings settings;
  settings.targets = resolve_targets(model, defaults, env);

  const double call_ms = static_cast<double>(call_timeout.count());
  settings.connect_timeout = clamp_timeout(
      finite(model_or_default(model.connect_timeout_ms, defaults.connect_timeout_ms))
          .value_or(std::min(static_cast<double>(kDefaultConnectTimeout.count()), call_ms)));
  settings.read_timeout = clamp_timeout(
      finite(model_or_default(model.read_timeout_ms, defaults.read_timeout_ms)).value_or(call_ms));
  settings.include_history =
      model_or_default(model.include_history, defaults.include_history).value_or(true);
  settings.history_turns =
      clamp_count(finite(model_or_default(model.history_turns, defaults.history_turns))
                      .value_or(static_cast<double>(kDefaultHistoryTurns)));
  settings.history_chars =
      clamp_count(finite(model_or_default(model.history_chars, defaults.history_chars))
                      .value_or(static_cast<double>(kDefaultHistoryChars)));
  settings.generation = resolve_generation(model, defaults, overrides);
  return settings;
}

} // namespace llmws::client
