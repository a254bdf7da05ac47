#pragma once

#include "llmws/common/result.hpp"

#include <optional>
#include <string_view>

namespace llmws::client {

/// Decides how to react when a server's `start` message reports a generation
/// budget (`max_tokens`) that does not exceed the prompt size (`tokens_in`).
///
/// Some deployed servers compute `max_tokens = max_new_tokens - tokens_in` and
/// then never finish the stream when the result is not positive. A policy can
/// ask for one reconnect with a corrected `max_new_tokens`.
class TokenBudgetPolicy {
public:
  virtual ~TokenBudgetPolicy() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;

  /// nullopt to keep streaming, a new `max_new_tokens` to retry with, or an
  /// error that fails the attempt.
  [[nodiscard]] virtual common::Result<std::optional<double>>
  evaluate(double tokens_in, double max_tokens, std::optional<double> requested) const = 0;
};

/// Retries with `max_new_tokens = floor(2 * tokens_in + requested)`.
class DoublingBudgetPolicy final : public TokenBudgetPolicy {
public:
  [[nodiscard]] std::string_view name() const override { return "doubling"; }
  [[nodiscard]] common::Result<std::optional<double>>
  evaluate(double tokens_in, double max_tokens, std::optional<double> requested) const override;
};

class DisabledBudgetPolicy final : public TokenBudgetPolicy {
public:
  [[nodiscard]] std::string_view name() const override { return "disabled"; }
  [[nodiscard]] common::Result<std::optional<double>>
  evaluate(double tokens_in, double max_tokens, std::optional<double> requested) const override;
};

} // namespace llmws::client
