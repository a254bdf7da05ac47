#pragma once

#include "llmws/client/attempt.hpp"
#include "llmws/client/targets.hpp"
#include "llmws/common/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmws::client {

enum class FailoverReason { RateLimit, Timeout, Auth, Billing, Unknown };

[[nodiscard]] std::string_view failover_reason_name(FailoverReason reason);

/// HTTP-style status surfaced with a reason: 429, 408, 401, 402, none for unknown.
[[nodiscard]] std::optional<int> failover_status(FailoverReason reason);

struct FailoverError {
  FailoverReason reason = FailoverReason::Unknown;
  std::optional<int> status;
  std::string message;
  std::string provider;
  std::string model;
};

/// How long a caller rotating between providers should leave this one alone.
enum class BackoffHint { None, Cooldown, Disable };

[[nodiscard]] std::string_view backoff_hint_name(BackoffHint hint);

/// Classification by message content. Checked in order: rate limit, billing,
/// timeout, auth. nullopt when nothing matches.
[[nodiscard]] std::optional<FailoverReason> classify_failure(const std::string &message);

/// True for messages that describe an unreachable or dropped server.
[[nodiscard]] bool has_connectivity_hint(const std::string &message);

[[nodiscard]] FailoverError to_failover_error(const std::string &message,
                                              const std::string &provider,
                                              const std::string &model);

/// A rate limit whose text says the quota is exhausted is treated as billing.
[[nodiscard]] FailoverReason rotation_reason(FailoverReason reason, const std::string &message);

[[nodiscard]] BackoffHint backoff_hint(const FailoverError &error);

struct FailoverOutcome {
  AttemptResult result;
  Target target;
  /// `"<url>: <error>"` for every target that failed before the winner.
  std::vector<std::string> failures;
};

using AttemptFn = std::function<common::Result<AttemptResult>(const Target &)>;

/// Tries each target in order until one succeeds. When all fail the message is
/// `LLMWS endpoints failed: <url>: <error> | ...`.
[[nodiscard]] common::Result<FailoverOutcome, FailoverError>
run_with_failover(const std::vector<Target> &targets, const AttemptFn &attempt,
                  const std::string &provider, const std::string &model);

} // namespace llmws::client
