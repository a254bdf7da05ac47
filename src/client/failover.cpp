#include "llmws/client/failover.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <algorithm>
#include <initializer_list>
#include <regex>

namespace llmws::client {

namespace {

bool contains_any(const std::string &lower, const std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const std::string_view needle) {
    return lower.find(needle) != std::string::npos;
  });
}

bool has_status_code(const std::string &lower, const char *code) {
  const std::regex pattern(std::string("(^|[^0-9])") + code + "([^0-9]|$)");
  return std::regex_search(lower, pattern);
}

bool is_rate_limit(const std::string &lower) {
  return has_status_code(lower, "429") ||
         contains_any(lower, {"rate limit", "rate_limit", "ratelimit", "too many requests",
                              "exceeded your current quota", "quota exceeded",
                              "resource has been exhausted", "resource_exhausted", "usage limit",
                              "overloaded"});
}

bool is_billing(const std::string &lower) {
  return has_status_code(lower, "402") ||
         contains_any(lower, {"payment required", "insufficient credits", "insufficient_quota",
                              "insufficient quota", "credit balance", "plans & billing",
                              "billing"});
}

bool is_timeout(const std::string &lower) {
  return contains_any(lower, {"timeout", "timed out", "deadline exceeded"});
}

bool is_auth(const std::string &lower) {
  return has_status_code(lower, "401") || has_status_code(lower, "403") ||
         contains_any(lower, {"invalid api key", "invalid_api_key", "incorrect api key",
                              "invalid token", "authentication", "unauthorized", "forbidden",
                              "access denied", "no api key found", "no credentials found"});
}

} // namespace

std::string_view failover_reason_name(const FailoverReason reason) {
  switch (reason) {
  case FailoverReason::RateLimit:
    return "rate_limit";
  case FailoverReason::Timeout:
    return "timeout";
  case FailoverReason::Auth:
    return "auth";
  case FailoverReason::Billing:
    return "billing";
  case FailoverReason::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::optional<int> failover_status(const FailoverReason reason) {
  switch (reason) {
  case FailoverReason::RateLimit:
    return 429;
  case FailoverReason::Timeout:
    return 408;
  case FailoverReason::Auth:
    return 401;
  case FailoverReason::Billing:
    return 402;
  case FailoverReason::Unknown:
    return std::nullopt;
  }
  return std::nullopt;
}

std::string_view backoff_hint_name(const BackoffHint hint) {
  switch (hint) {
  case BackoffHint::None:
    return "none";
  case BackoffHint::Cooldown:
    return "cooldown";
  case BackoffHint::Disable:
    return "disable";
  }
  return "none";
}

std::optional<FailoverReason> classify_failure(const std::string &message) {
  const std::string lower = common::to_lower(message);
  if (lower.empty()) {
    return std::nullopt;
  }
  if (is_rate_limit(lower)) {
    return FailoverReason::RateLimit;
  }
  if (is_billing(lower)) {
    return FailoverReason::Billing;
  }
  if (is_timeout(lower)) {
    return FailoverReason::Timeout;
  }
  if (is_auth(lower)) {
    return FailoverReason::Auth;
  }
  return std::nullopt;
}

bool has_connectivity_hint(const std::string &message) {
  const std::string lower = common::to_lower(message);
  return contains_any(lower, {"connect timeout", "read timeout", "socket closed",
                              "connection closed", "econnrefused", "econnreset", "etimedout",
                              "ehostunreach", "enetunreach", "enotfound", "epipe", "timed out"});
}

FailoverError to_failover_error(const std::string &message, const std::string &provider,
                                const std::string &model) {
  FailoverError error;
  error.message = common::trim(message);
  if (error.message.empty()) {
    error.message = "LLMWS request failed";
  }
  error.reason = classify_failure(error.message)
                     .value_or(has_connectivity_hint(error.message) ? FailoverReason::Timeout
                                                                    : FailoverReason::Unknown);
  error.status = failover_status(error.reason);
  error.provider = provider;
  error.model = model;
  return error;
}

FailoverReason rotation_reason(const FailoverReason reason, const std::string &message) {
  if (reason != FailoverReason::RateLimit) {
    return reason;
  }
  const std::string lower = common::to_lower(message);
  if (contains_any(lower, {"exceeded your current quota", "quota exceeded", "insufficient quota"})) {
    return FailoverReason::Billing;
  }
  return reason;
}

BackoffHint backoff_hint(const FailoverError &error) {
  switch (rotation_reason(error.reason, error.message)) {
  case FailoverReason::RateLimit:
    return BackoffHint::Cooldown;
  case FailoverReason::Billing:
  case FailoverReason::Auth:
    return BackoffHint::Disable;
  case FailoverReason::Timeout:
  case FailoverReason::Unknown:
    return BackoffHint::None;
  }
  return BackoffHint::None;
}

common::Result<FailoverOutcome, FailoverError>
run_with_failover(const std::vector<Target> &targets, const AttemptFn &attempt,
                  const std::string &provider, const std::string &model) {
  using Out = common::Result<FailoverOutcome, FailoverError>;
  std::vector<std::string> failures;
  for (const auto &target : targets) {
    auto result = attempt(target);
    if (result.ok()) {
      return Out::success(FailoverOutcome{
          .result = std::move(result.value()), .target = target, .failures = std::move(failures)});
    }
    observability::record_attempt_failed(target.url, result.error());
    failures.push_back(target.url + ": " + result.error());
  }

  const std::string message = failures.empty()
                                  ? std::string("LLMWS endpoints failed")
                                  : "LLMWS endpoints failed: " + common::join(failures, " | ");
  return Out::failure(to_failover_error(message, provider, model));
}

} // namespace llmws::client
