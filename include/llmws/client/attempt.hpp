#pragma once

#include "llmws/client/budget_policy.hpp"
#include "llmws/client/protocol.hpp"
#include "llmws/client/settings.hpp"
#include "llmws/common/result.hpp"
#include "llmws/transport/connection.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmws::client {

enum class AttemptState {
  Connecting,
  AwaitingWelcome,
  AwaitingStream,
  RetryForBudget,
  Completed,
  Failed,
};

[[nodiscard]] std::string_view attempt_state_name(AttemptState state);

struct Usage {
  std::optional<double> input;
  std::optional<double> output;
  /// input + output, only when positive.
  std::optional<double> total;
};

struct AttemptResult {
  /// Streamed tokens concatenated, then trimmed.
  std::string text;
  std::string session_id;
  std::optional<Usage> usage;
};

struct AttemptRequest {
  std::string target;
  std::chrono::milliseconds connect_timeout{kDefaultConnectTimeout};
  std::chrono::milliseconds read_timeout{0};
  std::string resume_session_id;
  std::string system_prompt;
  std::string user_prompt;
  std::vector<MediaItem> media;
  GenerationConfig generation;
};

/// One call against a single target: hello, welcome, inference request, then
/// the token stream until `done`. The budget policy may send the attempt back
/// to Connecting once; the socket is closed on every exit path.
[[nodiscard]] common::Result<AttemptResult> run_attempt(transport::Connector &connector,
                                                        const AttemptRequest &request,
                                                        const TokenBudgetPolicy &budget_policy);

} // namespace llmws::client
