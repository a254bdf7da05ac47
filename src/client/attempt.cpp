#include "llmws/client/attempt.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <memory>

namespace llmws::client {

namespace {

using Clock = std::chrono::steady_clock;

/// Closes the connection when the attempt leaves scope.
class ConnectionGuard {
public:
  explicit ConnectionGuard(std::unique_ptr<transport::Connection> connection)
      : connection_(std::move(connection)) {}
  ~ConnectionGuard() {
    if (connection_ != nullptr) {
      connection_->close();
    }
  }

  ConnectionGuard(const ConnectionGuard &) = delete;
  ConnectionGuard &operator=(const ConnectionGuard &) = delete;

  transport::Connection *operator->() const { return connection_.get(); }

private:
  std::unique_ptr<transport::Connection> connection_;
};

std::chrono::milliseconds remaining(const Clock::time_point deadline) {
  // Rounded up so a wait that times out always ends at or past the deadline.
  return std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
}

void trace(const AttemptRequest &request, const AttemptState state) {
  observability::log_debug("llmws", request.target + ": " + std::string(attempt_state_name(state)));
}

std::optional<Usage> build_usage(const std::optional<double> input,
                                 const std::optional<double> output) {
  if (!input.has_value() && !output.has_value()) {
    return std::nullopt;
  }
  Usage usage{.input = input, .output = output, .total = std::nullopt};
  const double sum = input.value_or(0) + output.value_or(0);
  if (sum > 0) {
    usage.total = sum;
  }
  return usage;
}

} // namespace

std::string_view attempt_state_name(const AttemptState state) {
  switch (state) {
  case AttemptState::Connecting:
    return "connecting";
  case AttemptState::AwaitingWelcome:
    return "awaiting_welcome";
  case AttemptState::AwaitingStream:
    return "awaiting_stream";
  case AttemptState::RetryForBudget:
    return "retry_for_budget";
  case AttemptState::Completed:
    return "completed";
  case AttemptState::Failed:
    return "failed";
  }
  return "unknown";
}

common::Result<AttemptResult> run_attempt(transport::Connector &connector,
                                          const AttemptRequest &request,
                                          const TokenBudgetPolicy &budget_policy) {
  using Out = common::Result<AttemptResult>;
  const auto fail = [&](const std::string &message) {
    trace(request, AttemptState::Failed);
    return Out::failure(message);
  };

  GenerationConfig generation = request.generation;
  bool budget_corrected = false;

  for (int pass = 0; pass < 2; ++pass) {
    trace(request, AttemptState::Connecting);
    auto opened = connector.open(request.target, request.connect_timeout);
    if (!opened.ok()) {
      return fail(opened.error());
    }
    ConnectionGuard connection(std::move(opened.value()));

    auto sent = connection->send(encode_hello(request.resume_session_id));
    if (!sent.ok()) {
      return fail(sent.error());
    }

    trace(request, AttemptState::AwaitingWelcome);
    const auto welcome_deadline = Clock::now() + request.read_timeout;
    std::optional<std::string> session_id;
    bool saw_welcome = false;
    while (!saw_welcome) {
      const auto left = remaining(welcome_deadline);
      if (left.count() <= 0) {
        return fail("LLMWS welcome timeout");
      }
      auto message = connection->next(left);
      if (!message.ok()) {
        return fail(Clock::now() >= welcome_deadline ? "LLMWS welcome timeout" : message.error());
      }
      if (message_type(message.value()) != "welcome") {
        continue;
      }
      saw_welcome = true;
      session_id = read_string(message.value(), "session_id");
    }
    if (!session_id.has_value()) {
      session_id = common::generate_uuid();
    }

    sent = connection->send(encode_inference(request.system_prompt, request.user_prompt,
                                             request.media, generation));
    if (!sent.ok()) {
      return fail(sent.error());
    }

    trace(request, AttemptState::AwaitingStream);
    auto read_deadline = Clock::now() + request.read_timeout;
    std::optional<double> input_tokens;
    std::optional<double> output_tokens;
    std::string text;
    bool done = false;
    bool retry = false;

    while (!done && !retry) {
      const auto left = remaining(read_deadline);
      if (left.count() <= 0) {
        return fail("LLMWS stream timeout");
      }
      auto message = connection->next(left);
      if (!message.ok()) {
        return fail(Clock::now() >= read_deadline ? "LLMWS stream timeout" : message.error());
      }
      read_deadline = Clock::now() + request.read_timeout;

      const std::string type = message_type(message.value());
      if (type == "start") {
        const auto tokens_in = read_number(message.value(), "tokens_in");
        const auto max_tokens = read_number(message.value(), "max_tokens");
        if (tokens_in.has_value()) {
          input_tokens = tokens_in;
        }
        if (budget_corrected || !tokens_in.has_value() || !max_tokens.has_value()) {
          continue;
        }
        auto decision = budget_policy.evaluate(*tokens_in, *max_tokens, generation.max_new_tokens);
        if (!decision.ok()) {
          return fail(decision.error());
        }
        if (decision.value().has_value()) {
          generation.max_new_tokens = decision.value();
          budget_corrected = true;
          retry = true;
          observability::record_budget_retry(
              request.target, static_cast<std::uint64_t>(*tokens_in),
              static_cast<std::uint64_t>(*decision.value()));
        }
      } else if (type == "token") {
        // Token chunks are kept verbatim, including surrounding whitespace.
        if (auto chunk = common::json_string_field(message.value(), "data")) {
          text += *chunk;
        }
      } else if (type == "done") {
        if (const auto total = read_number(message.value(), "total_tokens")) {
          output_tokens = total;
        }
        done = true;
      } else if (type == "error") {
        return fail(read_string(message.value(), "message").value_or("LLMWS returned an error"));
      }
    }

    if (retry) {
      trace(request, AttemptState::RetryForBudget);
      continue;
    }

    trace(request, AttemptState::Completed);
    return Out::success(AttemptResult{.text = common::trim(text),
                                      .session_id = *session_id,
                                      .usage = build_usage(input_tokens, output_tokens)});
  }

  return fail("LLMWS retry failed: server did not accept adjusted token budget");
}

} // namespace llmws::client
