#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "llmws/client/failover.hpp"
#include "llmws/client/settings.hpp"

namespace {

using namespace std::chrono_literals;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

llmws::client::AttemptFn scripted_attempts(llmws::transport::Connector &connector,
                                           const llmws::client::TokenBudgetPolicy &policy) {
  return [&connector, &policy](const llmws::client::Target &target) {
    llmws::client::AttemptRequest request;
    request.target = target.url;
    request.connect_timeout = 200ms;
    request.read_timeout = 500ms;
    request.user_prompt = "hi";
    return llmws::client::run_attempt(connector, request, policy);
  };
}

} // namespace

void register_failover_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace client = llmws::client;
  namespace config = llmws::config;
  namespace testing = llmws::testing;

  tests.push_back({"classify_failure_by_message", [] {
                     using client::FailoverReason;
                     require(client::classify_failure("HTTP 429 Too Many Requests") ==
                                 FailoverReason::RateLimit,
                             "429");
                     require(client::classify_failure("server overloaded, try later") ==
                                 FailoverReason::RateLimit,
                             "overloaded");
                     require(client::classify_failure("402 Payment Required") ==
                                 FailoverReason::Billing,
                             "402");
                     require(client::classify_failure("insufficient credits on account") ==
                                 FailoverReason::Billing,
                             "credits");
                     require(client::classify_failure("LLMWS stream timeout") ==
                                 FailoverReason::Timeout,
                             "stream timeout");
                     require(client::classify_failure("Request timed out") ==
                                 FailoverReason::Timeout,
                             "timed out");
                     require(client::classify_failure("401 Unauthorized") == FailoverReason::Auth,
                             "401");
                     require(client::classify_failure("Invalid API key provided") ==
                                 FailoverReason::Auth,
                             "api key");
                     require(!client::classify_failure("model produced garbage").has_value(),
                             "unknown");
                     require(!client::classify_failure("").has_value(), "empty");
                     require(!client::classify_failure("port 14290 busy").has_value(),
                             "status codes need a boundary");
                   }});

  tests.push_back({"classify_failure_checks_rate_limit_before_timeout", [] {
                     require(client::classify_failure("rate limit hit; request timed out") ==
                                 client::FailoverReason::RateLimit,
                             "rate limit wins");
                     require(client::classify_failure("billing issue: request timeout") ==
                                 client::FailoverReason::Billing,
                             "billing before timeout");
                     require(client::classify_failure("timeout while authenticating (401)") ==
                                 client::FailoverReason::Timeout,
                             "timeout before auth");
                   }});

  tests.push_back({"failover_error_uses_connectivity_hints", [] {
                     auto refused = client::to_failover_error("connect ECONNREFUSED h:1", "p", "m");
                     require(refused.reason == client::FailoverReason::Timeout, "refused");
                     require(refused.status == 408, "timeout status");
                     require(refused.provider == "p" && refused.model == "m", "identity kept");

                     auto closed = client::to_failover_error("LLMWS socket closed (1006): ", "p",
                                                             "m");
                     require(closed.reason == client::FailoverReason::Timeout, "dropped socket");

                     auto unknown = client::to_failover_error("model exploded", "p", "m");
                     require(unknown.reason == client::FailoverReason::Unknown, "unknown");
                     require(!unknown.status.has_value(), "no status for unknown");

                     auto blank = client::to_failover_error("   ", "p", "m");
                     require(blank.message == "LLMWS request failed", "blank message replaced");
                   }});

  tests.push_back({"failover_reason_names_and_statuses", [] {
                     require(client::failover_reason_name(client::FailoverReason::RateLimit) ==
                                 "rate_limit",
                             "rate_limit name");
                     require(client::failover_status(client::FailoverReason::RateLimit) == 429,
                             "429");
                     require(client::failover_status(client::FailoverReason::Auth) == 401, "401");
                     require(client::failover_status(client::FailoverReason::Billing) == 402,
                             "402");
                     require(client::failover_status(client::FailoverReason::Timeout) == 408,
                             "408");
                   }});

  tests.push_back({"exhausted_quota_rotates_as_billing", [] {
                     const std::string message = "You exceeded your current quota";
                     require(client::classify_failure(message) == client::FailoverReason::RateLimit,
                             "classified as rate limit");
                     require(client::rotation_reason(client::FailoverReason::RateLimit, message) ==
                                 client::FailoverReason::Billing,
                             "rotates as billing");
                     require(client::rotation_reason(client::FailoverReason::RateLimit,
                                                     "429 slow down") ==
                                 client::FailoverReason::RateLimit,
                             "plain rate limit kept");

                     auto error = client::to_failover_error(message, "p", "m");
                     require(client::backoff_hint(error) == client::BackoffHint::Disable,
                             "quota disables");
                     auto limited = client::to_failover_error("429 slow down", "p", "m");
                     require(client::backoff_hint(limited) == client::BackoffHint::Cooldown,
                             "rate limit cools down");
                     auto timeout = client::to_failover_error("LLMWS welcome timeout", "p", "m");
                     require(client::backoff_hint(timeout) == client::BackoffHint::None,
                             "timeouts do not back off");
                     require(client::backoff_hint_name(client::BackoffHint::Cooldown) ==
                                 "cooldown",
                             "hint name");
                   }});

  tests.push_back({"failover_returns_first_success", [] {
                     const std::vector<client::Target> targets{{"ws://a:1", {}},
                                                               {"ws://b:1", {}},
                                                               {"ws://c:1", {}}};
                     std::vector<std::string> tried;
                     auto outcome = client::run_with_failover(
                         targets,
                         [&tried](const client::Target &target) {
                           tried.push_back(target.url);
                           if (target.url == "ws://a:1") {
                             return llmws::common::Result<client::AttemptResult>::failure(
                                 "connect ECONNREFUSED a:1");
                           }
                           return llmws::common::Result<client::AttemptResult>::success(
                               client::AttemptResult{.text = target.url, .session_id = "s"});
                         },
                         "llmws", "qwen");
                     require(outcome.ok(), "second target answered");
                     require(outcome.value().target.url == "ws://b:1", "winner reported");
                     require(outcome.value().result.text == "ws://b:1", "winner's result");
                     require(tried.size() == 2, "stops after success");
                     require(outcome.value().failures.size() == 1 &&
                                 outcome.value().failures[0] ==
                                     "ws://a:1: connect ECONNREFUSED a:1",
                             "earlier failure recorded");
                   }});

  tests.push_back({"failover_reports_every_unreachable_target", [] {
                     testing::ScriptedConnector connector;
                     connector.refuse("ws://a:1", "connect ECONNREFUSED a:1");
                     connector.refuse("ws://b:2", "LLMWS connect timeout (200ms)");
                     const client::DoublingBudgetPolicy policy;
                     const std::vector<client::Target> targets{{"ws://a:1", {}}, {"ws://b:2", {}}};
                     auto outcome = client::run_with_failover(
                         targets, scripted_attempts(connector, policy), "llmws", "qwen");
                     require(!outcome.ok(), "all targets failed");
                     const auto &error = outcome.error();
                     require(error.message ==
                                 "LLMWS endpoints failed: ws://a:1: connect ECONNREFUSED a:1 | "
                                 "ws://b:2: LLMWS connect timeout (200ms)",
                             error.message);
                     require(error.reason == client::FailoverReason::Timeout, "timeout class");
                     require(error.status == 408, "status 408");
                     require(error.provider == "llmws" && error.model == "qwen", "identity");
                   }});

  tests.push_back({"failover_with_no_targets", [] {
                     auto outcome = client::run_with_failover(
                         {},
                         [](const client::Target &) {
                           return llmws::common::Result<client::AttemptResult>::failure("unused");
                         },
                         "p", "m");
                     require(!outcome.ok() && outcome.error().message == "LLMWS endpoints failed",
                             "bare message");
                     require(outcome.error().reason == client::FailoverReason::Unknown,
                             "unknown class");
                   }});

  tests.push_back({"failover_server_error_is_not_connectivity", [] {
                     testing::ScriptedConnector connector;
                     connector.serve("ws://a:1", [](testing::ScriptedConnection &connection,
                                                    const llmws::transport::ParsedMessage &message) {
                       connection.reply(client::message_type(message).empty()
                                            ? "{\"type\":\"welcome\"}"
                                            : "{\"type\":\"error\",\"message\":\"bad prompt\"}");
                     });
                     const client::DoublingBudgetPolicy policy;
                     auto outcome = client::run_with_failover(
                         {{"ws://a:1", {}}}, scripted_attempts(connector, policy), "p", "m");
                     require(!outcome.ok(), "failed");
                     require(outcome.error().message == "LLMWS endpoints failed: ws://a:1: bad prompt",
                             outcome.error().message);
                     require(outcome.error().reason == client::FailoverReason::Unknown, "unknown");
                   }});

  tests.push_back({"failover_follows_capability_order", [] {
                     config::ParamBlock model;
                     model.servers = {{"ws://cpu:1", {"cpu"}}, {"ws://gpu:1", {"GPU", "vision"}}};
                     model.preferred_capabilities = {"gpu"};
                     const config::MapEnvironment env;
                     const auto targets = client::resolve_targets(model, config::ParamBlock{}, env);
                     require(targets.size() == 2 && targets[0].url == "ws://gpu:1",
                             "preferred target first");

                     testing::ScriptedConnector connector;
                     connector.serve("ws://gpu:1", testing::streaming_server({"from gpu"}));
                     connector.serve("ws://cpu:1", testing::streaming_server({"from cpu"}));
                     const client::DoublingBudgetPolicy policy;
                     auto outcome = client::run_with_failover(
                         targets, scripted_attempts(connector, policy), "p", "m");
                     require(outcome.ok() && outcome.value().result.text == "from gpu",
                             "gpu answered");
                     require(connector.opened().size() == 1 && connector.opened()[0] == "ws://gpu:1",
                             "cpu target never opened");
                   }});

  tests.push_back({"failover_moves_on_after_midstream_failure", [] {
                     testing::ScriptedConnector connector;
                     connector.serve("ws://a:1", [](testing::ScriptedConnection &connection,
                                                    const llmws::transport::ParsedMessage &message) {
                       if (client::message_type(message).empty()) {
                         connection.reply("{\"type\":\"welcome\"}");
                       } else {
                         connection.reply("{\"type\":\"token\",\"data\":\"half\"}");
                         connection.drop("LLMWS socket closed (1006): ");
                       }
                     });
                     connector.serve("ws://b:1", testing::streaming_server({"whole"}));
                     const client::DoublingBudgetPolicy policy;
                     auto outcome = client::run_with_failover(
                         {{"ws://a:1", {}}, {"ws://b:1", {}}}, scripted_attempts(connector, policy),
                         "p", "m");
                     require(outcome.ok() && outcome.value().result.text == "whole",
                             "partial output discarded");
                     require(connector.closed_count() == 2, "both sockets closed");
                   }});
}
