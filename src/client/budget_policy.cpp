#include "llmws/client/budget_policy.hpp"

#include "llmws/common/json_util.hpp"

#include <cmath>
#include <string>

namespace llmws::client {

common::Result<std::optional<double>>
DoublingBudgetPolicy::evaluate(const double tokens_in, const double max_tokens,
                               const std::optional<double> requested) const {
  using Out = common::Result<std::optional<double>>;
  if (!(tokens_in > 0) || max_tokens > tokens_in) {
    return Out::success(std::nullopt);
  }
  if (!requested.has_value() || !std::isfinite(*requested) || *requested <= 0) {
    return Out::failure("LLMWS server token budget invalid (tokens_in=" +
                        common::json_number(tokens_in) +
                        ", max_tokens=" + common::json_number(max_tokens) +
                        "). Configure llmws.config.maxNewTokens (or update llmws_server.py).");
  }
  return Out::success(std::floor(tokens_in * 2 + *requested));
}

common::Result<std::optional<double>>
DisabledBudgetPolicy::evaluate(double /*tokens_in*/, double /*max_tokens*/,
                               std::optional<double> /*requested*/) const {
  return common::Result<std::optional<double>>::success(std::nullopt);
}

} // namespace llmws::client
