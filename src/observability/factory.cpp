#include "llmws/observability/factory.hpp"

#include "llmws/observability/log_observer.hpp"

namespace llmws::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  if (level == LogLevel::Off) {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(level);
}

} // namespace llmws::observability
