#include "llmws/observability/global.hpp"

#include <mutex>

namespace llmws::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

void record_log(const LogLevel level, const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = level, .component = component, .message = message});
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_inference_start(const std::string &provider, const std::string &model,
                            const std::size_t target_count) {
  record_event(InferenceStartEvent{
      .provider = provider, .model = model, .target_count = target_count});
}

void record_inference_end(std::chrono::milliseconds duration, const bool success,
                          std::optional<std::uint64_t> tokens) {
  record_event(InferenceEndEvent{.duration = duration, .tokens_used = tokens, .success = success});
  record_metric(RequestLatencyMetric{.latency = duration});
  if (tokens.has_value()) {
    record_metric(TokensUsedMetric{.tokens = *tokens});
  }
}

void record_attempt_failed(const std::string &target, const std::string &message) {
  record_event(AttemptFailedEvent{.target = target, .message = message});
}

void record_budget_retry(const std::string &target, const std::uint64_t tokens_in,
                         const std::uint64_t max_new_tokens) {
  record_event(BudgetRetryEvent{
      .target = target, .tokens_in = tokens_in, .max_new_tokens = max_new_tokens});
}

void record_transcript_append(const std::string &session_file) {
  record_event(TranscriptAppendEvent{.session_file = session_file});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  record_log(LogLevel::Debug, component, message);
}

void log_warn(const std::string &component, const std::string &message) {
  record_log(LogLevel::Warn, component, message);
}

} // namespace llmws::observability
