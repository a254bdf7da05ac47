#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace llmws::observability {

enum class LogLevel { Debug, Info, Warn, Error, Off };

struct InferenceStartEvent {
  std::string provider;
  std::string model;
  std::size_t target_count = 0;
};

struct InferenceEndEvent {
  std::chrono::milliseconds duration{0};
  std::optional<std::uint64_t> tokens_used;
  bool success = false;
};

struct AttemptFailedEvent {
  std::string target;
  std::string message;
};

struct BudgetRetryEvent {
  std::string target;
  std::uint64_t tokens_in = 0;
  std::uint64_t max_new_tokens = 0;
};

struct TranscriptAppendEvent {
  std::string session_file;
};

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<InferenceStartEvent, InferenceEndEvent, AttemptFailedEvent,
                                   BudgetRetryEvent, TranscriptAppendEvent, LogEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokensUsedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

} // namespace llmws::observability
