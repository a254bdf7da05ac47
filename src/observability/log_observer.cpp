#include "llmws/observability/log_observer.hpp"

#include "llmws/common/fs.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace llmws::observability {

namespace {

std::mutex g_log_mutex;

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  if (normalized == "off") {
    return LogLevel::Off;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    break;
  }
  return "OFF";
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (min_level_ == LogLevel::Off || level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InferenceStartEvent>) {
          log_line(LogLevel::Info, "inference.start provider=" + evt.provider +
                                       " model=" + evt.model +
                                       " targets=" + std::to_string(evt.target_count));
        } else if constexpr (std::is_same_v<T, InferenceEndEvent>) {
          std::string line = "inference.end duration_ms=" + std::to_string(evt.duration.count()) +
                             " success=" + (evt.success ? "true" : "false");
          if (evt.tokens_used.has_value()) {
            line += " tokens=" + std::to_string(*evt.tokens_used);
          }
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, AttemptFailedEvent>) {
          log_line(LogLevel::Warn, "attempt.failed target=" + evt.target + " error=" + evt.message);
        } else if constexpr (std::is_same_v<T, BudgetRetryEvent>) {
          log_line(LogLevel::Warn, "attempt.budget_retry target=" + evt.target +
                                       " tokens_in=" + std::to_string(evt.tokens_in) +
                                       " max_new_tokens=" + std::to_string(evt.max_new_tokens));
        } else if constexpr (std::is_same_v<T, TranscriptAppendEvent>) {
          log_line(LogLevel::Debug, "transcript.append file=" + evt.session_file);
        } else if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line(LogLevel::Debug, "metric.tokens_used=" + std::to_string(m.tokens));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_.flush();
}

} // namespace llmws::observability
