#pragma once

#include "llmws/observability/observer.hpp"

#include <memory>

namespace llmws::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_inference_start(const std::string &provider, const std::string &model,
                            std::size_t target_count);
void record_inference_end(std::chrono::milliseconds duration, bool success,
                          std::optional<std::uint64_t> tokens = std::nullopt);
void record_attempt_failed(const std::string &target, const std::string &message);
void record_budget_retry(const std::string &target, std::uint64_t tokens_in,
                         std::uint64_t max_new_tokens);
void record_transcript_append(const std::string &session_file);
void record_error(const std::string &component, const std::string &message);

void log_debug(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);

} // namespace llmws::observability
