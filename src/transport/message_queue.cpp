#include "llmws/transport/message_queue.hpp"

#include "llmws/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace llmws::transport {

void MessageQueue::push_raw(const std::string &payload) {
  std::istringstream lines(payload);
  std::string line;
  while (std::getline(lines, line)) {
    // getline leaves the '\r' of CRLF endings; trim removes it.
    line = common::trim(line);
    if (line.empty()) {
      continue;
    }
    auto parsed = common::json_parse_object(line);
    if (!parsed.ok()) {
      continue;
    }
    push(std::move(parsed.value()));
  }
}

void MessageQueue::push(ParsedMessage message) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push(std::move(message));
  cv_.notify_one();
}

void MessageQueue::fail(const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!terminal_error_.has_value()) {
    terminal_error_ = error;
  }
  cv_.notify_all();
}

common::Result<ParsedMessage> MessageQueue::next(const std::chrono::milliseconds timeout) {
  const auto wait = std::max(timeout, std::chrono::milliseconds(1));
  std::unique_lock<std::mutex> lock(mutex_);
  const bool ready =
      cv_.wait_for(lock, wait, [this]() { return !queue_.empty() || terminal_error_.has_value(); });
  if (!queue_.empty()) {
    ParsedMessage message = std::move(queue_.front());
    queue_.pop();
    return common::Result<ParsedMessage>::success(std::move(message));
  }
  if (ready && terminal_error_.has_value()) {
    return common::Result<ParsedMessage>::failure(*terminal_error_);
  }
  return common::Result<ParsedMessage>::failure("LLMWS read timeout (" +
                                                std::to_string(timeout.count()) + "ms)");
}

std::size_t MessageQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::optional<std::string> MessageQueue::terminal_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return terminal_error_;
}

} // namespace llmws::transport
