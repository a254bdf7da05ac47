#pragma once

#include "llmws/common/json_util.hpp"
#include "llmws/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace llmws::transport {

/// A decoded inbound protocol message: the members of one JSON object line.
using ParsedMessage = common::JsonObject;

/// Buffers messages between the socket reader thread and the consumer.
///
/// Buffered messages are always delivered before a terminal error. Once the
/// buffer is drained, every call to next() fails with the first error passed to
/// fail(); later failures are ignored.
class MessageQueue {
public:
  MessageQueue() = default;

  /// Splits a text payload into lines and enqueues each line that parses as a
  /// JSON object. Anything else is dropped.
  void push_raw(const std::string &payload);
  void push(ParsedMessage message);
  void fail(const std::string &error);

  [[nodiscard]] common::Result<ParsedMessage> next(std::chrono::milliseconds timeout);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::optional<std::string> terminal_error() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<ParsedMessage> queue_;
  std::optional<std::string> terminal_error_;
};

} // namespace llmws::transport
