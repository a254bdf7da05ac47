#pragma once

#include "llmws/common/result.hpp"
#include "llmws/transport/message_queue.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace llmws::transport {

/// One open socket to an inference server, speaking newline-delimited JSON.
class Connection {
public:
  virtual ~Connection() = default;
  [[nodiscard]] virtual common::Status send(const std::string &payload) = 0;
  [[nodiscard]] virtual common::Result<ParsedMessage> next(std::chrono::milliseconds timeout) = 0;
  /// Closes gracefully when possible. Idempotent.
  virtual void close() = 0;
};

class Connector {
public:
  virtual ~Connector() = default;
  [[nodiscard]] virtual common::Result<std::unique_ptr<Connection>>
  open(const std::string &url, std::chrono::milliseconds connect_timeout) = 0;
};

} // namespace llmws::transport
