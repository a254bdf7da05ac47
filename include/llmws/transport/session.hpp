#pragma once

#include "llmws/transport/connection.hpp"
#include "llmws/transport/message_queue.hpp"
#include "llmws/transport/websocket.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace llmws::transport {

/// How long close() waits for the peer's close frame before tearing down.
constexpr std::chrono::milliseconds kCloseGrace{1000};

/// A connected transport plus a reader thread that feeds a MessageQueue.
///
/// Every text message is split into JSON lines and queued. A close frame, a
/// read error or an oversized message fails the queue; buffered messages are
/// still delivered first.
class SocketSession final : public Connection {
public:
  explicit SocketSession(std::unique_ptr<ITransport> transport);
  ~SocketSession() override;

  SocketSession(const SocketSession &) = delete;
  SocketSession &operator=(const SocketSession &) = delete;

  /// Starts the reader thread. The transport must already be connected.
  void start();

  [[nodiscard]] common::Status send(const std::string &payload) override;
  [[nodiscard]] common::Result<ParsedMessage> next(std::chrono::milliseconds timeout) override;
  void close() override;

private:
  void reader_loop();
  void mark_reader_done();

  std::unique_ptr<ITransport> transport_;
  MessageQueue queue_;
  std::thread reader_;
  std::atomic<bool> stopping_{false};
  std::mutex state_mutex_;
  std::condition_variable reader_done_cv_;
  bool reader_done_ = false;
  bool closed_ = false;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

/// Opens SocketSessions over WebSocketTransport (or a supplied transport).
class WebSocketConnector final : public Connector {
public:
  WebSocketConnector();
  explicit WebSocketConnector(TransportFactory factory);

  [[nodiscard]] common::Result<std::unique_ptr<Connection>>
  open(const std::string &url, std::chrono::milliseconds connect_timeout) override;

private:
  TransportFactory factory_;
};

} // namespace llmws::transport
