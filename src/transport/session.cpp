#include "llmws/transport/session.hpp"

#include "llmws/observability/global.hpp"

#include <algorithm>

namespace llmws::transport {

namespace {

constexpr auto kReaderPoll = std::chrono::milliseconds(200);

} // namespace

SocketSession::SocketSession(std::unique_ptr<ITransport> transport)
    : transport_(std::move(transport)) {}

SocketSession::~SocketSession() { close(); }

void SocketSession::start() {
  if (reader_.joinable()) {
    return;
  }
  reader_ = std::thread([this]() { reader_loop(); });
}

common::Status SocketSession::send(const std::string &payload) {
  if (!transport_->is_connected()) {
    if (auto error = queue_.terminal_error(); error.has_value()) {
      return common::Status::error(*error);
    }
    return common::Status::error("WebSocket is not open");
  }
  return transport_->send_text(payload);
}

common::Result<ParsedMessage> SocketSession::next(const std::chrono::milliseconds timeout) {
  return queue_.next(timeout);
}

void SocketSession::reader_loop() {
  while (!stopping_.load()) {
    auto frame = transport_->receive(kReaderPoll);
    if (!frame.ok()) {
      if (frame.error() == kReceiveTimeout) {
        continue;
      }
      if (!stopping_.load()) {
        observability::log_debug("transport", "socket error: " + frame.error());
      }
      queue_.fail(frame.error());
      break;
    }
    if (frame.value().kind == FrameKind::Close) {
      queue_.fail("LLMWS socket closed (" + std::to_string(frame.value().close_code) +
                  "): " + frame.value().payload);
      break;
    }
    queue_.push_raw(frame.value().payload);
  }
  mark_reader_done();
}

void SocketSession::mark_reader_done() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  reader_done_ = true;
  reader_done_cv_.notify_all();
}

void SocketSession::close() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }

  if (transport_->is_connected() && reader_.joinable()) {
    auto status = transport_->send_close(kCloseNormal, "");
    if (!status.ok()) {
      observability::log_debug("transport", "close frame not sent: " + status.error());
    } else {
      std::unique_lock<std::mutex> lock(state_mutex_);
      const bool acknowledged =
          reader_done_cv_.wait_for(lock, kCloseGrace, [this]() { return reader_done_; });
      if (!acknowledged) {
        observability::log_debug("transport", "peer did not answer close; terminating");
      }
    }
  }

  stopping_ = true;
  transport_->abort();
  if (reader_.joinable()) {
    reader_.join();
  }
  queue_.fail("LLMWS socket closed (" + std::to_string(kCloseNormal) + "): ");
}

WebSocketConnector::WebSocketConnector()
    : factory_([]() { return std::make_unique<WebSocketTransport>(); }) {}

WebSocketConnector::WebSocketConnector(TransportFactory factory) : factory_(std::move(factory)) {}

common::Result<std::unique_ptr<Connection>>
WebSocketConnector::open(const std::string &url, const std::chrono::milliseconds connect_timeout) {
  using Out = common::Result<std::unique_ptr<Connection>>;
  auto transport = factory_();
  const auto timeout = std::max(connect_timeout, std::chrono::milliseconds(1));
  auto status = transport->connect(url, timeout);
  if (!status.ok()) {
    return Out::failure(status.error());
  }
  auto session = std::make_unique<SocketSession>(std::move(transport));
  session->start();
  return Out::success(std::move(session));
}

} // namespace llmws::transport
