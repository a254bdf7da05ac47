#pragma once

#include "llmws/common/result.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace llmws::transport {

/// Largest inbound message accepted; bigger ones close the socket with 1009.
constexpr std::size_t kMaxPayloadBytes = 25 * 1024 * 1024;

/// Error text returned by ITransport::receive when nothing arrived in time.
constexpr std::string_view kReceiveTimeout = "timeout";

constexpr std::uint16_t kCloseNormal = 1000;
constexpr std::uint16_t kCloseProtocolError = 1002;
constexpr std::uint16_t kCloseNoStatus = 1005;
constexpr std::uint16_t kCloseAbnormal = 1006;
constexpr std::uint16_t kCloseMessageTooBig = 1009;

struct WsUrl {
  bool secure = false;
  std::string host;
  std::uint16_t port = 0;
  std::string path = "/";
};

[[nodiscard]] common::Result<WsUrl> parse_ws_url(const std::string &url);

/// Sec-WebSocket-Accept value for a client key (RFC 6455 section 4.2.2).
[[nodiscard]] std::string websocket_accept_key(const std::string &client_key);

/// Symbolic errno name such as "ECONNREFUSED"; "E<number>" for unlisted values.
[[nodiscard]] std::string errno_name(int err);

enum class FrameKind { Text, Close };

struct InboundFrame {
  FrameKind kind = FrameKind::Text;
  /// Message text, or the close reason.
  std::string payload;
  std::uint16_t close_code = 0;
};

class ITransport {
public:
  virtual ~ITransport() = default;
  [[nodiscard]] virtual common::Status connect(const std::string &url,
                                               std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status send_text(const std::string &payload) = 0;
  [[nodiscard]] virtual common::Status send_close(std::uint16_t code,
                                                  const std::string &reason) = 0;
  /// Next complete text message or close frame. Fails with kReceiveTimeout when
  /// nothing arrived within `timeout`.
  [[nodiscard]] virtual common::Result<InboundFrame>
  receive(std::chrono::milliseconds timeout) = 0;
  /// Tears the connection down and unblocks a pending receive(). Safe to call
  /// from another thread.
  virtual void abort() = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
};

/// RFC 6455 client over a POSIX socket; `wss://` goes through OpenSSL.
class WebSocketTransport final : public ITransport {
public:
  WebSocketTransport() = default;
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  WebSocketTransport &operator=(const WebSocketTransport &) = delete;

  [[nodiscard]] common::Status connect(const std::string &url,
                                       std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status send_text(const std::string &payload) override;
  [[nodiscard]] common::Status send_close(std::uint16_t code, const std::string &reason) override;
  [[nodiscard]] common::Result<InboundFrame> receive(std::chrono::milliseconds timeout) override;
  void abort() override;
  [[nodiscard]] bool is_connected() const override { return connected_.load(); }

private:
  enum class ReadStatus { Ok, Timeout, Closed, Error };

  [[nodiscard]] common::Status open_socket(const WsUrl &url,
                                           std::chrono::steady_clock::time_point deadline,
                                           std::chrono::milliseconds timeout);
  [[nodiscard]] common::Status start_tls(const WsUrl &url, std::chrono::milliseconds timeout);
  [[nodiscard]] common::Status upgrade(const WsUrl &url, std::chrono::milliseconds timeout);
  [[nodiscard]] common::Status send_frame(std::uint8_t opcode, const std::string &payload);
  [[nodiscard]] bool write_all(const std::uint8_t *data, std::size_t size);
  [[nodiscard]] ReadStatus wait_readable(std::chrono::steady_clock::time_point deadline);
  [[nodiscard]] ReadStatus read_exact(std::uint8_t *data, std::size_t size);
  [[nodiscard]] long read_some(std::uint8_t *data, std::size_t size);
  void release();

  std::atomic<int> fd_{-1};
  SSL_CTX *ssl_ctx_ = nullptr;
  SSL *ssl_ = nullptr;
  std::mutex write_mutex_;
  std::mutex ssl_mutex_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> aborted_{false};
  std::atomic<bool> close_sent_{false};
  std::string rx_buffer_;
  std::string last_read_error_;
  std::string last_write_error_;
};

} // namespace llmws::transport
