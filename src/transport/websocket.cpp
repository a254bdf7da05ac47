#include "llmws/transport/websocket.hpp"

#include "llmws/common/fs.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace llmws::transport {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr std::size_t kMaxHandshakeBytes = 16 * 1024;
constexpr auto kPollSlice = std::chrono::milliseconds(100);

std::string encode_base64(const unsigned char *data, const std::size_t size) {
  const int out_len = 4 * static_cast<int>((size + 2) / 3);
  std::string out(static_cast<std::size_t>(out_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data, static_cast<int>(size));
  return out;
}

std::string random_websocket_key() {
  std::array<std::uint8_t, 16> bytes{};
  std::random_device rd;
  for (auto &byte : bytes) {
    byte = static_cast<std::uint8_t>(rd() & 0xFF);
  }
  return encode_base64(bytes.data(), bytes.size());
}

std::array<std::uint8_t, 4> random_mask() {
  std::array<std::uint8_t, 4> mask{};
  if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
    std::random_device rd;
    for (auto &byte : mask) {
      byte = static_cast<std::uint8_t>(rd() & 0xFF);
    }
  }
  return mask;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

int remaining_ms(const std::chrono::steady_clock::time_point deadline) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return static_cast<int>(std::max<long long>(0, remaining.count()));
}

void set_io_timeout(const int fd, const int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::string connect_timeout_message(const std::chrono::milliseconds timeout) {
  return "LLMWS connect timeout (" + std::to_string(timeout.count()) + "ms)";
}

struct HandshakeResponse {
  int status = 0;
  std::unordered_map<std::string, std::string> headers;
};

HandshakeResponse parse_handshake_response(const std::string &head) {
  HandshakeResponse response;
  std::istringstream stream(head);
  std::string line;
  if (std::getline(stream, line)) {
    std::istringstream status_line(common::trim(line));
    std::string version;
    std::string code;
    status_line >> version >> code;
    std::from_chars(code.data(), code.data() + code.size(), response.status);
  }
  while (std::getline(stream, line)) {
    line = common::trim(line);
    if (line.empty()) {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    response.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }
  return response;
}

} // namespace

common::Result<WsUrl> parse_ws_url(const std::string &url) {
  const std::string trimmed = common::trim(url);
  const auto scheme_end = trimmed.find("://");
  if (scheme_end == std::string::npos) {
    return common::Result<WsUrl>::failure("invalid websocket url: " + trimmed);
  }

  WsUrl out;
  const std::string scheme = common::to_lower(trimmed.substr(0, scheme_end));
  if (scheme == "ws") {
    out.port = 80;
  } else if (scheme == "wss") {
    out.secure = true;
    out.port = 443;
  } else {
    return common::Result<WsUrl>::failure("unsupported websocket scheme: " + scheme);
  }

  std::string rest = trimmed.substr(scheme_end + 3);
  if (const auto hash = rest.find('#'); hash != std::string::npos) {
    rest.erase(hash);
  }
  const auto path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  if (path_start != std::string::npos) {
    out.path = rest.substr(path_start);
    if (out.path.front() == '?') {
      out.path.insert(out.path.begin(), '/');
    }
  }
  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority.erase(0, at + 1);
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return common::Result<WsUrl>::failure("invalid websocket host: " + authority);
    }
    out.host = authority.substr(1, close - 1);
    const std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return common::Result<WsUrl>::failure("invalid websocket host: " + authority);
      }
      port_text = tail.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    out.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (out.host.empty()) {
    return common::Result<WsUrl>::failure("missing websocket host: " + trimmed);
  }
  if (!port_text.empty()) {
    unsigned int port = 0;
    const auto [ptr, ec] =
        std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 ||
        port > 65535) {
      return common::Result<WsUrl>::failure("invalid websocket port: " + port_text);
    }
    out.port = static_cast<std::uint16_t>(port);
  }
  return common::Result<WsUrl>::success(std::move(out));
}

std::string websocket_accept_key(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());
  return encode_base64(digest.data(), digest.size());
}

std::string errno_name(const int err) {
  switch (err) {
  case ECONNREFUSED:
    return "ECONNREFUSED";
  case ECONNRESET:
    return "ECONNRESET";
  case ECONNABORTED:
    return "ECONNABORTED";
  case ETIMEDOUT:
    return "ETIMEDOUT";
  case EHOSTUNREACH:
    return "EHOSTUNREACH";
  case EHOSTDOWN:
    return "EHOSTDOWN";
  case ENETUNREACH:
    return "ENETUNREACH";
  case ENETDOWN:
    return "ENETDOWN";
  case EADDRNOTAVAIL:
    return "EADDRNOTAVAIL";
  case EPIPE:
    return "EPIPE";
  case EAGAIN:
    return "EAGAIN";
  case EACCES:
    return "EACCES";
  case EPERM:
    return "EPERM";
  case EMFILE:
    return "EMFILE";
  case EINVAL:
    return "EINVAL";
  default:
    return "E" + std::to_string(err);
  }
}

WebSocketTransport::~WebSocketTransport() { release(); }

common::Status WebSocketTransport::connect(const std::string &url,
                                           const std::chrono::milliseconds timeout) {
  if (connected_.load()) {
    return common::Status::error("transport already connected");
  }
  auto parsed = parse_ws_url(url);
  if (!parsed.ok()) {
    return common::Status::error(parsed.error());
  }

  release();
  aborted_ = false;
  close_sent_ = false;
  rx_buffer_.clear();
  last_read_error_.clear();
  last_write_error_.clear();

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto status = open_socket(parsed.value(), deadline, timeout);
  if (!status.ok()) {
    release();
    return status;
  }

  // The TLS and HTTP handshakes run on a blocking socket bounded by the
  // remaining connect budget.
  set_io_timeout(fd_.load(), std::max(1, remaining_ms(deadline)));
  if (parsed.value().secure) {
    status = start_tls(parsed.value(), timeout);
    if (!status.ok()) {
      release();
      return status;
    }
  }
  status = upgrade(parsed.value(), timeout);
  if (!status.ok()) {
    release();
    return status;
  }
  set_io_timeout(fd_.load(), 0);

  connected_ = true;
  return common::Status::success();
}

common::Status WebSocketTransport::open_socket(const WsUrl &url,
                                               const std::chrono::steady_clock::time_point deadline,
                                               const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  const std::string port_text = std::to_string(url.port);
  const int rc = getaddrinfo(url.host.c_str(), port_text.c_str(), &hints, &results);
  if (rc != 0 || results == nullptr) {
    const std::string code = rc == EAI_AGAIN ? "EAI_AGAIN" : "ENOTFOUND";
    return common::Status::error("getaddrinfo " + code + " " + url.host);
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(results, freeaddrinfo);

  int last_error = ECONNREFUSED;
  for (const addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno;
      continue;
    }
    const int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        last_error = errno;
        ::close(fd);
        continue;
      }
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      int ready = 0;
      do {
        ready = ::poll(&pfd, 1, remaining_ms(deadline));
      } while (ready < 0 && errno == EINTR);
      if (ready == 0) {
        ::close(fd);
        return common::Status::error(connect_timeout_message(timeout));
      }
      if (ready < 0) {
        last_error = errno;
        ::close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        last_error = so_error;
        ::close(fd);
        continue;
      }
    }

    fcntl(fd, F_SETFL, flags);
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fd_ = fd;
    return common::Status::success();
  }

  if (last_error == ETIMEDOUT) {
    return common::Status::error(connect_timeout_message(timeout));
  }
  return common::Status::error("connect " + errno_name(last_error) + " " + url.host + ":" +
                               std::to_string(url.port));
}

common::Status WebSocketTransport::start_tls(const WsUrl &url,
                                             const std::chrono::milliseconds timeout) {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_ == nullptr) {
    return common::Status::error("failed to initialize TLS context: " + openssl_error_string());
  }
  SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);
  SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
  if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
    return common::Status::error("failed to load CA certificates: " + openssl_error_string());
  }

  ssl_ = SSL_new(ssl_ctx_);
  if (ssl_ == nullptr) {
    return common::Status::error("failed to allocate TLS session: " + openssl_error_string());
  }
  SSL_set_fd(ssl_, fd_.load());
  SSL_set_tlsext_host_name(ssl_, url.host.c_str());
  SSL_set1_host(ssl_, url.host.c_str());

  ERR_clear_error();
  errno = 0;
  const int rc = SSL_connect(ssl_);
  if (rc != 1) {
    const int err = SSL_get_error(ssl_, rc);
    if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return common::Status::error(connect_timeout_message(timeout));
    }
    const long verify = SSL_get_verify_result(ssl_);
    if (verify != X509_V_OK) {
      return common::Status::error(std::string("TLS certificate verification failed: ") +
                                   X509_verify_cert_error_string(verify));
    }
    return common::Status::error("TLS handshake failed: " + openssl_error_string());
  }
  return common::Status::success();
}

common::Status WebSocketTransport::upgrade(const WsUrl &url,
                                           const std::chrono::milliseconds timeout) {
  const std::string ws_key = random_websocket_key();
  const bool default_port = url.port == (url.secure ? 443 : 80);
  const std::string host =
      url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;

  std::ostringstream req;
  req << "GET " << url.path << " HTTP/1.1\r\n";
  req << "Host: " << host;
  if (!default_port) {
    req << ":" << url.port;
  }
  req << "\r\n";
  req << "Upgrade: websocket\r\n";
  req << "Connection: Upgrade\r\n";
  req << "Sec-WebSocket-Key: " << ws_key << "\r\n";
  req << "Sec-WebSocket-Version: 13\r\n";
  req << "\r\n";
  const std::string handshake = req.str();
  if (!write_all(reinterpret_cast<const std::uint8_t *>(handshake.data()), handshake.size())) {
    return common::Status::error("websocket handshake send failed: " + last_write_error_);
  }

  std::string response;
  std::array<std::uint8_t, 2048> buffer{};
  std::size_t header_end = std::string::npos;
  while (header_end == std::string::npos) {
    const long n = read_some(buffer.data(), buffer.size());
    if (n == 0) {
      return common::Status::error("socket hang up");
    }
    if (n < 0) {
      if (last_read_error_ == std::string(kReceiveTimeout)) {
        return common::Status::error(connect_timeout_message(timeout));
      }
      return common::Status::error(last_read_error_);
    }
    response.append(reinterpret_cast<const char *>(buffer.data()), static_cast<std::size_t>(n));
    header_end = response.find("\r\n\r\n");
    if (header_end == std::string::npos && response.size() > kMaxHandshakeBytes) {
      return common::Status::error("websocket handshake response too large");
    }
  }

  // Frames the server sent right behind the 101 response.
  rx_buffer_ = response.substr(header_end + 4);

  const HandshakeResponse parsed = parse_handshake_response(response.substr(0, header_end));
  if (parsed.status != 101) {
    return common::Status::error("Unexpected server response: " + std::to_string(parsed.status));
  }
  const auto upgrade_header = parsed.headers.find("upgrade");
  if (upgrade_header == parsed.headers.end() ||
      common::to_lower(upgrade_header->second) != "websocket") {
    return common::Status::error("Invalid Upgrade header");
  }
  const auto accept = parsed.headers.find("sec-websocket-accept");
  if (accept == parsed.headers.end() || accept->second != websocket_accept_key(ws_key)) {
    return common::Status::error("Invalid Sec-WebSocket-Accept header");
  }
  return common::Status::success();
}

common::Status WebSocketTransport::send_text(const std::string &payload) {
  if (!connected_.load()) {
    return common::Status::error("WebSocket is not open");
  }
  return send_frame(0x1, payload);
}

common::Status WebSocketTransport::send_close(const std::uint16_t code, const std::string &reason) {
  if (close_sent_.exchange(true)) {
    return common::Status::success();
  }
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  payload += reason.substr(0, 123);
  return send_frame(0x8, payload);
}

common::Status WebSocketTransport::send_frame(const std::uint8_t opcode,
                                              const std::string &payload) {
  if (fd_.load() < 0) {
    return common::Status::error("WebSocket is not open");
  }

  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<std::uint8_t>(0x80 | (opcode & 0x0F)));

  // Client frames are always masked.
  const std::size_t len = payload.size();
  if (len <= 125) {
    frame.push_back(static_cast<std::uint8_t>(0x80 | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(0x80 | 126);
    frame.push_back(static_cast<std::uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(len & 0xFF));
  } else {
    frame.push_back(0x80 | 127);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(len) >> shift) & 0xFF));
    }
  }

  const auto mask = random_mask();
  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < len; ++i) {
    frame.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]);
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!write_all(frame.data(), frame.size())) {
    return common::Status::error(last_write_error_);
  }
  return common::Status::success();
}

bool WebSocketTransport::write_all(const std::uint8_t *data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    if (ssl_ != nullptr) {
      std::lock_guard<std::mutex> lock(ssl_mutex_);
      const int n = SSL_write(ssl_, data + sent, static_cast<int>(size - sent));
      if (n <= 0) {
        last_write_error_ = "TLS write failed: " + openssl_error_string();
        return false;
      }
      sent += static_cast<std::size_t>(n);
      continue;
    }
    const int fd = fd_.load();
    if (fd < 0) {
      last_write_error_ = "write EPIPE";
      return false;
    }
    const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      last_write_error_ = "write " + errno_name(n < 0 ? errno : EPIPE);
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

long WebSocketTransport::read_some(std::uint8_t *data, const std::size_t size) {
  if (ssl_ != nullptr) {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    ERR_clear_error();
    errno = 0;
    const int n = SSL_read(ssl_, data, static_cast<int>(size));
    if (n > 0) {
      return n;
    }
    const int err = SSL_get_error(ssl_, n);
    if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && errno == 0)) {
      return 0;
    }
    if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      last_read_error_ = std::string(kReceiveTimeout);
    } else if (err == SSL_ERROR_SYSCALL) {
      last_read_error_ = "read " + errno_name(errno);
    } else {
      last_read_error_ = "TLS read failed: " + openssl_error_string();
    }
    return -1;
  }

  const int fd = fd_.load();
  if (fd < 0) {
    return 0;
  }
  ssize_t n = 0;
  do {
    n = ::recv(fd, data, size, 0);
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    last_read_error_ = (errno == EAGAIN || errno == EWOULDBLOCK) ? std::string(kReceiveTimeout)
                                                                 : "read " + errno_name(errno);
  }
  return static_cast<long>(n);
}

WebSocketTransport::ReadStatus
WebSocketTransport::wait_readable(const std::chrono::steady_clock::time_point deadline) {
  while (true) {
    if (aborted_.load()) {
      return ReadStatus::Closed;
    }
    if (!rx_buffer_.empty()) {
      return ReadStatus::Ok;
    }
    if (ssl_ != nullptr) {
      std::lock_guard<std::mutex> lock(ssl_mutex_);
      if (SSL_pending(ssl_) > 0) {
        return ReadStatus::Ok;
      }
    }
    const int fd = fd_.load();
    if (fd < 0) {
      return ReadStatus::Closed;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return ReadStatus::Timeout;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice);
    const int slice_ms = std::max(
        1, static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(slice).count()));

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, slice_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_read_error_ = "read " + errno_name(errno);
      return ReadStatus::Error;
    }
    if (ready > 0) {
      return ReadStatus::Ok;
    }
  }
}

WebSocketTransport::ReadStatus WebSocketTransport::read_exact(std::uint8_t *data,
                                                              const std::size_t size) {
  std::size_t received = 0;
  if (!rx_buffer_.empty()) {
    const std::size_t take = std::min(size, rx_buffer_.size());
    std::memcpy(data, rx_buffer_.data(), take);
    rx_buffer_.erase(0, take);
    received = take;
  }
  while (received < size) {
    // Mid-frame waits have no deadline; abort() is the way out.
    ReadStatus ready = ReadStatus::Timeout;
    while (ready == ReadStatus::Timeout) {
      ready = wait_readable(std::chrono::steady_clock::now() + kPollSlice);
    }
    if (ready != ReadStatus::Ok) {
      return ready;
    }
    const long n = read_some(data + received, size - received);
    if (n == 0) {
      return ReadStatus::Closed;
    }
    if (n < 0) {
      return aborted_.load() ? ReadStatus::Closed : ReadStatus::Error;
    }
    received += static_cast<std::size_t>(n);
  }
  return ReadStatus::Ok;
}

common::Result<InboundFrame> WebSocketTransport::receive(const std::chrono::milliseconds timeout) {
  using Out = common::Result<InboundFrame>;
  if (!connected_.load()) {
    return Out::failure("WebSocket is not open");
  }

  const auto abnormal_close = [this]() {
    connected_ = false;
    return Out::success(InboundFrame{.kind = FrameKind::Close, .payload = "", .close_code = kCloseAbnormal});
  };
  const auto read_failure = [this]() {
    connected_ = false;
    return Out::failure(last_read_error_.empty() ? "read ECONNRESET" : last_read_error_);
  };
  const auto protocol_error = [this](const std::string &message) {
    (void)send_close(kCloseProtocolError, "");
    connected_ = false;
    return Out::failure(message);
  };
  const auto check = [&](const ReadStatus status) -> std::optional<Out> {
    if (status == ReadStatus::Closed) {
      return abnormal_close();
    }
    if (status == ReadStatus::Error) {
      return read_failure();
    }
    return std::nullopt;
  };

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string message;
  bool in_message = false;

  while (true) {
    if (!in_message) {
      const ReadStatus ready = wait_readable(deadline);
      if (ready == ReadStatus::Timeout) {
        return Out::failure(std::string(kReceiveTimeout));
      }
      if (auto out = check(ready)) {
        return *out;
      }
    }

    std::array<std::uint8_t, 2> header{};
    if (auto out = check(read_exact(header.data(), header.size()))) {
      return *out;
    }
    const bool fin = (header[0] & 0x80) != 0;
    const std::uint8_t opcode = header[0] & 0x0F;
    const bool masked = (header[1] & 0x80) != 0;
    if ((header[0] & 0x70) != 0) {
      return protocol_error("Invalid WebSocket frame: RSV bits must be clear");
    }
    if (masked) {
      return protocol_error("Invalid WebSocket frame: MASK must be clear");
    }

    std::uint64_t payload_len = header[1] & 0x7F;
    if (payload_len == 126) {
      std::array<std::uint8_t, 2> ext{};
      if (auto out = check(read_exact(ext.data(), ext.size()))) {
        return *out;
      }
      payload_len = (static_cast<std::uint64_t>(ext[0]) << 8) | ext[1];
    } else if (payload_len == 127) {
      std::array<std::uint8_t, 8> ext{};
      if (auto out = check(read_exact(ext.data(), ext.size()))) {
        return *out;
      }
      payload_len = 0;
      for (const auto byte : ext) {
        payload_len = (payload_len << 8) | byte;
      }
    }

    const bool control = opcode >= 0x8;
    if (control && (!fin || payload_len > 125)) {
      return protocol_error("Invalid WebSocket frame: invalid control frame");
    }
    if (!control && message.size() + payload_len > kMaxPayloadBytes) {
      (void)send_close(kCloseMessageTooBig, "");
      connected_ = false;
      return Out::failure("Max payload size exceeded");
    }

    std::string payload(static_cast<std::size_t>(payload_len), '\0');
    if (payload_len > 0) {
      if (auto out = check(read_exact(reinterpret_cast<std::uint8_t *>(payload.data()),
                                      payload.size()))) {
        return *out;
      }
    }

    switch (opcode) {
    case 0x0:
      if (!in_message) {
        return protocol_error("Invalid WebSocket frame: unexpected continuation frame");
      }
      message += payload;
      break;
    case 0x1:
    case 0x2:
      if (in_message) {
        return protocol_error("Invalid WebSocket frame: expected continuation frame");
      }
      message = std::move(payload);
      in_message = true;
      break;
    case 0x8: {
      std::uint16_t code = kCloseNoStatus;
      std::string reason;
      if (payload.size() >= 2) {
        code = static_cast<std::uint16_t>((static_cast<std::uint8_t>(payload[0]) << 8) |
                                          static_cast<std::uint8_t>(payload[1]));
        reason = payload.substr(2);
      }
      (void)send_close(code == kCloseNoStatus ? kCloseNormal : code, "");
      connected_ = false;
      return Out::success(
          InboundFrame{.kind = FrameKind::Close, .payload = std::move(reason), .close_code = code});
    }
    case 0x9: {
      auto pong = send_frame(0xA, payload);
      if (!pong.ok()) {
        connected_ = false;
        return Out::failure(pong.error());
      }
      continue;
    }
    case 0xA:
      continue;
    default:
      return protocol_error("Invalid WebSocket frame: invalid opcode " + std::to_string(opcode));
    }

    if (fin && in_message) {
      return Out::success(InboundFrame{.kind = FrameKind::Text, .payload = std::move(message)});
    }
  }
}

void WebSocketTransport::abort() {
  aborted_ = true;
  connected_ = false;
  const int fd = fd_.load();
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

void WebSocketTransport::release() {
  if (ssl_ != nullptr) {
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (ssl_ctx_ != nullptr) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
  const int fd = fd_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
  connected_ = false;
}

} // namespace llmws::transport
