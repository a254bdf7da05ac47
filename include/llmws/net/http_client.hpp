#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace llmws::net {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

/// Percent-encodes a query-string component.
[[nodiscard]] std::string url_encode(const std::string &value);

/// `base` + `path` + `?k=v&...` with every value percent-encoded. Parameters are
/// emitted in the order given.
[[nodiscard]] std::string
build_url(const std::string &base, const std::string &path,
          const std::initializer_list<std::pair<std::string, std::string>> &query);

} // namespace llmws::net
