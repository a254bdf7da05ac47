#include "llmws/memory/http_search.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace llmws::memory {

namespace {

std::optional<double> as_number(const common::JsonValue &value) {
  if (value.kind != common::JsonKind::Number && value.kind != common::JsonKind::String) {
    return std::nullopt;
  }
  const std::string text = common::trim(value.text);
  if (text.empty()) {
    return std::nullopt;
  }
  double parsed = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::string clip_snippet(const std::string &text) {
  const std::string trimmed = common::trim(text);
  return common::clip_with_ellipsis(trimmed, kSnippetMaxChars);
}

} // namespace

HttpMemorySearch::HttpMemorySearch(config::MemoryHttpConfig config,
                                   std::shared_ptr<net::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

common::Result<std::vector<MemorySnippet>>
HttpMemorySearch::search(const std::string &query, const SearchOptions &options) {
  using Out = common::Result<std::vector<MemorySnippet>>;
  const std::string cleaned = common::trim(query);
  if (cleaned.empty()) {
    return Out::success({});
  }
  const std::size_t limit = options.max_results.value_or(0) > 0
                                ? *options.max_results
                                : std::max<std::size_t>(1, config_.max_results);

  const std::string url = net::build_url(config_.base_url, "/search",
                                         {{"q", cleaned},
                                          {"mode", config_.mode},
                                          {"limit", std::to_string(limit)}});
  auto body = request_json(url);
  if (!body.ok()) {
    return Out::failure(body.error());
  }

  std::vector<MemorySnippet> out;
  const auto items = common::json_array_field(body.value(), "items");
  if (!items.has_value()) {
    return Out::success(std::move(out));
  }
  for (const auto &item : *items) {
    if (!item.is_object()) {
      continue;
    }
    auto row = common::json_parse_object(item.text);
    if (!row.ok()) {
      continue;
    }
    const auto id = common::json_string_field(row.value(), "id");
    const auto text = common::json_string_field(row.value(), "text");
    if (!id.has_value() || common::trim(*id).empty() || !text.has_value() || text->empty()) {
      continue;
    }
    double score = 0.0;
    if (const auto it = row.value().find("score"); it != row.value().end()) {
      score = as_number(it->second).value_or(0.0);
    }
    if (options.min_score.has_value() && score < *options.min_score) {
      continue;
    }
    MemorySnippet snippet;
    snippet.path = config_.path_prefix + ":" + common::trim(*id);
    snippet.snippet = clip_snippet(*text);
    snippet.score = score;
    snippet.end_line = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::count(snippet.snippet.begin(), snippet.snippet.end(), '\n')) + 1);
    out.push_back(std::move(snippet));
  }
  return Out::success(std::move(out));
}

common::Result<common::JsonObject> HttpMemorySearch::request_json(const std::string &url) {
  using Out = common::Result<common::JsonObject>;
  const net::HttpResponse response = http_->get(url, build_headers(), config_.timeout_ms);
  if (response.network_error) {
    const std::string message =
        response.timeout
            ? "zigmem request timed out after " + std::to_string(config_.timeout_ms) + "ms"
            : "zigmem request failed: " + response.network_error_message;
    observability::log_debug("memory", message);
    return Out::failure(message);
  }

  common::JsonObject parsed;
  const std::string status = std::to_string(response.status);
  if (!common::trim(response.body).empty()) {
    auto object = common::json_parse_object(response.body);
    if (object.ok()) {
      parsed = std::move(object.value());
    } else if (!common::json_parse_array(response.body).ok()) {
      return Out::failure("zigmem invalid JSON (" + status + ")");
    }
  }

  if (response.status < 200 || response.status >= 300) {
    std::string message = "zigmem request failed (" + status + ")";
    if (const auto detail = common::json_string_field(parsed, "detail");
        detail.has_value() && !common::trim(*detail).empty()) {
      message += ": " + common::trim(*detail);
    }
    observability::log_debug("memory", message);
    return Out::failure(message);
  }
  return Out::success(std::move(parsed));
}

net::HttpHeaders HttpMemorySearch::build_headers() const {
  net::HttpHeaders headers{{"accept", "application/json"}};
  for (const auto &[key, value] : config_.headers) {
    headers[key] = value;
  }
  if (!config_.api_key.empty()) {
    headers["authorization"] = "Bearer " + config_.api_key;
  }
  return headers;
}

std::unique_ptr<MemorySearch> create_memory_search(const config::MemoryConfig &config) {
  if (common::to_lower(common::trim(config.backend)) != "http") {
    return nullptr;
  }
  return std::make_unique<HttpMemorySearch>(config.http, std::make_shared<net::CurlHttpClient>());
}

} // namespace llmws::memory
