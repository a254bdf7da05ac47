#pragma once

#include "llmws/common/json_util.hpp"
#include "llmws/memory/memory.hpp"
#include "llmws/net/http_client.hpp"

#include <memory>

namespace llmws::memory {

/// Snippets longer than this are clipped with an ellipsis.
constexpr std::size_t kSnippetMaxChars = 700;

/// Client for an external memory-search service:
/// `GET <base>/search?q=&mode=&limit=` answering `{"items":[{"id","text","score"}]}`.
class HttpMemorySearch final : public MemorySearch {
public:
  HttpMemorySearch(config::MemoryHttpConfig config, std::shared_ptr<net::HttpClient> http);

  [[nodiscard]] std::string_view name() const override { return "http"; }
  [[nodiscard]] common::Result<std::vector<MemorySnippet>>
  search(const std::string &query, const SearchOptions &options) override;

private:
  [[nodiscard]] common::Result<common::JsonObject> request_json(const std::string &url);
  [[nodiscard]] net::HttpHeaders build_headers() const;

  config::MemoryHttpConfig config_;
  std::shared_ptr<net::HttpClient> http_;
};

} // namespace llmws::memory
