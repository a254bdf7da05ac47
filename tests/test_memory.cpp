#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "llmws/common/text.hpp"
#include "llmws/memory/http_search.hpp"

namespace {

llmws::net::HttpResponse response(std::uint16_t status, std::string body) {
  llmws::net::HttpResponse out;
  out.status = status;
  out.body = std::move(body);
  return out;
}

llmws::config::MemoryHttpConfig http_config() {
  llmws::config::MemoryHttpConfig config;
  config.base_url = "http://mem.local:8000/";
  config.timeout_ms = 1500;
  config.max_results = 6;
  return config;
}

} // namespace

void register_memory_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace memory = llmws::memory;
  namespace net = llmws::net;
  namespace testing = llmws::testing;

  tests.push_back({"url_helpers_percent_encode", [] {
                     require(net::url_encode("a b&c/d~e.f_g-h") == "a%20b%26c%2Fd~e.f_g-h",
                             net::url_encode("a b&c/d~e.f_g-h"));
                     require(net::url_encode("\xC3\xA9") == "%C3%A9", "utf-8 bytes");
                     require(net::build_url("http://h/", "/search", {{"q", "x y"}, {"limit", "3"}}) ==
                                 "http://h/search?q=x%20y&limit=3",
                             "query in order");
                     require(net::build_url("http://h", "/p", {}) == "http://h/p", "no query");
                   }});

  tests.push_back({"http_memory_search_builds_request", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>(
                         response(200, "{\"items\":[]}"));
                     auto config = http_config();
                     config.api_key = "secret";
                     config.headers = {{"x-tenant", "t1"}, {"accept", "text/plain"}};
                     memory::HttpMemorySearch search(config, http);
                     auto result = search.search("  where is the key? ", {});
                     require(result.ok() && result.value().empty(), "empty result set");
                     require(http->requests().size() == 1, "one request");
                     const auto &request = http->requests()[0];
                     require(request.url == "http://mem.local:8000/search?q=where%20is%20the%20key%3F"
                                            "&mode=hybrid&limit=6",
                             request.url);
                     require(request.timeout_ms == 1500, "configured timeout");
                     require(request.headers.at("authorization") == "Bearer secret", "bearer");
                     require(request.headers.at("x-tenant") == "t1", "custom header");
                     require(request.headers.at("accept") == "text/plain",
                             "configured headers override defaults");
                   }});

  tests.push_back({"http_memory_search_limit_from_options", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>(response(200, ""));
                     memory::HttpMemorySearch search(http_config(), http);
                     memory::SearchOptions options;
                     options.max_results = 2;
                     auto result = search.search("q", options);
                     require(result.ok(), "empty body accepted");
                     require(http->requests()[0].url.find("&limit=2") != std::string::npos,
                             "limit from options");
                   }});

  tests.push_back({"http_memory_search_parses_items", [] {
                     const std::string long_text(800, 'z');
                     auto http = std::make_shared<testing::FakeHttpClient>(response(
                         200, "{\"items\":["
                              "{\"id\":\"n1\",\"text\":\"  line one\\nline two \",\"score\":0.9},"
                              "{\"id\":\"n2\",\"text\":\"low\",\"score\":\"0.1\"},"
                              "{\"id\":\" \",\"text\":\"no id\"},"
                              "{\"id\":\"n3\",\"text\":\"\"},"
                              "7,"
                              "{\"id\":\"n4\",\"text\":\"" + long_text + "\",\"score\":\"bad\"}"
                              "]}"));
                     memory::HttpMemorySearch search(http_config(), http);
                     auto result = search.search("q", {});
                     require(result.ok(), "parsed");
                     const auto &items = result.value();
                     require(items.size() == 3, "invalid rows skipped");
                     require(items[0].path == "zigmem:n1", "prefixed path");
                     require(items[0].snippet == "line one\nline two", "trimmed snippet");
                     require(items[0].score == 0.9, "numeric score");
                     require(items[0].start_line == 1 && items[0].end_line == 2, "line span");
                     require(items[1].score == 0.1, "string score");
                     require(items[2].score == 0.0, "unparsable score");
                     require(llmws::common::utf8_length(items[2].snippet) == memory::kSnippetMaxChars,
                             "long snippet clipped");
                   }});

  tests.push_back({"http_memory_search_applies_min_score", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>(response(
                         200, "{\"items\":[{\"id\":\"a\",\"text\":\"keep\",\"score\":0.8},"
                              "{\"id\":\"b\",\"text\":\"drop\",\"score\":0.2}]}"));
                     memory::HttpMemorySearch search(http_config(), http);
                     memory::SearchOptions options;
                     options.min_score = 0.5;
                     auto result = search.search("q", options);
                     require(result.ok() && result.value().size() == 1 &&
                                 result.value()[0].snippet == "keep",
                             "below threshold dropped");
                   }});

  tests.push_back({"http_memory_search_blank_query_skips_request", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>(response(200, "{}"));
                     memory::HttpMemorySearch search(http_config(), http);
                     auto result = search.search("   ", {});
                     require(result.ok() && result.value().empty(), "no results");
                     require(http->requests().empty(), "no request sent");
                   }});

  tests.push_back({"http_memory_search_reports_http_errors", [] {
                     auto with_detail = std::make_shared<testing::FakeHttpClient>(
                         response(503, "{\"detail\":\" index warming up \"}"));
                     memory::HttpMemorySearch first(http_config(), with_detail);
                     auto failed = first.search("q", {});
                     require(!failed.ok() &&
                                 failed.error() == "zigmem request failed (503): index warming up",
                             failed.ok() ? "unexpected success" : failed.error());

                     auto bare = std::make_shared<testing::FakeHttpClient>(response(404, ""));
                     memory::HttpMemorySearch second(http_config(), bare);
                     auto missing = second.search("q", {});
                     require(!missing.ok() && missing.error() == "zigmem request failed (404)",
                             "status only");

                     auto garbage = std::make_shared<testing::FakeHttpClient>(
                         response(200, "<html>oops</html>"));
                     memory::HttpMemorySearch third(http_config(), garbage);
                     auto invalid = third.search("q", {});
                     require(!invalid.ok() && invalid.error() == "zigmem invalid JSON (200)",
                             "non-json body");
                   }});

  tests.push_back({"http_memory_search_reports_network_errors", [] {
                     net::HttpResponse timed_out;
                     timed_out.network_error = true;
                     timed_out.timeout = true;
                     memory::HttpMemorySearch slow(
                         http_config(), std::make_shared<testing::FakeHttpClient>(timed_out));
                     auto timeout = slow.search("q", {});
                     require(!timeout.ok() &&
                                 timeout.error() == "zigmem request timed out after 1500ms",
                             "timeout message");

                     net::HttpResponse refused;
                     refused.network_error = true;
                     refused.network_error_message = "Couldn't connect to server";
                     memory::HttpMemorySearch down(
                         http_config(), std::make_shared<testing::FakeHttpClient>(refused));
                     auto failed = down.search("q", {});
                     require(!failed.ok() &&
                                 failed.error() ==
                                     "zigmem request failed: Couldn't connect to server",
                             "network message");
                   }});

  tests.push_back({"create_memory_search_by_backend", [] {
                     llmws::config::MemoryConfig config;
                     require(memory::create_memory_search(config) == nullptr,
                             "builtin backend injects nothing");
                     config.backend = " HTTP ";
                     auto search = memory::create_memory_search(config);
                     require(search != nullptr && search->name() == "http", "http backend");
                   }});
}
