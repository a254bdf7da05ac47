#pragma once

#include "llmws/common/result.hpp"
#include "llmws/config/schema.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmws::memory {

struct MemorySnippet {
  /// `<path_prefix>:<id>`
  std::string path;
  std::string snippet;
  double score = 0.0;
  std::size_t start_line = 1;
  std::size_t end_line = 1;
};

struct SearchOptions {
  std::optional<std::size_t> max_results;
  std::optional<double> min_score;
};

class MemorySearch {
public:
  virtual ~MemorySearch() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemorySnippet>>
  search(const std::string &query, const SearchOptions &options) = 0;
};

/// The search backend for `[memory]`, or nullptr for the builtin backend, which
/// never injects snippets into prompts.
[[nodiscard]] std::unique_ptr<MemorySearch> create_memory_search(const config::MemoryConfig &config);

} // namespace llmws::memory
