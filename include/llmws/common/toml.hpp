#pragma once

#include "llmws/common/result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmws::common {

/// Flat view of a TOML file: `[a."b.c"]` + `key` is stored as `a.b.c.key`, and
/// the N-th `[[list]]` table contributes keys `list.N.key`.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::unordered_map<std::string, std::size_t> table_arrays;
  /// `[section]` headers in first-seen order.
  std::vector<std::string> sections;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  /// Number of `[[key]]` tables seen.
  [[nodiscard]] std::size_t table_array_size(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace llmws::common
