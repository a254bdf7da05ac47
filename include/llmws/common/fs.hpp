#pragma once

#include "llmws/common/result.hpp"
#include <filesystem>
#include <string>

namespace llmws::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

/// Whole-file read. A missing file is reported as failure; callers that treat
/// absence as empty check existence first.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace llmws::common
