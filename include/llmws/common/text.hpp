#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace llmws::common {

/// Split on a delimiter, trimming each piece and dropping empty ones.
[[nodiscard]] std::vector<std::string> split_trimmed(const std::string &value, char delimiter);

[[nodiscard]] std::string replace_all(std::string value, const std::string &from,
                                      const std::string &to);

[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);

/// Joins with a separator, like Python's str.join.
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

/// Length in Unicode code points. Budgets throughout the request builder are
/// measured in code points, never bytes.
[[nodiscard]] std::size_t utf8_length(const std::string &value);

/// The first `count` code points of `value`.
[[nodiscard]] std::string utf8_prefix(const std::string &value, std::size_t count);

/// `value` when it fits in `limit` code points, otherwise its first `limit - 1`
/// code points followed by an ellipsis.
[[nodiscard]] std::string clip_with_ellipsis(const std::string &value, std::size_t limit);

/// Drops <think>-style reasoning blocks from model output and trims the rest.
/// Content wrapped in <final> tags is kept without the tags.
[[nodiscard]] std::string strip_reasoning_tags(const std::string &text);

/// True when the reply is (or starts/ends with) the silent-reply token.
[[nodiscard]] bool is_silent_reply(const std::string &text, const std::string &token);

/// UTC timestamp with millisecond precision, e.g. 2025-01-02T03:04:05.678Z.
[[nodiscard]] std::string now_iso8601();

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string generate_uuid();

} // namespace llmws::common
