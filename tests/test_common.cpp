#include "test_framework.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"
#include "llmws/common/text.hpp"
#include "llmws/common/toml.hpp"

#include <set>

void register_common_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace c = llmws::common;

  tests.push_back({"strip_reasoning_drops_think_block", [] {
                     require(c::strip_reasoning_tags("<think>hidden</think>\n\nvisible") == "visible",
                             "think block should be removed");
                   }});

  tests.push_back({"strip_reasoning_handles_variants_and_case", [] {
                     require(c::strip_reasoning_tags("<Thinking>a</Thinking>b") == "b", "thinking");
                     require(c::strip_reasoning_tags("x <thought>y</thought> z") == "x  z",
                             "thought keeps surrounding text");
                     require(c::strip_reasoning_tags("<antthinking>q</antthinking>ok") == "ok",
                             "antthinking");
                   }});

  tests.push_back({"strip_reasoning_unterminated_block_drops_tail", [] {
                     require(c::strip_reasoning_tags("answer <think>still going") == "answer",
                             "unterminated block runs to end");
                   }});

  tests.push_back({"strip_reasoning_stray_closer_removed", [] {
                     require(c::strip_reasoning_tags("done</think> here") == "done here",
                             "stray closer should vanish");
                   }});

  tests.push_back({"strip_reasoning_keeps_final_content", [] {
                     require(c::strip_reasoning_tags("<think>x</think><final>kept</final>") == "kept",
                             "final tags unwrap");
                   }});

  tests.push_back({"strip_reasoning_ignores_code_fences", [] {
                     const std::string text = "```\n<think>literal</think>\n```";
                     require(c::strip_reasoning_tags(text) == text, "fenced tags stay");
                   }});

  tests.push_back({"silent_reply_detection", [] {
                     require(c::is_silent_reply("NO_REPLY", "NO_REPLY"), "exact");
                     require(c::is_silent_reply("  NO_REPLY.", "NO_REPLY"), "with punctuation");
                     require(!c::is_silent_reply("NO_REPLYING", "NO_REPLY"), "word boundary");
                     require(!c::is_silent_reply("hello", "NO_REPLY"), "ordinary text");
                   }});

  tests.push_back({"utf8_budget_helpers_count_code_points", [] {
                     const std::string text = "h\xC3\xA9llo";
                     require(c::utf8_length(text) == 5, "code points, not bytes");
                     require(c::utf8_prefix(text, 2) == "h\xC3\xA9", "prefix keeps whole sequence");
                     require(c::clip_with_ellipsis("abcdef", 4) == "abc\xE2\x80\xA6", "clipped");
                     require(c::clip_with_ellipsis("abc", 4) == "abc", "fits unchanged");
                   }});

  tests.push_back({"split_trimmed_and_join", [] {
                     const auto parts = c::split_trimmed(" a , ,b ,c", ',');
                     require(parts.size() == 3 && parts[1] == "b", "blank pieces dropped");
                     require(c::join(parts, "|") == "a|b|c", "join");
                     require(c::starts_with("ws://x", "ws:") && !c::starts_with("w", "ws"),
                             "starts_with");
                     require(c::ends_with("file.jsonl", ".jsonl"), "ends_with");
                   }});

  tests.push_back({"generate_uuid_is_v4_and_unique", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 32; ++i) {
                       const std::string id = c::generate_uuid();
                       require(id.size() == 36 && id[14] == '4', "v4 layout: " + id);
                       seen.insert(id);
                     }
                     require(seen.size() == 32, "ids should not repeat");
                   }});

  tests.push_back({"json_parse_object_reads_nested_members", [] {
                     auto parsed = c::json_parse_object(
                         R"({"type":"welcome","n":3,"ok":true,"caps":{"vision":true},"list":[1,2],"s":"a\nb"})");
                     require(parsed.ok(), "should parse");
                     const auto &obj = parsed.value();
                     require(c::json_string_field(obj, "type") == std::optional<std::string>("welcome"),
                             "string member");
                     require(c::json_number_field(obj, "n") == std::optional<double>(3.0), "number");
                     require(c::json_bool_field(obj, "ok") == std::optional<bool>(true), "bool");
                     require(c::json_object_field(obj, "caps").has_value(), "object");
                     require(c::json_array_field(obj, "list")->size() == 2, "array");
                     require(c::json_string_field(obj, "s") == std::optional<std::string>("a\nb"),
                             "escapes decoded");
                   }});

  tests.push_back({"json_parse_object_rejects_garbage", [] {
                     require(!c::json_parse_object("{\"a\":1} trailing").ok(), "trailing text");
                     require(!c::json_parse_object("[1,2]").ok(), "array is not an object");
                     require(!c::json_parse_object("{\"a\":").ok(), "truncated");
                   }});

  tests.push_back({"json_quote_and_number", [] {
                     require(c::json_quote("a\"b\n") == "\"a\\\"b\\n\"", "escaped quote");
                     require(c::json_number(232) == "232", "integral without fraction");
                     require(c::json_number(0.5) == "0.5", "fraction kept");
                   }});

  tests.push_back({"toml_reads_quoted_sections_and_table_arrays", [] {
                     auto doc = c::parse_toml(R"(
system_prompt = "hi"
[llmws]
servers = ["ws://a:1", "ws://b:2"]
[[llmws.targets]]
url = "ws://gpu:8765"
capabilities = ["vision", "long context"]
[[llmws.targets]]
url = "ws://cpu:8765"
[models."llmws/qwen-8b"]
server = "ws://m:1"
)");
                     require(doc.ok(), "should parse");
                     const auto &d = doc.value();
                     require(d.get_string("system_prompt") == "hi", "top-level string");
                     require(d.get_string_array("llmws.servers").size() == 2, "string array");
                     require(d.table_array_size("llmws.targets") == 2, "two target tables");
                     require(d.get_string("llmws.targets.0.url") == "ws://gpu:8765", "first table");
                     require(d.get_string_array("llmws.targets.0.capabilities").size() == 2,
                             "capabilities");
                     require(d.get_string("llmws.targets.1.url") == "ws://cpu:8765", "second table");
                     require(d.get_string("models.llmws/qwen-8b.server") == "ws://m:1",
                             "quoted section name");
                   }});

  tests.push_back({"trim_and_to_lower", [] {
                     require(c::trim("  x \r\n") == "x", "trim");
                     require(c::to_lower("MiXeD") == "mixed", "lower");
                   }});
}
