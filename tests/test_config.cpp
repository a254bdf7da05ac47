#include "test_framework.hpp"

#include "llmws/client/settings.hpp"
#include "llmws/common/toml.hpp"
#include "llmws/config/config.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/observability/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

llmws::config::Config parse_config(const std::string &toml) {
  auto doc = llmws::common::parse_toml(toml);
  llmws::tests::require(doc.ok(), doc.ok() ? "" : doc.error());
  return llmws::config::config_from_toml(doc.value());
}

} // namespace

void register_config_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace config = llmws::config;
  namespace client = llmws::client;

  tests.push_back({"config_defaults", [] {
                     const config::Config cfg;
                     require(cfg.default_provider == "llmws", "provider default");
                     require(cfg.silent_reply_token == "NO_REPLY", "silent token default");
                     require(cfg.timeout_ms == 120000, "call timeout default");
                     require(cfg.memory.backend == "builtin", "memory off by default");
                     require(cfg.observability.log_level == "info", "log level default");
                   }});

  tests.push_back({"config_reads_llmws_and_model_blocks", [] {
                     const auto cfg = parse_config(R"(
system_prompt = "Be brief."
timeout_ms = 30000
[llmws]
server = "ws://10.0.0.5:8765"
servers = ["ws://a:8765"]
connect_timeout_ms = 2500
includeHistory = false
history_turns = 4
maxNewTokens = 256
[llmws.config]
temperature = 0.2
[[llmws.targets]]
url = "ws://gpu:8765"
capabilities = ["Vision"]
[models."llmws/qwen"]
server_capabilities = ["vision"]
read_timeout_ms = 9000
)");
                     require(cfg.system_prompt == "Be brief.", "system prompt");
                     require(cfg.timeout_ms == 30000, "timeout");
                     const auto &defaults = cfg.llmws.defaults;
                     require(defaults.server == std::optional<std::string>("ws://10.0.0.5:8765"),
                             "single server");
                     require(defaults.servers.size() == 2, "list plus target table");
                     require(defaults.servers[1].url == "ws://gpu:8765", "target table url");
                     require(defaults.servers[1].capabilities.size() == 1, "target capabilities");
                     require(defaults.connect_timeout_ms == std::optional<double>(2500), "connect");
                     require(defaults.include_history == std::optional<bool>(false),
                             "camelCase alias");
                     require(defaults.generation.max_new_tokens == std::optional<double>(256),
                             "maxNewTokens alias");
                     require(defaults.config.temperature == std::optional<double>(0.2),
                             "nested config block");
                     const auto model = config::model_params(cfg, "llmws", "qwen");
                     require(model.server_capabilities.size() == 1, "model block found");
                     require(model.read_timeout_ms == std::optional<double>(9000), "model read");
                     require(config::model_params(cfg, "llmws", "other").servers.empty(),
                             "unknown model yields empty block");
                   }});

  tests.push_back({"config_reads_memory_http_section", [] {
                     const auto cfg = parse_config(R"(
[memory]
backend = "HTTP"
[memory.http]
base_url = "http://mem:8000"
api_key = "k"
mode = "vector"
max_results = 3
[memory.http.headers]
X-Team = "core"
)");
                     require(cfg.memory.backend == "http", "backend lower-cased");
                     require(cfg.memory.http.base_url == "http://mem:8000", "base url");
                     require(cfg.memory.http.mode == "vector", "mode");
                     require(cfg.memory.http.max_results == 3, "max results");
                     require(cfg.memory.http.headers.at("X-Team") == "core", "extra header");
                   }});

  tests.push_back({"validate_config_rejects_bad_values", [] {
                     config::Config cfg;
                     cfg.memory.backend = "sqlite";
                     require(!config::validate_config(cfg).ok(), "unknown backend");
                     cfg.memory.backend = "builtin";
                     cfg.observability.log_level = "chatty";
                     require(!config::validate_config(cfg).ok(), "unknown log level");
                     cfg.observability.log_level = "debug";
                     cfg.llmws.defaults.generation.max_new_tokens = 0;
                     auto warnings = config::validate_config(cfg);
                     require(warnings.ok() && warnings.value().size() == 1,
                             "non-positive budget is a warning");
                   }});

  tests.push_back({"observer_factory_honours_off_level", [] {
                     config::Config cfg;
                     cfg.observability.log_level = "off";
                     require(llmws::observability::create_observer(cfg)->name() == "noop", "off");
                     cfg.observability.log_level = "debug";
                     require(llmws::observability::create_observer(cfg)->name() == "log", "debug");
                   }});

  tests.push_back({"env_positive_int_uses_first_valid_name", [] {
                     config::MapEnvironment env;
                     env.set("A", "-3");
                     env.set("B", "7.9");
                     require(config::env_positive_int(env, {"A", "B"}, 1) == 7, "floored B");
                     require(config::env_positive_int(env, {"MISSING"}, 5) == 5, "fallback");
                     env.set("C", "abc");
                     require(config::env_positive_int(env, {"C"}, 9) == 9, "garbage ignored");
                   }});

  tests.push_back({"generation_layers_model_config_first", [] {
                     config::ParamBlock model;
                     config::ParamBlock defaults;
                     defaults.generation.max_new_tokens = 100;
                     defaults.config.max_new_tokens = 200;
                     defaults.generation.top_p = 0.9;
                     model.generation.max_new_tokens = 300;
                     model.generation.temperature = 0.1;
                     model.config.temperature = 0.3;
                     const auto gen = client::resolve_generation(model, defaults, {});
                     require(gen.max_new_tokens == std::optional<double>(300), "model block wins");
                     require(gen.temperature == std::optional<double>(0.3), "model config wins");
                     require(gen.top_p == std::optional<double>(0.9), "defaults fill gaps");
                     require(!gen.top_k.has_value(), "unset stays unset");
                   }});

  tests.push_back({"generation_overrides_beat_config", [] {
                     config::ParamBlock model;
                     model.config.temperature = 0.3;
                     model.config.max_new_tokens = 64;
                     client::StreamOverrides overrides;
                     overrides.temperature = 0.9;
                     overrides.max_tokens = 512;
                     const auto gen = client::resolve_generation(model, {}, overrides);
                     require(gen.temperature == std::optional<double>(0.9), "temperature override");
                     require(gen.max_new_tokens == std::optional<double>(512), "max tokens override");
                   }});

  tests.push_back({"generation_json_has_fixed_key_order", [] {
                     client::GenerationConfig gen;
                     gen.do_sample = false;
                     gen.temperature = 0.5;
                     gen.max_new_tokens = 32;
                     require(client::generation_to_json(gen) ==
                                 R"({"max_new_tokens":32,"temperature":0.5,"do_sample":false})",
                             client::generation_to_json(gen));
                     require(client::generation_to_json({}) == "{}", "empty object");
                   }});

  tests.push_back({"runtime_settings_derive_timeouts_from_call", [] {
                     const config::MapEnvironment env;
                     auto settings = client::resolve_runtime_settings(
                         {}, {}, std::chrono::milliseconds(3000), {}, env);
                     require(settings.connect_timeout == std::chrono::milliseconds(3000),
                             "connect capped by call timeout");
                     require(settings.read_timeout == std::chrono::milliseconds(3000),
                             "read equals call timeout");
                     require(settings.include_history, "history on by default");
                     require(settings.history_turns == 12 && settings.history_chars == 12000,
                             "history defaults");
                     require(settings.targets.size() == 1 &&
                                 settings.targets[0].url == "ws://127.0.0.1:8765",
                             "default endpoint");

                     settings = client::resolve_runtime_settings(
                         {}, {}, std::chrono::milliseconds(60000), {}, env);
                     require(settings.connect_timeout == std::chrono::milliseconds(8000),
                             "connect capped at 8s");
                   }});

  tests.push_back({"runtime_settings_clamp_configured_values", [] {
                     const config::MapEnvironment env;
                     config::ParamBlock defaults;
                     defaults.connect_timeout_ms = 0;
                     defaults.read_timeout_ms = 1500.7;
                     defaults.history_turns = -4;
                     defaults.history_chars = 99.9;
                     config::ParamBlock model;
                     model.include_history = false;
                     const auto settings = client::resolve_runtime_settings(
                         model, defaults, std::chrono::milliseconds(5000), {}, env);
                     require(settings.connect_timeout == std::chrono::milliseconds(1),
                             "floored at 1ms");
                     require(settings.read_timeout == std::chrono::milliseconds(1500), "floored");
                     require(settings.history_turns == 0, "negative turns clamp to zero");
                     require(settings.history_chars == 99, "chars floored");
                     require(!settings.include_history, "model disables history");
                   }});

  tests.push_back({"temp_workspace_round_trip", [] {
                     llmws::testing::TempWorkspace ws;
                     ws.create_file("dir/a.txt", "hello");
                     require(ws.read("dir/a.txt") == "hello", "helper writes nested files");
                   }});
}
