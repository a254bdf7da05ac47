#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "llmws/client/protocol.hpp"
#include "llmws/client/scan.hpp"
#include "llmws/client/targets.hpp"
#include "llmws/common/json_util.hpp"

namespace {

using namespace std::chrono_literals;

llmws::testing::ServerScript resource_server() {
  return [](llmws::testing::ScriptedConnection &connection,
            const llmws::transport::ParsedMessage &message) {
    const std::string type = llmws::client::message_type(message);
    if (type.empty()) {
      connection.reply("{\"type\":\"welcome\",\"session_id\":\"x\",\"model\":\"qwen-7b\","
                       "\"capabilities\":{\"vision\":true,\"ctx\":4096,"
                       "\"modes\":[\"chat\",\"tools\"]}}");
    } else if (type == "get_resources") {
      connection.reply("{\"type\":\"resources\",\"model\":{\"name\":\"Qwen 7B\",\"path\":\"/m/q\","
                       "\"vision\":false},\"available_models\":[{\"name\":\"a\",\"source\":\"hf\"},"
                       "{\"name\":\"b\"}]}");
    }
  };
}

llmws::common::JsonObject object(const std::string &json) {
  auto parsed = llmws::common::json_parse_object(json);
  llmws::tests::require(parsed.ok(), "fixture parses");
  return parsed.value();
}

} // namespace

void register_scan_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace client = llmws::client;
  namespace config = llmws::config;
  namespace testing = llmws::testing;

  tests.push_back({"scan_endpoint_collects_welcome_and_resources", [] {
                     testing::ScriptedConnector connector;
                     connector.serve("ws://gpu:1", resource_server());
                     const auto result = client::scan_endpoint(connector, "ws://gpu:1", 500ms);
                     require(result.reachable && !result.error.has_value(),
                             result.error.value_or(""));
                     require(result.session_id == std::optional<std::string>("x"), "session id");
                     require(result.welcome_model == std::optional<std::string>("qwen-7b"),
                             "welcome model");
                     require(client::format_capabilities(result.welcome_capabilities) ==
                                 "ctx=4096, modes=[chat,tools], vision=true",
                             client::format_capabilities(result.welcome_capabilities));
                     require(result.resources_model.has_value() &&
                                 result.resources_model->name == std::optional<std::string>("Qwen 7B") &&
                                 result.resources_model->vision == std::optional<bool>(false),
                             "resources model");
                     require(result.available_models_count == std::optional<std::size_t>(2),
                             "available count");
                     require(result.available_models_sample.size() == 2 &&
                                 result.available_models_sample[0].source ==
                                     std::optional<std::string>("hf") &&
                                 !result.available_models_sample[1].source.has_value(),
                             "available sample");
                     require(result.timings.open.has_value() && result.timings.welcome.has_value() &&
                                 result.timings.resources.has_value(),
                             "timings recorded");
                     require(connector.sent_of_type("get_resources").size() == 1,
                             "resources requested once");
                     require(connector.closed_count() == 1, "socket closed");
                   }});

  tests.push_back({"scan_endpoint_reports_failures", [] {
                     testing::ScriptedConnector connector;
                     connector.serve("ws://busy:1", [](testing::ScriptedConnection &connection,
                                                       const llmws::transport::ParsedMessage &) {
                       connection.reply("{\"type\":\"error\",\"message\":\"busy\"}");
                     });
                     const auto refused = client::scan_endpoint(connector, "ws://down:1", 100ms);
                     require(!refused.reachable &&
                                 refused.error ==
                                     std::optional<std::string>("connect ECONNREFUSED ws://down:1"),
                             "connect failure");
                     require(!refused.timings.open.has_value(), "never opened");

                     const auto busy = client::scan_endpoint(connector, "ws://busy:1", 100ms);
                     require(!busy.reachable && busy.error == std::optional<std::string>("busy"),
                             "server error message");
                   }});

  tests.push_back({"scan_endpoint_times_out_waiting_for_resources", [] {
                     testing::ScriptedConnector connector;
                     connector.serve("ws://slow:1", [](testing::ScriptedConnection &connection,
                                                       const llmws::transport::ParsedMessage &message) {
                       if (client::message_type(message).empty()) {
                         connection.reply("{\"type\":\"welcome\"}");
                       }
                     });
                     const auto result = client::scan_endpoint(connector, "ws://slow:1", 10ms);
                     require(result.reachable, "welcome seen");
                     require(result.error == std::optional<std::string>("timeout"), "timed out");
                     require(!result.resources_model.has_value(), "no resources");
                   }});

  tests.push_back({"scan_endpoints_explicit_or_configured", [] {
                     config::Config cfg;
                     const config::MapEnvironment env;
                     require(client::scan_endpoints({" host:1 ", "", "ws:/x:2"}, cfg, env) ==
                                 std::vector<std::string>{"ws://host:1", "ws://x:2"},
                             "explicit urls normalised");
                     require(client::scan_endpoints({}, cfg, env) ==
                                 std::vector<std::string>{client::kDefaultEndpoint},
                             "default endpoint");
                     cfg.llmws.defaults.server = "cfg:9";
                     require(client::scan_endpoints({}, cfg, env) ==
                                 std::vector<std::string>{"ws://cfg:9"},
                             "configured server");
                   }});

  tests.push_back({"scan_table_layout", [] {
                     client::ScanResult up;
                     up.url = "ws://a:1";
                     up.reachable = true;
                     up.resources_model = client::ScanModel{.name = "Qwen"};
                     up.available_models_count = 2;
                     up.welcome_capabilities = object("{\"vision\":true}");
                     client::ScanResult down;
                     down.url = "ws://bb:2";
                     down.error = "timeout";

                     const std::string expected =
                         "Endpoint  | Status        | Model | Available | Capabilities\n"
                         "----------+---------------+-------+-----------+-------------\n"
                         "ws://a:1  | ok            | Qwen  | 2         | vision=true \n"
                         "ws://bb:2 | fail: timeout | -     | -         | -           \n";
                     require(client::render_scan_table({up, down}) == expected,
                             client::render_scan_table({up, down}));
                   }});

  tests.push_back({"scan_table_prefers_resources_model", [] {
                     client::ScanResult entry;
                     entry.url = "ws://a:1";
                     entry.reachable = true;
                     entry.welcome_model = "welcome-name";
                     const std::string table = client::render_scan_table({entry});
                     require(table.find("welcome-name") != std::string::npos,
                             "welcome model as fallback");
                     entry.resources_model = client::ScanModel{.name = "resource-name"};
                     const std::string preferred = client::render_scan_table({entry});
                     require(preferred.find("resource-name") != std::string::npos &&
                                 preferred.find("welcome-name") == std::string::npos,
                             "resources model wins");
                   }});

  tests.push_back({"scan_json_report", [] {
                     require(client::render_scan_json({}, "2026-01-01T00:00:00.000Z") ==
                                 "{\n  \"scannedAt\": \"2026-01-01T00:00:00.000Z\",\n"
                                 "  \"endpoints\": []\n}\n",
                             "empty report");

                     testing::ScriptedConnector connector;
                     connector.serve("ws://gpu:1", resource_server());
                     const auto result = client::scan_endpoint(connector, "ws://gpu:1", 500ms);
                     const std::string json = client::render_scan_json({result}, "now");
                     auto parsed = llmws::common::json_parse_object(json);
                     require(parsed.ok(), "report is JSON");
                     auto endpoints = llmws::common::json_array_field(parsed.value(), "endpoints");
                     require(endpoints.has_value() && endpoints->size() == 1, "one endpoint");
                     auto entry = llmws::common::json_parse_object((*endpoints)[0].text);
                     require(entry.ok(), "endpoint object");
                     const auto &fields = entry.value();
                     require(llmws::common::json_string_field(fields, "url") ==
                                 std::optional<std::string>("ws://gpu:1"),
                             "url");
                     require(llmws::common::json_bool_field(fields, "reachable") ==
                                 std::optional<bool>(true),
                             "reachable");
                     require(llmws::common::json_number_field(fields, "availableModelsCount") ==
                                 std::optional<double>(2.0),
                             "count");
                     require(fields.at("error").is_null(), "no error");
                     const auto caps = llmws::common::json_object_field(fields, "welcomeCapabilities");
                     require(caps.has_value() &&
                                 llmws::common::json_number_field(*caps, "ctx") ==
                                     std::optional<double>(4096.0),
                             "raw capability values");
                     const auto model = llmws::common::json_object_field(fields, "resourcesModel");
                     require(model.has_value() &&
                                 llmws::common::json_bool_field(*model, "vision") ==
                                     std::optional<bool>(false),
                             "resources model");
                     const auto timings = llmws::common::json_object_field(fields, "timingsMs");
                     require(timings.has_value() && timings->count("open") == 1 &&
                                 timings->count("resources") == 1,
                             "timings");
                   }});
}
