#include "llmws/client/scan.hpp"

#include "llmws/client/protocol.hpp"
#include "llmws/client/targets.hpp"
#include "llmws/common/text.hpp"
#include "llmws/observability/global.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <sstream>

namespace llmws::client {

namespace {

using Clock = std::chrono::steady_clock;

std::optional<std::string> string_member(const common::JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.text;
}

std::string display_value(const common::JsonValue &value) {
  if (value.is_array()) {
    std::vector<std::string> parts;
    auto items = common::json_parse_array(value.text);
    if (items.ok()) {
      for (const auto &item : items.value()) {
        parts.push_back(display_value(item));
      }
    }
    return "[" + common::join(parts, ",") + "]";
  }
  return value.text;
}

std::string raw_json(const common::JsonValue &value) {
  return value.is_string() ? common::json_quote(value.text) : value.text;
}

std::string optional_string_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "null";
}

void read_resources(const transport::ParsedMessage &message, ScanResult &result) {
  if (auto model = common::json_object_field(message, "model"); model.has_value()) {
    ScanModel scanned;
    scanned.name = string_member(*model, "name");
    scanned.path = string_member(*model, "path");
    scanned.vision = common::json_bool_field(*model, "vision");
    result.resources_model = std::move(scanned);
  }
  const auto available =
      common::json_array_field(message, "available_models").value_or(std::vector<common::JsonValue>{});
  result.available_models_count = available.size();
  for (std::size_t i = 0; i < available.size() && i < kScanModelSample; ++i) {
    ScanAvailableModel entry;
    if (available[i].is_object()) {
      auto parsed = common::json_parse_object(available[i].text);
      if (parsed.ok()) {
        entry.name = string_member(parsed.value(), "name");
        entry.path = string_member(parsed.value(), "path");
        entry.source = string_member(parsed.value(), "source");
      }
    }
    result.available_models_sample.push_back(std::move(entry));
  }
}

} // namespace

ScanResult scan_endpoint(transport::Connector &connector, const std::string &url,
                         const std::chrono::milliseconds timeout) {
  ScanResult result;
  result.url = url;
  const auto started = Clock::now();
  const auto deadline = started + timeout + kScanGrace;
  const auto since_start = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  };

  auto opened = connector.open(url, timeout);
  if (!opened.ok()) {
    result.error = opened.error();
    return result;
  }
  std::unique_ptr<transport::Connection> connection = std::move(opened.value());
  result.timings.open = since_start();

  if (auto sent = connection->send(encode_hello("")); !sent.ok()) {
    result.error = sent.error();
    connection->close();
    return result;
  }

  bool awaiting_welcome = true;
  while (true) {
    const auto remaining =
        std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      result.error = "timeout";
      break;
    }
    auto next = connection->next(remaining);
    if (!next.ok()) {
      result.error = Clock::now() >= deadline ? std::string("timeout") : next.error();
      break;
    }
    const transport::ParsedMessage &message = next.value();
    const std::string type = message_type(message);

    if (awaiting_welcome && type == "welcome") {
      result.reachable = true;
      result.session_id = string_member(message, "session_id");
      result.welcome_model = string_member(message, "model");
      result.welcome_capabilities = common::json_object_field(message, "capabilities");
      result.timings.welcome = since_start();
      if (auto sent = connection->send(encode_get_resources()); !sent.ok()) {
        result.error = sent.error();
        break;
      }
      awaiting_welcome = false;
      continue;
    }
    if (!awaiting_welcome && type == "resources") {
      read_resources(message, result);
      result.timings.resources = since_start();
      break;
    }
    if (type == "error") {
      result.error = string_member(message, "message").value_or("server error");
      break;
    }
  }

  connection->close();
  if (result.error.has_value()) {
    observability::log_debug("scan", url + ": " + *result.error);
  }
  return result;
}

std::vector<std::string> scan_endpoints(const std::vector<std::string> &explicit_urls,
                                        const config::Config &config,
                                        const config::EnvironmentProvider &env) {
  std::vector<std::string> out;
  if (!explicit_urls.empty()) {
    for (const auto &raw : explicit_urls) {
      std::string url = normalize_ws_url(raw);
      if (!url.empty()) {
        out.push_back(std::move(url));
      }
    }
    return out;
  }
  for (const auto &target : resolve_targets(config::ParamBlock{}, config.llmws.defaults, env)) {
    out.push_back(target.url);
  }
  return out;
}

std::string format_capabilities(const std::optional<common::JsonObject> &capabilities) {
  if (!capabilities.has_value()) {
    return "-";
  }
  const std::map<std::string, common::JsonValue> sorted(capabilities->begin(),
                                                        capabilities->end());
  std::vector<std::string> parts;
  parts.reserve(sorted.size());
  for (const auto &[key, value] : sorted) {
    parts.push_back(key + "=" + display_value(value));
  }
  return common::join(parts, ", ");
}

std::string render_scan_table(const std::vector<ScanResult> &results) {
  constexpr std::size_t kColumns = 5;
  const std::array<std::string, kColumns> header = {"Endpoint", "Status", "Model", "Available",
                                                    "Capabilities"};
  std::vector<std::array<std::string, kColumns>> rows;
  rows.reserve(results.size());
  for (const auto &entry : results) {
    std::string model = "-";
    if (entry.resources_model.has_value() && entry.resources_model->name.has_value()) {
      model = *entry.resources_model->name;
    } else if (entry.welcome_model.has_value()) {
      model = *entry.welcome_model;
    }
    rows.push_back({entry.url,
                    entry.reachable ? std::string("ok")
                                    : "fail: " + entry.error.value_or("unknown"),
                    model,
                    entry.available_models_count.has_value()
                        ? std::to_string(*entry.available_models_count)
                        : std::string("-"),
                    format_capabilities(entry.welcome_capabilities)});
  }

  std::array<std::size_t, kColumns> widths{};
  for (std::size_t c = 0; c < kColumns; ++c) {
    widths[c] = common::utf8_length(header[c]);
    for (const auto &row : rows) {
      widths[c] = std::max(widths[c], common::utf8_length(row[c]));
    }
  }

  const auto render_row = [&](const std::array<std::string, kColumns> &cells) {
    std::string line;
    for (std::size_t c = 0; c < kColumns; ++c) {
      if (c > 0) {
        line += " | ";
      }
      line += cells[c];
      line.append(widths[c] - common::utf8_length(cells[c]), ' ');
    }
    return line + "\n";
  };

  std::string out = render_row(header);
  for (std::size_t c = 0; c < kColumns; ++c) {
    if (c > 0) {
      out += "-+-";
    }
    out.append(widths[c], '-');
  }
  out += "\n";
  for (const auto &row : rows) {
    out += render_row(row);
  }
  return out;
}

std::string render_scan_json(const std::vector<ScanResult> &results,
                             const std::string &scanned_at) {
  std::ostringstream out;
  out << "{\n  \"scannedAt\": " << common::json_quote(scanned_at) << ",\n  \"endpoints\": [";
  for (std::size_t i = 0; i < results.size(); ++i) {
    const ScanResult &entry = results[i];
    out << (i > 0 ? "," : "") << "\n    {";
    out << "\n      \"url\": " << common::json_quote(entry.url);
    out << ",\n      \"reachable\": " << (entry.reachable ? "true" : "false");
    out << ",\n      \"sessionId\": " << optional_string_json(entry.session_id);
    out << ",\n      \"welcomeModel\": " << optional_string_json(entry.welcome_model);
    out << ",\n      \"welcomeCapabilities\": ";
    if (entry.welcome_capabilities.has_value()) {
      const std::map<std::string, common::JsonValue> sorted(entry.welcome_capabilities->begin(),
                                                            entry.welcome_capabilities->end());
      out << "{";
      bool first = true;
      for (const auto &[key, value] : sorted) {
        out << (first ? "" : ",") << common::json_quote(key) << ":" << raw_json(value);
        first = false;
      }
      out << "}";
    } else {
      out << "null";
    }
    out << ",\n      \"resourcesModel\": ";
    if (entry.resources_model.has_value()) {
      const ScanModel &model = *entry.resources_model;
      out << "{\"name\":" << optional_string_json(model.name)
          << ",\"path\":" << optional_string_json(model.path) << ",\"vision\":"
          << (model.vision.has_value() ? (*model.vision ? "true" : "false") : "null") << "}";
    } else {
      out << "null";
    }
    out << ",\n      \"availableModelsCount\": "
        << (entry.available_models_count.has_value()
                ? std::to_string(*entry.available_models_count)
                : std::string("null"));
    out << ",\n      \"availableModelsSample\": [";
    for (std::size_t m = 0; m < entry.available_models_sample.size(); ++m) {
      const ScanAvailableModel &model = entry.available_models_sample[m];
      out << (m > 0 ? "," : "") << "{\"name\":" << optional_string_json(model.name)
          << ",\"path\":" << optional_string_json(model.path)
          << ",\"source\":" << optional_string_json(model.source) << "}";
    }
    out << "]";
    out << ",\n      \"error\": " << optional_string_json(entry.error);
    out << ",\n      \"timingsMs\": {";
    std::vector<std::string> timings;
    if (entry.timings.open.has_value()) {
      timings.push_back("\"open\":" + std::to_string(entry.timings.open->count()));
    }
    if (entry.timings.welcome.has_value()) {
      timings.push_back("\"welcome\":" + std::to_string(entry.timings.welcome->count()));
    }
    if (entry.timings.resources.has_value()) {
      timings.push_back("\"resources\":" + std::to_string(entry.timings.resources->count()));
    }
    out << common::join(timings, ",") << "}";
    out << "\n    }";
  }
  out << (results.empty() ? "]" : "\n  ]") << "\n}\n";
  return out.str();
}

} // namespace llmws::client
