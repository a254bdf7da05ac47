#pragma once

#include "llmws/common/json_util.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/config/schema.hpp"
#include "llmws/transport/connection.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmws::client {

constexpr std::chrono::milliseconds kDefaultScanTimeout{5000};
/// Slack on top of the connect timeout for the whole scan.
constexpr std::chrono::milliseconds kScanGrace{2000};
constexpr std::size_t kScanModelSample = 8;

struct ScanModel {
  std::optional<std::string> name;
  std::optional<std::string> path;
  std::optional<bool> vision;
};

struct ScanAvailableModel {
  std::optional<std::string> name;
  std::optional<std::string> path;
  std::optional<std::string> source;
};

struct ScanTimings {
  std::optional<std::chrono::milliseconds> open;
  std::optional<std::chrono::milliseconds> welcome;
  std::optional<std::chrono::milliseconds> resources;
};

struct ScanResult {
  std::string url;
  bool reachable = false;
  std::optional<std::string> session_id;
  std::optional<std::string> welcome_model;
  std::optional<common::JsonObject> welcome_capabilities;
  std::optional<ScanModel> resources_model;
  std::optional<std::size_t> available_models_count;
  std::vector<ScanAvailableModel> available_models_sample;
  std::optional<std::string> error;
  ScanTimings timings;
};

/// hello, welcome, get_resources, resources. Never fails: problems land in
/// `error`, and `reachable` records whether a welcome arrived.
[[nodiscard]] ScanResult scan_endpoint(transport::Connector &connector, const std::string &url,
                                       std::chrono::milliseconds timeout);

/// Explicit endpoints when given, otherwise the configured and environment
/// servers in resolution order.
[[nodiscard]] std::vector<std::string> scan_endpoints(const std::vector<std::string> &explicit_urls,
                                                      const config::Config &config,
                                                      const config::EnvironmentProvider &env);

/// `key=value` pairs sorted by key; arrays render as `[a,b]`. "-" when absent.
[[nodiscard]] std::string format_capabilities(const std::optional<common::JsonObject> &capabilities);

/// Endpoint | Status | Model | Available | Capabilities, padded to column width.
[[nodiscard]] std::string render_scan_table(const std::vector<ScanResult> &results);

/// `{"scannedAt": ..., "endpoints": [...]}`.
[[nodiscard]] std::string render_scan_json(const std::vector<ScanResult> &results,
                                           const std::string &scanned_at);

} // namespace llmws::client
