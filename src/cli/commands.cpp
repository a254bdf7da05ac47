#include "llmws/cli/commands.hpp"

#include "llmws/client/runner.hpp"
#include "llmws/client/scan.hpp"
#include "llmws/client/targets.hpp"
#include "llmws/common/fs.hpp"
#include "llmws/common/json_util.hpp"
#include "llmws/common/text.hpp"
#include "llmws/config/config.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/memory/memory.hpp"
#include "llmws/observability/factory.hpp"
#include "llmws/observability/global.hpp"
#include "llmws/transport/session.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmws::cli {

namespace {

std::string version_string() {
#ifdef LLMWS_VERSION
  const std::string version = LLMWS_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "llmws " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<double> parse_number(const std::string &raw, const std::string &what) {
  try {
    std::size_t consumed = 0;
    const double value = std::stod(raw, &consumed);
    if (consumed != raw.size() || !std::isfinite(value)) {
      return common::Result<double>::failure("invalid " + what + ": " + raw);
    }
    return common::Result<double>::success(value);
  } catch (const std::exception &) {
    return common::Result<double>::failure("invalid " + what + ": " + raw);
  }
}

common::Result<std::chrono::milliseconds> parse_timeout(const std::string &raw) {
  auto number = parse_number(raw, "timeout");
  if (!number.ok() || number.value() <= 0) {
    return common::Result<std::chrono::milliseconds>::failure("invalid timeout: " + raw);
  }
  return common::Result<std::chrono::milliseconds>::success(
      std::chrono::milliseconds(static_cast<long long>(std::floor(number.value()))));
}

std::string mime_for_path(const std::filesystem::path &path) {
  const std::string ext = common::to_lower(path.extension().string());
  if (ext == ".jpg" || ext == ".jpeg") {
    return "image/jpeg";
  }
  if (ext == ".gif") {
    return "image/gif";
  }
  if (ext == ".webp") {
    return "image/webp";
  }
  return "image/png";
}

/// `FILE` or `FILE:mime/type`.
common::Result<client::ImageInput> load_image(const std::string &argument) {
  std::string file = argument;
  std::string mime;
  if (const auto colon = argument.rfind(':');
      colon != std::string::npos && argument.find('/', colon) != std::string::npos &&
      common::starts_with(argument.substr(colon + 1), "image/")) {
    file = argument.substr(0, colon);
    mime = argument.substr(colon + 1);
  }
  auto bytes = common::read_file(common::expand_path(file));
  if (!bytes.ok()) {
    return common::Result<client::ImageInput>::failure(bytes.error());
  }
  const std::string &raw = bytes.value();
  std::string encoded(4 * ((raw.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()),
                  reinterpret_cast<const unsigned char *>(raw.data()), static_cast<int>(raw.size()));
  return common::Result<client::ImageInput>::success(client::ImageInput{
      .data = std::move(encoded), .mime_type = mime.empty() ? mime_for_path(file) : mime});
}

common::Result<config::Config> load_and_observe() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

std::string usage_json(const std::optional<client::Usage> &usage) {
  if (!usage.has_value()) {
    return "null";
  }
  const auto field = [](const std::optional<double> &value) {
    return value.has_value() ? common::json_number(*value) : std::string("null");
  };
  return "{\"input\":" + field(usage->input) + ",\"output\":" + field(usage->output) +
         ",\"total\":" + field(usage->total) + "}";
}

int run_run(std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  client::RunRequest request;
  std::string value;
  std::string message;
  (void)take_option(args, "--message", "-m", message);
  (void)take_option(args, "--provider", "", request.provider);
  (void)take_option(args, "--model", "", request.model);
  (void)take_option(args, "--session-id", "", request.session_id);
  (void)take_option(args, "--remote-session", "", request.remote_session_id);
  (void)take_option(args, "--system", "", request.extra_system_prompt);
  if (take_option(args, "--session-file", "", value)) {
    request.session_file = common::expand_path(value);
  }
  if (take_option(args, "--workspace", "", value)) {
    request.workspace_dir = common::expand_path(value);
  }
  if (take_option(args, "--timeout", "", value)) {
    auto timeout = parse_timeout(value);
    if (!timeout.ok()) {
      std::cerr << timeout.error() << "\n";
      return 1;
    }
    request.timeout = timeout.value();
  }
  if (take_option(args, "--temperature", "-t", value)) {
    auto temperature = parse_number(value, "temperature");
    if (!temperature.ok()) {
      std::cerr << temperature.error() << "\n";
      return 1;
    }
    request.overrides.temperature = temperature.value();
  }
  if (take_option(args, "--max-tokens", "", value)) {
    auto max_tokens = parse_number(value, "max tokens");
    if (!max_tokens.ok()) {
      std::cerr << max_tokens.error() << "\n";
      return 1;
    }
    request.overrides.max_tokens = max_tokens.value();
  }
  for (const auto &argument : take_repeated_option(args, "--image")) {
    auto image = load_image(argument);
    if (!image.ok()) {
      std::cerr << image.error() << "\n";
      return 1;
    }
    request.images.push_back(std::move(image.value()));
  }
  const bool json_output = take_flag(args, "--json");

  if (message.empty()) {
    message = join_tokens(args);
  }
  if (message.empty() || message == "-") {
    message = read_stdin_all();
  }
  request.prompt = common::trim(message);
  if (request.prompt.empty()) {
    std::cerr << "usage: llmws run [-m MESSAGE] [--model ID] [--session-id ID] ...\n";
    return 1;
  }

  if (request.session_file.empty() && !request.session_id.empty()) {
    auto sessions_dir = config::resolve_sessions_dir(cfg.value());
    if (!sessions_dir.ok()) {
      std::cerr << sessions_dir.error() << "\n";
      return 1;
    }
    request.session_file = sessions_dir.value() / (request.session_id + ".jsonl");
  }

  const config::ProcessEnvironment env;
  transport::WebSocketConnector connector;
  std::unique_ptr<memory::MemorySearch> memory_search = memory::create_memory_search(cfg.value().memory);
  client::Runner runner(cfg.value(), connector, env, memory_search.get());

  auto result = runner.run(request);
  if (!result.ok()) {
    const client::FailoverError &error = result.error();
    std::cerr << "[" << client::failover_reason_name(error.reason) << "] " << error.message << "\n";
    return 1;
  }

  const client::RunResult &run = result.value();
  if (json_output) {
    std::cout << "{\"text\":"
              << (run.text.has_value() ? common::json_quote(*run.text) : std::string("null"))
              << ",\"meta\":{\"durationMs\":" << run.meta.duration.count()
              << ",\"sessionId\":" << common::json_quote(run.meta.session_id)
              << ",\"provider\":" << common::json_quote(run.meta.provider)
              << ",\"model\":" << common::json_quote(run.meta.model)
              << ",\"target\":" << common::json_quote(run.meta.target)
              << ",\"usage\":" << usage_json(run.meta.usage) << "}}\n";
    return 0;
  }
  if (run.text.has_value()) {
    std::cout << *run.text << "\n";
  }
  return 0;
}

int run_targets(std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  std::string provider = cfg.value().default_provider;
  std::string model = cfg.value().default_model;
  (void)take_option(args, "--provider", "", provider);
  (void)take_option(args, "--model", "", model);

  const config::ProcessEnvironment env;
  const auto targets = client::resolve_targets(
      config::model_params(cfg.value(), provider, model), cfg.value().llmws.defaults, env);
  for (const auto &target : targets) {
    std::cout << target.url;
    if (!target.capabilities.empty()) {
      std::cout << " [" << common::join(target.capabilities, ", ") << "]";
    }
    std::cout << "\n";
  }
  return 0;
}

int run_scan(std::vector<std::string> args) {
  auto cfg = load_and_observe();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto timeout = client::kDefaultScanTimeout;
  std::string value;
  if (take_option(args, "--timeout", "", value)) {
    auto parsed = parse_timeout(value);
    if (!parsed.ok()) {
      std::cerr << parsed.error() << "\n";
      return 1;
    }
    timeout = parsed.value();
  }
  const bool json_output = take_flag(args, "--json");
  args.erase(std::remove(args.begin(), args.end(), "--"), args.end());

  const config::ProcessEnvironment env;
  const auto endpoints = client::scan_endpoints(args, cfg.value(), env);
  if (endpoints.empty()) {
    std::cerr << "usage: llmws scan [--timeout MS] [--json] ws://host:port ...\n";
    return 1;
  }

  transport::WebSocketConnector connector;
  std::vector<client::ScanResult> results;
  results.reserve(endpoints.size());
  for (const auto &endpoint : endpoints) {
    results.push_back(client::scan_endpoint(connector, endpoint, timeout));
  }

  if (json_output) {
    std::cout << client::render_scan_json(results, common::now_iso8601());
  } else {
    std::cout << client::render_scan_table(results);
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: llmws [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [-m MESSAGE]       Send one request and print the reply\n";
  std::cout << "      --model ID --provider P --session-id ID --session-file FILE\n";
  std::cout << "      --remote-session ID --system TEXT --image FILE[:mime] --workspace DIR\n";
  std::cout << "      --timeout MS --temperature T --max-tokens N --json\n";
  std::cout << "  targets [--model ID]   Print the resolved endpoint order\n";
  std::cout << "  scan [--timeout MS] [--json] [ENDPOINT...]\n";
  std::cout << "                         Scan endpoints for model and capabilities\n";
  std::cout << "  config-path            Print the config file location\n";
  std::cout << "  version                Print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "targets") {
    return run_targets(std::move(args));
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace llmws::cli
