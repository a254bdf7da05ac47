#include "llmws/config/config.hpp"

#include "llmws/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <set>
#include <vector>

namespace llmws::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".llmws";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LLMWS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  if (!std::filesystem::is_regular_file(path)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (trimmed.starts_with("export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Existing variables win over .env entries.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("LLMWS_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<double> read_number(const common::TomlDocument &doc, const std::string &prefix,
                                  std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    const std::string full = prefix + key;
    if (!doc.has(full)) {
      continue;
    }
    const std::string raw = common::trim(doc.values.at(full));
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      return parsed;
    }
  }
  return std::nullopt;
}

std::optional<bool> read_bool(const common::TomlDocument &doc, const std::string &prefix,
                              std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    const std::string full = prefix + key;
    if (!doc.has(full)) {
      continue;
    }
    const std::string raw = common::to_lower(common::trim(doc.values.at(full)));
    if (raw == "true" || raw == "false") {
      return raw == "true";
    }
  }
  return std::nullopt;
}

std::vector<std::string> read_list(const common::TomlDocument &doc, const std::string &prefix,
                                   std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    if (doc.has(prefix + key)) {
      return doc.get_string_array(prefix + key);
    }
  }
  return {};
}

GenerationParams read_generation(const common::TomlDocument &doc, const std::string &prefix) {
  GenerationParams params;
  params.max_new_tokens = read_number(doc, prefix, {"max_new_tokens", "maxNewTokens"});
  params.temperature = read_number(doc, prefix, {"temperature"});
  params.top_p = read_number(doc, prefix, {"top_p", "topP"});
  params.top_k = read_number(doc, prefix, {"top_k", "topK"});
  params.repetition_penalty =
      read_number(doc, prefix, {"repetition_penalty", "repetitionPenalty"});
  params.do_sample = read_bool(doc, prefix, {"do_sample", "doSample"});
  return params;
}

ParamBlock read_param_block(const common::TomlDocument &doc, const std::string &prefix) {
  ParamBlock block;
  for (const auto &url : doc.get_string_array(prefix + "servers")) {
    block.servers.push_back(ServerEntry{.url = url, .capabilities = {}});
  }
  const std::string targets_key = prefix + "targets";
  const std::size_t target_count = doc.table_array_size(targets_key);
  for (std::size_t i = 0; i < target_count; ++i) {
    const std::string entry = targets_key + "." + std::to_string(i) + ".";
    std::string url = doc.get_string(entry + "url");
    if (url.empty()) {
      url = doc.get_string(entry + "server");
    }
    block.servers.push_back(
        ServerEntry{.url = url, .capabilities = doc.get_string_array(entry + "capabilities")});
  }
  if (doc.has(prefix + "server")) {
    block.server = doc.get_string(prefix + "server");
  }

  block.server_capabilities = read_list(doc, prefix, {"server_capabilities", "serverCapabilities"});
  block.preferred_server_capabilities =
      read_list(doc, prefix, {"preferred_server_capabilities", "preferredServerCapabilities"});
  block.preferred_capabilities =
      read_list(doc, prefix, {"preferred_capabilities", "preferredCapabilities"});

  block.connect_timeout_ms = read_number(doc, prefix, {"connect_timeout_ms", "connectTimeoutMs"});
  block.read_timeout_ms = read_number(doc, prefix, {"read_timeout_ms", "readTimeoutMs"});
  block.include_history = read_bool(doc, prefix, {"include_history", "includeHistory"});
  block.history_turns = read_number(doc, prefix, {"history_turns", "historyTurns"});
  block.history_chars = read_number(doc, prefix, {"history_chars", "historyChars"});

  block.generation = read_generation(doc, prefix);
  block.config = read_generation(doc, prefix + "config.");
  return block;
}

std::set<std::string> model_ids(const common::TomlDocument &doc) {
  std::set<std::string> ids;
  auto add = [&ids](std::string name, const std::string &suffix) {
    if (!name.starts_with("models.")) {
      return;
    }
    name = name.substr(7);
    if (name.size() > suffix.size() && name.ends_with(suffix)) {
      name.resize(name.size() - suffix.size());
    }
    if (!name.empty()) {
      ids.insert(name);
    }
  };
  for (const auto &section : doc.sections) {
    add(section, ".config");
  }
  for (const auto &[name, count] : doc.table_arrays) {
    add(name, ".targets");
  }
  return ids;
}

bool is_known_log_level(const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(level));
  return normalized == "debug" || normalized == "info" || normalized == "warn" ||
         normalized == "error" || normalized == "off";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

std::filesystem::path resolve_workspace(const Config &config) {
  std::error_code ec;
  if (!common::trim(config.workspace).empty()) {
    const std::filesystem::path workspace(common::expand_path(config.workspace));
    const auto absolute = std::filesystem::absolute(workspace, ec);
    return ec ? workspace : absolute;
  }
  const auto cwd = std::filesystem::current_path(ec);
  return ec ? std::filesystem::path(".") : cwd;
}

common::Result<std::filesystem::path> resolve_sessions_dir(const Config &config) {
  if (!common::trim(config.sessions_dir).empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.sessions_dir)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / "sessions");
}

Config config_from_toml(const common::TomlDocument &doc) {
  Config config;
  config.default_provider = doc.get_string("default_provider", config.default_provider);
  config.default_model = doc.get_string("default_model", config.default_model);
  config.workspace = expand_config_value(doc.get_string("workspace", config.workspace));
  config.sessions_dir = expand_config_value(doc.get_string("sessions_dir", config.sessions_dir));
  config.system_prompt = doc.get_string("system_prompt", config.system_prompt);
  config.silent_reply_token = doc.get_string("silent_reply_token", config.silent_reply_token);
  config.context_files = doc.get_string_array("context_files", config.context_files);
  config.timeout_ms = doc.get_u64("timeout_ms", config.timeout_ms);

  config.llmws.defaults = read_param_block(doc, "llmws.");
  for (const auto &id : model_ids(doc)) {
    config.llmws.models[id] = read_param_block(doc, "models." + id + ".");
  }

  config.memory.backend = common::to_lower(doc.get_string("memory.backend", config.memory.backend));
  auto &http = config.memory.http;
  http.base_url = expand_config_value(doc.get_string("memory.http.base_url", http.base_url));
  http.api_key = expand_config_value(doc.get_string("memory.http.api_key", http.api_key));
  http.timeout_ms = doc.get_u64("memory.http.timeout_ms", http.timeout_ms);
  http.mode = doc.get_string("memory.http.mode", http.mode);
  http.max_results = static_cast<std::uint32_t>(
      doc.get_u64("memory.http.max_results", http.max_results));
  http.path_prefix = doc.get_string("memory.http.path_prefix", http.path_prefix);
  const std::string header_prefix = "memory.http.headers.";
  for (const auto &[key, value] : doc.values) {
    if (key.starts_with(header_prefix) && key.size() > header_prefix.size()) {
      http.headers[key.substr(header_prefix.size())] = expand_config_value(doc.get_string(key));
    }
  }

  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);
  return config;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *level = std::getenv("LLMWS_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.log_level = level;
  }
  if (const char *workspace = std::getenv("LLMWS_WORKSPACE"); workspace != nullptr && *workspace) {
    config.workspace = workspace;
  }
  if (const char *url = std::getenv("LLMWS_MEMORY_URL"); url != nullptr && *url) {
    config.memory.backend = "http";
    config.memory.http.base_url = url;
  }
  if (const char *key = std::getenv("LLMWS_MEMORY_API_KEY"); key != nullptr && *key) {
    config.memory.http.api_key = key;
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = config_from_toml(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.memory.backend != "builtin" && config.memory.backend != "http") {
    return common::Result<std::vector<std::string>>::failure("Invalid memory.backend: " +
                                                              config.memory.backend);
  }
  if (config.memory.backend == "http" && common::trim(config.memory.http.base_url).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.http.base_url is required when memory.backend = \"http\"");
  }
  if (!is_known_log_level(config.observability.log_level)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.log_level: " +
                                                              config.observability.log_level);
  }
  if (config.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("timeout_ms must be positive");
  }

  auto check_block = [&warnings](const std::string &name, const ParamBlock &block) {
    for (const auto &entry : block.servers) {
      if (common::trim(entry.url).empty()) {
        warnings.push_back(name + ": server entry without url is ignored");
      }
    }
    const auto max_tokens =
        block.config.max_new_tokens.has_value() ? block.config.max_new_tokens
                                                : block.generation.max_new_tokens;
    if (max_tokens.has_value() && *max_tokens <= 0.0) {
      warnings.push_back(name + ": max_new_tokens should be positive");
    }
  };
  check_block("llmws", config.llmws.defaults);
  for (const auto &[id, block] : config.llmws.models) {
    check_block("models." + id, block);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

ParamBlock model_params(const Config &config, const std::string &provider,
                        const std::string &model) {
  const auto it = config.llmws.models.find(provider + "/" + model);
  if (it == config.llmws.models.end()) {
    return {};
  }
  return it->second;
}

} // namespace llmws::config
