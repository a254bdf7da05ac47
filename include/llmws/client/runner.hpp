#pragma once

#include "llmws/client/attempt.hpp"
#include "llmws/client/budget_policy.hpp"
#include "llmws/client/failover.hpp"
#include "llmws/client/request_builder.hpp"
#include "llmws/client/settings.hpp"
#include "llmws/config/environment.hpp"
#include "llmws/config/schema.hpp"
#include "llmws/memory/memory.hpp"
#include "llmws/transport/connection.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace llmws::client {

struct RunRequest {
  std::string prompt;
  /// Empty means the configured default provider / model.
  std::string provider;
  std::string model;
  /// Local session id written into a new transcript header.
  std::string session_id;
  /// Server-side session to resume, sent in the hello.
  std::string remote_session_id;
  std::filesystem::path session_file;
  /// Empty means the configured workspace.
  std::filesystem::path workspace_dir;
  /// Zero means the configured call timeout.
  std::chrono::milliseconds timeout{0};
  std::string extra_system_prompt;
  StreamOverrides overrides;
  std::vector<ImageInput> images;
};

struct RunMeta {
  std::chrono::milliseconds duration{0};
  /// Server-assigned session id, or the local one when none was returned.
  std::string session_id;
  std::string provider;
  std::string model;
  std::string target;
  std::optional<Usage> usage;
};

struct RunResult {
  /// Reply with reasoning blocks removed; nullopt when nothing is left.
  std::optional<std::string> text;
  RunMeta meta;
};

/// One complete inference call: settings, prompt assembly, failover across
/// targets and transcript persistence.
class Runner {
public:
  Runner(config::Config config, transport::Connector &connector,
         const config::EnvironmentProvider &env, memory::MemorySearch *memory = nullptr,
         const TokenBudgetPolicy *budget_policy = nullptr);

  [[nodiscard]] common::Result<RunResult, FailoverError> run(const RunRequest &request);

  [[nodiscard]] RuntimeSettings settings_for(const std::string &provider, const std::string &model,
                                             std::chrono::milliseconds timeout,
                                             const StreamOverrides &overrides) const;

private:
  config::Config config_;
  transport::Connector &connector_;
  const config::EnvironmentProvider &env_;
  memory::MemorySearch *memory_;
  DoublingBudgetPolicy default_budget_policy_;
  const TokenBudgetPolicy *budget_policy_;
};

} // namespace llmws::client
