#include "llmws/client/runner.hpp"

#include "llmws/common/fs.hpp"
#include "llmws/common/text.hpp"
#include "llmws/config/config.hpp"
#include "llmws/observability/global.hpp"
#include "llmws/sessions/transcript.hpp"

namespace llmws::client {

namespace {

std::string or_default(const std::string &value, const std::string &fallback) {
  const std::string trimmed = common::trim(value);
  return trimmed.empty() ? fallback : trimmed;
}

std::optional<std::uint64_t> total_tokens(const std::optional<Usage> &usage) {
  if (!usage.has_value() || !usage->total.has_value()) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*usage->total);
}

} // namespace

Runner::Runner(config::Config config, transport::Connector &connector,
               const config::EnvironmentProvider &env, memory::MemorySearch *memory,
               const TokenBudgetPolicy *budget_policy)
    : config_(std::move(config)), connector_(connector), env_(env), memory_(memory),
      budget_policy_(budget_policy != nullptr ? budget_policy : &default_budget_policy_) {}

RuntimeSettings Runner::settings_for(const std::string &provider, const std::string &model,
                                     const std::chrono::milliseconds timeout,
                                     const StreamOverrides &overrides) const {
  return resolve_runtime_settings(config::model_params(config_, provider, model),
                                  config_.llmws.defaults, timeout, overrides, env_);
}

common::Result<RunResult, FailoverError> Runner::run(const RunRequest &request) {
  using Out = common::Result<RunResult, FailoverError>;
  const auto started = std::chrono::steady_clock::now();
  const std::string provider = or_default(request.provider, config_.default_provider);
  const std::string model = or_default(request.model, or_default(config_.default_model, "default"));
  const auto elapsed = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };

  const auto timeout = request.timeout.count() > 0
                           ? request.timeout
                           : std::chrono::milliseconds(config_.timeout_ms);
  const RuntimeSettings settings = settings_for(provider, model, timeout, request.overrides);
  observability::record_inference_start(provider, model, settings.targets.size());

  const std::filesystem::path workspace =
      request.workspace_dir.empty() ? config::resolve_workspace(config_) : request.workspace_dir;

  const ContextFileLimits file_limits = context_file_limits(env_);
  SystemPromptOptions system_options;
  system_options.base_prompt = config_.system_prompt;
  system_options.extra_system_prompt = request.extra_system_prompt;
  system_options.context_files =
      clamp_context_files(load_context_files(workspace, config_.context_files),
                          file_limits.max_total_chars, file_limits.max_file_chars);
  system_options.model_display = provider + "/" + model;

  AttemptRequest attempt;
  attempt.connect_timeout = settings.connect_timeout;
  attempt.read_timeout = settings.read_timeout;
  attempt.resume_session_id = request.remote_session_id;
  attempt.system_prompt = build_system_prompt(system_options);
  attempt.generation = settings.generation;
  attempt.media = build_media_payload(request.images);

  std::optional<std::string> history;
  if (settings.include_history && !request.session_file.empty()) {
    history = read_history_context(request.session_file, settings.history_turns,
                                   settings.history_chars, config_.silent_reply_token);
  }
  const std::optional<std::string> memory =
      resolve_memory_injection(memory_, request.prompt, memory_injection_limits(env_));
  attempt.user_prompt = build_user_prompt(history, memory, request.prompt);

  auto outcome = run_with_failover(
      settings.targets,
      [&](const Target &target) {
        AttemptRequest per_target = attempt;
        per_target.target = target.url;
        return run_attempt(connector_, per_target, *budget_policy_);
      },
      provider, model);
  if (!outcome.ok()) {
    observability::record_inference_end(elapsed(), false);
    observability::log_warn("llmws", outcome.error().message);
    return Out::failure(outcome.error());
  }

  const AttemptResult &result = outcome.value().result;
  RunResult run;
  const std::string final_text = common::strip_reasoning_tags(result.text);
  if (!final_text.empty()) {
    run.text = final_text;
    // An image-only turn has no user text to record.
    if (!request.session_file.empty() && !common::trim(request.prompt).empty()) {
      const std::string transcript_session =
          or_default(request.session_id, or_default(result.session_id, request.session_file.stem().string()));
      auto appended = sessions::append_turn(sessions::TurnRecord{.session_file = request.session_file,
                                                                 .session_id = transcript_session,
                                                                 .workspace_dir = workspace,
                                                                 .user_text = request.prompt,
                                                                 .assistant_text = final_text});
      if (!appended.ok()) {
        observability::record_inference_end(elapsed(), false);
        observability::record_error("transcript", appended.error());
        FailoverError error;
        error.reason = FailoverReason::Unknown;
        error.message = "failed to persist llmws transcript: " + appended.error();
        error.provider = provider;
        error.model = model;
        return Out::failure(std::move(error));
      }
      observability::record_transcript_append(request.session_file.string());
    }
  }

  run.meta.duration = elapsed();
  run.meta.session_id = or_default(result.session_id, request.session_id);
  run.meta.provider = provider;
  run.meta.model = model;
  run.meta.target = outcome.value().target.url;
  run.meta.usage = result.usage;
  observability::record_inference_end(run.meta.duration, true, total_tokens(run.meta.usage));
  return Out::success(std::move(run));
}

} // namespace llmws::client
