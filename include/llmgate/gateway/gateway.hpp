#pragma once

#include "llmgate/audit/artifact_store.hpp"
#include "llmgate/common/json.hpp"
#include "llmgate/common/result.hpp"
#include "llmgate/config/schema.hpp"
#include "llmgate/events/event.hpp"
#include "llmgate/gateway/budget.hpp"
#include "llmgate/gateway/cancel.hpp"
#include "llmgate/gateway/errors.hpp"
#include "llmgate/gateway/policy.hpp"
#include "llmgate/gateway/run_state.hpp"
#include "llmgate/observability/telemetry.hpp"
#include "llmgate/providers/chain.hpp"
#include "llmgate/providers/registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llmgate::budget {
class ActiveTimeBudget;
}

namespace llmgate::gateway {

inline constexpr const char *FINISH_STOP = "stop";
inline constexpr const char *FINISH_STOP_ON_BUDGET = "stop_on_budget";
inline constexpr const char *FINISH_CANCELED = "canceled";

struct CallSummary {
  std::string provider;
  std::string model;
  std::uint64_t tokens_prompt = 0;
  std::uint64_t tokens_completion = 0;
  std::string finish_reason = FINISH_STOP;
  std::optional<double> cost_usd;
  /// Only set for budget aborts.
  std::optional<std::string> error;
  std::size_t chain_index = 0;
  std::uint32_t attempt = 1;

  [[nodiscard]] common::JsonValue to_json() const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Called with phase "start" when `run()` begins and "stop" when it returns.
using ActiveWindowHook =
    std::function<void(const std::string &run_id, const std::string &trace_id,
                       std::string_view phase)>;

/// Everything the gateway talks to. Unset members fall back to inert or
/// in-process defaults.
struct GatewayDependencies {
  std::shared_ptr<events::IEventSink> events;
  std::shared_ptr<audit::IArtifactStore> artifacts;
  std::shared_ptr<RunStateStore> run_states;
  std::shared_ptr<providers::AdapterRegistry> adapters;
  std::shared_ptr<ITokenEstimator> estimator;
  observability::Telemetry telemetry;
  Sleeper sleeper;
  ActiveWindowHook on_active_window;
  std::optional<std::uint64_t> backoff_seed;
};

/// Drives one logical completion request across the provider chain: audit, retries,
/// failover, streaming, budget caps and cancellation.
class LlmGateway {
public:
  LlmGateway(config::Config config, GatewayDependencies deps);

  void register_adapter(const std::string &provider, std::shared_ptr<providers::IStreamAdapter> adapter);

  [[nodiscard]] common::Result<CallSummary, GatewayError>
  run(const std::string &run_id, const std::string &trace_id, const std::string &prompt,
      const providers::CallParameters &params, const std::optional<std::string> &context_hash,
      const CancelToken &cancel);

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] providers::AdapterRegistry &adapters() { return *deps_.adapters; }
  [[nodiscard]] const observability::Telemetry &telemetry() const { return deps_.telemetry; }

private:
  enum class AttemptStatus { Success, RetryableError, TerminalError };

  struct AttemptOutcome {
    AttemptStatus status = AttemptStatus::TerminalError;
    std::optional<CallSummary> summary;
    std::optional<GatewayError> error;
  };

  struct CallContext {
    const std::string &run_id;
    const std::string &trace_id;
    const std::string &prompt;
    const CancelToken &cancel;
    providers::CallParameters params;
    providers::ProviderHandle handle;
    std::string model;
    std::size_t chain_length = 0;
    std::string params_hash;
    std::string prompt_hash;
    std::optional<std::string> instructions_hash;
  };

  [[nodiscard]] AttemptOutcome run_attempt(const CallContext &ctx, std::uint32_t attempt,
                                           observability::Span &span);
  [[nodiscard]] AttemptOutcome failed(GatewayError error, std::uint32_t attempt) const;
  [[nodiscard]] AttemptOutcome canceled_between_attempts(const CallContext &ctx,
                                                         std::uint32_t attempt);
  [[nodiscard]] AttemptOutcome abort_on_budget(const CallContext &ctx, std::uint32_t attempt,
                                               providers::ProviderStream &stream,
                                               BudgetReason reason, std::uint64_t prompt_tokens,
                                               const BudgetEnforcer &budget,
                                               observability::Span &span);

  [[nodiscard]] common::Status persist_request(const CallContext &ctx,
                                               const std::optional<std::string> &context_hash,
                                               std::uint64_t sequence);
  void record_failure(const CallContext &ctx, const GatewayError &error, std::uint32_t attempt,
                      observability::Span &span);
  void emit(const std::string &type, const std::string &run_id, common::JsonValue::Object fields);
  void cancel_stream(providers::ProviderStream &stream);
  void count(const char *name, std::int64_t value, observability::Attributes labels);

  config::Config config_;
  GatewayDependencies deps_;
  BackoffPolicy backoff_;
};

[[nodiscard]] ActiveWindowHook
active_time_hook(std::shared_ptr<budget::ActiveTimeBudget> budget);

} // namespace llmgate::gateway
