#include "llmgate/gateway/gateway.hpp"

#include "llmgate/audit/request_record.hpp"
#include "llmgate/budget/active_time.hpp"
#include "llmgate/common/fs.hpp"
#include "llmgate/gateway/redaction.hpp"

#include <sstream>
#include <thread>
#include <type_traits>
#include <variant>

namespace llmgate::gateway {

namespace {

constexpr const char *COMPONENT = "llm.gateway";

std::string join_labels(const std::vector<std::string> &labels) {
  std::ostringstream out;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << labels[i];
  }
  return out.str();
}

std::string handle_label(const std::string &provider, const std::string &model) {
  return model.empty() ? provider : provider + ":" + model;
}

std::string effective_model(const providers::CallParameters &params,
                            const providers::ProviderHandle &handle) {
  if (params.model.has_value() && !common::trim(*params.model).empty()) {
    return common::trim(*params.model);
  }
  return handle.model;
}

common::JsonValue optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::JsonValue(*value) : common::JsonValue();
}

GatewayError from_stream_error(const providers::StreamErrorEvent &event) {
  const std::string message = event.message.empty() ? "provider_error" : event.message;
  if (event.violation && !event.retryable) {
    return GatewayError::cap_exceeded(message, event.category);
  }
  if (event.retryable && !event.violation) {
    return GatewayError::retryable_provider(message, event.category);
  }
  return GatewayError::provider(message, event.category, event.retryable, event.violation);
}

/// Reports the start and end of a `run()` to the active-window hook. A hook that throws
/// on "stop" is logged; the exception cannot leave the destructor.
class ActiveWindowGuard {
public:
  ActiveWindowGuard(const ActiveWindowHook &hook, const observability::Telemetry &telemetry,
                    const std::string &run_id, const std::string &trace_id)
      : hook_(hook), telemetry_(telemetry), run_id_(run_id), trace_id_(trace_id) {
    if (hook_) {
      hook_(run_id_, trace_id_, "start");
    }
  }
  ~ActiveWindowGuard() {
    if (!hook_) {
      return;
    }
    try {
      hook_(run_id_, trace_id_, "stop");
    } catch (const std::exception &ex) {
      telemetry_.log(observability::LogLevel::Warn, COMPONENT,
                     std::string("active window hook failed: ") + ex.what());
    }
  }
  ActiveWindowGuard(const ActiveWindowGuard &) = delete;
  ActiveWindowGuard &operator=(const ActiveWindowGuard &) = delete;

private:
  const ActiveWindowHook &hook_;
  const observability::Telemetry &telemetry_;
  const std::string &run_id_;
  const std::string &trace_id_;
};

} // namespace

common::JsonValue CallSummary::to_json() const {
  common::JsonValue out = common::JsonValue::object();
  out["provider"] = provider;
  out["model"] = model;
  out["tokensPrompt"] = tokens_prompt;
  out["tokensCompletion"] = tokens_completion;
  out["finishReason"] = finish_reason;
  out["chainIndex"] = chain_index;
  out["attempt"] = attempt;
  if (cost_usd.has_value()) {
    out["costUsd"] = *cost_usd;
  }
  out["error"] = optional_json(error);
  return out;
}

LlmGateway::LlmGateway(config::Config config, GatewayDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)),
      backoff_(config_.llm_gateway.retry_backoff_base_ms,
               config_.llm_gateway.retry_backoff_jitter_ms, deps_.backoff_seed) {
  if (deps_.events == nullptr) {
    deps_.events = std::make_shared<events::NullEventSink>();
  }
  if (deps_.run_states == nullptr) {
    deps_.run_states = std::make_shared<RunStateStore>();
  }
  if (deps_.adapters == nullptr) {
    deps_.adapters = std::make_shared<providers::AdapterRegistry>();
  }
  if (deps_.estimator == nullptr) {
    deps_.estimator = std::make_shared<WordCountEstimator>();
  }
  if (deps_.telemetry.observer == nullptr || deps_.telemetry.tracer == nullptr ||
      deps_.telemetry.counters == nullptr) {
    deps_.telemetry = observability::Telemetry::create(deps_.telemetry.observer);
  }
  if (!deps_.sleeper) {
    deps_.sleeper = [](const std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

void LlmGateway::register_adapter(const std::string &provider,
                                  std::shared_ptr<providers::IStreamAdapter> adapter) {
  deps_.adapters->register_adapter(provider, std::move(adapter));
}

common::Result<CallSummary, GatewayError>
LlmGateway::run(const std::string &run_id, const std::string &trace_id, const std::string &prompt,
                const providers::CallParameters &params,
                const std::optional<std::string> &context_hash, const CancelToken &cancel) {
  using RunResult = common::Result<CallSummary, GatewayError>;
  const ActiveWindowGuard window(deps_.on_active_window, deps_.telemetry, run_id, trace_id);

  auto chain_result = providers::resolve_provider_chain(providers::provider_hint(params), config_);
  if (!chain_result.ok()) {
    deps_.telemetry.error(COMPONENT, chain_result.error().to_string());
    return RunResult::failure(chain_result.error());
  }
  const providers::ProviderChain &chain = chain_result.value();
  const std::string chain_text = join_labels(providers::chain_labels(chain));

  observability::Span call_span = deps_.telemetry.tracer->start_span(
      "llm.call", {{"run_id", run_id}, {"trace_id", trace_id}, {"llm.chain", chain_text}});
  deps_.telemetry.log(observability::LogLevel::Debug, COMPONENT,
                      "run " + run_id + " chain=" + chain_text);

  std::vector<std::string> attempted;
  for (std::size_t index = 0; index < chain.size(); ++index) {
    const providers::ProviderHandle &handle = chain[index];

    CallContext ctx{.run_id = run_id,
                    .trace_id = trace_id,
                    .prompt = prompt,
                    .cancel = cancel,
                    .params = params,
                    .handle = handle,
                    .model = effective_model(params, handle),
                    .chain_length = chain.size()};
    ctx.params.provider = handle.provider;
    if (ctx.model.empty()) {
      ctx.params.model.reset();
    } else {
      ctx.params.model = ctx.model;
    }
    ctx.params_hash = params_hash(ctx.params);
    ctx.prompt_hash = prompt_hash(prompt);
    ctx.instructions_hash = instructions_hash(ctx.params);
    attempted.push_back(handle_label(handle.provider, ctx.model));

    const std::uint64_t sequence = deps_.run_states->next_sequence(run_id);
    const auto persisted = persist_request(ctx, context_hash, sequence);
    if (!persisted.ok()) {
      GatewayError error = GatewayError::audit_failure(persisted.error());
      call_span.record_error(error.message);
      deps_.telemetry.error(COMPONENT, error.to_string());
      return RunResult::failure(std::move(error));
    }

    emit(events::EVENT_PROVIDER_SELECTED, run_id,
         {{"provider", handle.provider},
          {"model", ctx.model},
          {"paramsHash", ctx.params_hash},
          {"promptHash", ctx.prompt_hash},
          {"instructionsHash", optional_json(ctx.instructions_hash)},
          {"chainIndex", index},
          {"chainLength", chain.size()}});

    observability::Span provider_span = deps_.telemetry.tracer->start_span(
        "llm.provider",
        {{"llm.provider", handle.provider}, {"llm.model", ctx.model},
         {"llm.chain_index", std::to_string(index)}},
        &call_span);

    std::uint32_t attempt = 0;
    AttemptOutcome outcome;
    while (true) {
      ++attempt;
      outcome = run_attempt(ctx, attempt, provider_span);
      if (outcome.status == AttemptStatus::Success) {
        break;
      }
      record_failure(ctx, *outcome.error, attempt, provider_span);
      if (outcome.status != AttemptStatus::RetryableError) {
        break;
      }
      if (cancel.is_cancelled()) {
        outcome = canceled_between_attempts(ctx, attempt);
        break;
      }
      const auto delay = backoff_.delay(attempt - 1);
      deps_.telemetry.log(observability::LogLevel::Info, COMPONENT,
                          "retrying " + attempted.back() + " in " +
                              std::to_string(delay.count()) + "ms (attempt " +
                              std::to_string(attempt + 1) + ")");
      deps_.sleeper(delay);
      if (cancel.is_cancelled()) {
        outcome = canceled_between_attempts(ctx, attempt);
        break;
      }
    }

    if (outcome.status == AttemptStatus::Success) {
      CallSummary summary = std::move(*outcome.summary);
      if (summary.finish_reason != FINISH_CANCELED) {
        emit(events::EVENT_PROVIDER_SUCCEEDED, run_id,
             {{"provider", handle.provider},
              {"model", ctx.model},
              {"attempt", attempt},
              {"chainIndex", index}});
      }
      provider_span.set_status(observability::SpanStatus::Ok);
      call_span.set_attribute("llm.provider", handle.provider);
      call_span.set_attribute("llm.model", ctx.model);
      call_span.set_attribute("llm.finish_reason", summary.finish_reason);
      call_span.set_status(observability::SpanStatus::Ok);
      return RunResult::success(std::move(summary));
    }

    GatewayError error = std::move(*outcome.error);
    provider_span.end();
    if (!should_failover(error)) {
      call_span.record_error(error.message);
      deps_.telemetry.error(COMPONENT, error.to_string());
      return RunResult::failure(std::move(error));
    }

    if (index + 1 < chain.size()) {
      if (cancel.is_cancelled()) {
        CallSummary summary = std::move(*canceled_between_attempts(ctx, attempt).summary);
        call_span.set_attribute("llm.finish_reason", summary.finish_reason);
        call_span.set_status(observability::SpanStatus::Ok);
        return RunResult::success(std::move(summary));
      }
      const providers::ProviderHandle &next = chain[index + 1];
      const std::string next_model = effective_model(params, next);
      emit(events::EVENT_PROVIDER_FAILOVER, run_id,
           {{"fromProvider", handle.provider},
            {"fromModel", ctx.model},
            {"toProvider", next.provider},
            {"toModel", next_model},
            {"attempt", attempt},
            {"chainIndex", index},
            {"category", error.category}});
      count(observability::COUNTER_FALLBACK_TOTAL, 1,
            {{"from_provider", handle.provider},
             {"to_provider", next.provider},
             {"category", error.category}});
      deps_.telemetry.log(observability::LogLevel::Warn, COMPONENT,
                          "failing over from " + attempted.back() + " to " +
                              handle_label(next.provider, next_model) + ": " + error.message);
      continue;
    }

    GatewayError exhausted = GatewayError::all_providers_exhausted(attempted, std::move(error));
    call_span.record_error(exhausted.message);
    deps_.telemetry.error(COMPONENT, exhausted.to_string());
    return RunResult::failure(std::move(exhausted));
  }

  GatewayError exhausted = GatewayError::all_providers_exhausted(attempted);
  call_span.record_error(exhausted.message);
  return RunResult::failure(std::move(exhausted));
}

LlmGateway::AttemptOutcome LlmGateway::failed(GatewayError error, const std::uint32_t attempt) const {
  AttemptOutcome outcome;
  outcome.status = should_retry(error, attempt, config_.llm_gateway.retry_max)
                       ? AttemptStatus::RetryableError
                       : AttemptStatus::TerminalError;
  outcome.error = std::move(error);
  return outcome;
}

LlmGateway::AttemptOutcome LlmGateway::canceled_between_attempts(const CallContext &ctx,
                                                                 const std::uint32_t attempt) {
  emit(events::EVENT_CANCELED, ctx.run_id, {{"reason", "cancel_token"}});
  deps_.telemetry.log(observability::LogLevel::Info, COMPONENT,
                      "run " + ctx.run_id + " canceled after attempt " + std::to_string(attempt));
  AttemptOutcome outcome;
  outcome.status = AttemptStatus::Success;
  outcome.summary = CallSummary{.provider = ctx.handle.provider,
                                .model = ctx.model,
                                .tokens_prompt = 0,
                                .tokens_completion = 0,
                                .finish_reason = FINISH_CANCELED,
                                .cost_usd = std::nullopt,
                                .error = std::nullopt,
                                .chain_index = ctx.handle.chain_index,
                                .attempt = attempt};
  return outcome;
}

LlmGateway::AttemptOutcome LlmGateway::run_attempt(const CallContext &ctx,
                                                   const std::uint32_t attempt,
                                                   observability::Span &span) {
  const std::string &provider = ctx.handle.provider;
  emit(events::EVENT_STARTING, ctx.run_id,
       {{"provider", provider},
        {"model", ctx.model},
        {"paramsHash", ctx.params_hash},
        {"promptHash", ctx.prompt_hash},
        {"instructionsHash", optional_json(ctx.instructions_hash)},
        {"chainIndex", ctx.handle.chain_index},
        {"chainLength", ctx.chain_length},
        {"attempt", attempt},
        {"violation", false}});

  const auto adapter = deps_.adapters->find(provider);
  if (adapter == nullptr) {
    return failed(GatewayError::provider("No registered stream adapter for '" + provider + "'",
                                         std::string(CATEGORY_PROVIDER_UNAVAILABLE)),
                  attempt);
  }

  const providers::CallMetadata metadata{
      .run_id = ctx.run_id, .trace_id = ctx.trace_id, .attempt = attempt};
  std::optional<providers::ProviderStream> opened;
  try {
    auto result = adapter->open_stream(ctx.prompt, ctx.params, ctx.handle, metadata);
    if (!result.ok()) {
      return failed(result.error(), attempt);
    }
    opened = std::move(result.value());
  } catch (const std::exception &ex) {
    return failed(GatewayError::provider(ex.what(), std::string(CATEGORY_PROVIDER_ERROR)),
                  attempt);
  }
  providers::ProviderStream &stream = *opened;
  if (stream.events == nullptr) {
    return failed(GatewayError::provider("stream adapter returned no event source",
                                         std::string(CATEGORY_PROVIDER_ERROR)),
                  attempt);
  }

  const observability::Attributes usage_labels = {{"provider", provider}, {"model", ctx.model}};
  auto token_labels = [&usage_labels](const char *kind) {
    observability::Attributes labels = usage_labels;
    labels["kind"] = kind;
    return labels;
  };

  std::uint64_t prompt_tokens = stream.usage.prompt_tokens.value_or(0);
  if (prompt_tokens == 0) {
    prompt_tokens = deps_.estimator->estimate(ctx.prompt);
  }
  if (prompt_tokens > 0) {
    count(observability::COUNTER_TOKENS_TOTAL, static_cast<std::int64_t>(prompt_tokens),
          token_labels("prompt"));
  }
  span.set_attribute("llm.prompt_tokens", prompt_tokens);

  BudgetEnforcer budget(BudgetCaps::resolve(config_.llm_gateway, ctx.params.max_tokens),
                        stream.usage.completion_tokens.value_or(0),
                        stream.usage.cost_usd.value_or(0.0));

  std::optional<std::string> finish_reason;
  std::optional<GatewayError> stream_error;
  std::uint64_t idx = 0;

  while (true) {
    if (ctx.cancel.is_cancelled()) {
      cancel_stream(stream);
      emit(events::EVENT_CANCELED, ctx.run_id, {{"reason", "cancel_token"}});
      span.set_attribute("llm.finish_reason", FINISH_CANCELED);
      AttemptOutcome outcome;
      outcome.status = AttemptStatus::Success;
      outcome.summary = CallSummary{.provider = provider,
                                    .model = ctx.model,
                                    .tokens_prompt = prompt_tokens,
                                    .tokens_completion = budget.completion_tokens(),
                                    .finish_reason = FINISH_CANCELED,
                                    .cost_usd = std::nullopt,
                                    .error = std::nullopt,
                                    .chain_index = ctx.handle.chain_index,
                                    .attempt = attempt};
      return outcome;
    }

    std::optional<providers::ProviderEvent> event;
    try {
      event = stream.events->next();
    } catch (const std::exception &ex) {
      stream_error = GatewayError::provider(ex.what(), std::string(CATEGORY_PROVIDER_ERROR));
      break;
    }
    if (!event.has_value()) {
      break;
    }

    if (const auto *token = std::get_if<providers::TokenEvent>(&*event)) {
      emit(events::EVENT_TOKEN, ctx.run_id, {{"delta", token->delta}, {"idx", idx}});
      ++idx;

      const std::uint64_t before = budget.completion_tokens();
      if (token->usage.completion_tokens.has_value()) {
        budget.set_tokens(*token->usage.completion_tokens);
      } else {
        budget.add_tokens(deps_.estimator->estimate(token->delta));
      }
      if (budget.completion_tokens() > before) {
        count(observability::COUNTER_TOKENS_TOTAL,
              static_cast<std::int64_t>(budget.completion_tokens() - before),
              token_labels("completion"));
      }
      if (token->usage.cost_usd.has_value()) {
        budget.set_cost(*token->usage.cost_usd);
      }

      const BudgetReason reason = budget.check();
      if (reason != BudgetReason::None) {
        return abort_on_budget(ctx, attempt, stream, reason, prompt_tokens, budget, span);
      }
      continue;
    }

    if (const auto *complete = std::get_if<providers::CompleteEvent>(&*event)) {
      finish_reason = complete->finish_reason.value_or(FINISH_STOP);
      if (complete->usage.completion_tokens.has_value()) {
        budget.set_tokens(*complete->usage.completion_tokens);
      }
      if (complete->usage.prompt_tokens.has_value()) {
        prompt_tokens = *complete->usage.prompt_tokens;
      }
      if (complete->usage.cost_usd.has_value()) {
        budget.set_cost(*complete->usage.cost_usd);
      }
      break;
    }

    stream_error = from_stream_error(std::get<providers::StreamErrorEvent>(*event));
    break;
  }

  if (stream_error.has_value()) {
    return failed(std::move(*stream_error), attempt);
  }

  const std::string finish = finish_reason.value_or(FINISH_STOP);
  const double cost = budget.cost_usd();
  span.set_attribute("llm.finish_reason", finish);
  span.set_attribute("llm.completion_tokens", budget.completion_tokens());
  span.set_attribute("llm.cost_usd", cost);

  common::JsonValue::Object complete_fields = {{"finishReason", finish},
                                               {"tokensPrompt", prompt_tokens},
                                               {"tokensCompletion", budget.completion_tokens()}};
  CallSummary summary{.provider = provider,
                      .model = ctx.model,
                      .tokens_prompt = prompt_tokens,
                      .tokens_completion = budget.completion_tokens(),
                      .finish_reason = finish,
                      .cost_usd = std::nullopt,
                      .error = std::nullopt,
                      .chain_index = ctx.handle.chain_index,
                      .attempt = attempt};
  if (cost > 0.0) {
    complete_fields["costUsd"] = cost;
    summary.cost_usd = cost;
  }
  emit(events::EVENT_COMPLETE, ctx.run_id, std::move(complete_fields));

  AttemptOutcome outcome;
  outcome.status = AttemptStatus::Success;
  outcome.summary = std::move(summary);
  return outcome;
}

LlmGateway::AttemptOutcome LlmGateway::abort_on_budget(const CallContext &ctx,
                                                       const std::uint32_t attempt,
                                                       providers::ProviderStream &stream,
                                                       const BudgetReason reason,
                                                       const std::uint64_t prompt_tokens,
                                                       const BudgetEnforcer &budget,
                                                       observability::Span &span) {
  const std::string &provider = ctx.handle.provider;
  const char *reason_text = to_string(reason);
  cancel_stream(stream);

  emit(events::EVENT_ERROR, ctx.run_id,
       {{"category", std::string(CATEGORY_BUDGET_EXHAUSTED)},
        {"message", reason == BudgetReason::TokenCap ? "completion token cap reached"
                                                      : "cost cap reached"},
        {"retryable", false},
        {"attempt", attempt},
        {"violation", true}});
  emit(events::EVENT_BUDGET_EXHAUSTED, ctx.run_id,
       {{"provider", provider},
        {"model", ctx.model},
        {"reason", reason_text},
        {"chainIndex", ctx.handle.chain_index},
        {"tokensPrompt", prompt_tokens},
        {"tokensCompletion", budget.completion_tokens()},
        {"costUsd", budget.cost_usd()}});
  count(observability::COUNTER_BUDGET_ABORT_TOTAL, 1,
        {{"provider", provider}, {"model", ctx.model}, {"reason", reason_text}});
  deps_.telemetry.log(observability::LogLevel::Warn, COMPONENT,
                      "budget exhausted for run " + ctx.run_id + " (" + reason_text + ")");

  common::JsonValue::Object complete_fields = {{"finishReason", FINISH_STOP_ON_BUDGET},
                                               {"tokensPrompt", prompt_tokens},
                                               {"tokensCompletion", budget.completion_tokens()},
                                               {"budgetExhausted", true}};
  CallSummary summary{.provider = provider,
                      .model = ctx.model,
                      .tokens_prompt = prompt_tokens,
                      .tokens_completion = budget.completion_tokens(),
                      .finish_reason = FINISH_STOP_ON_BUDGET,
                      .cost_usd = std::nullopt,
                      .error = std::string(CATEGORY_BUDGET_EXHAUSTED),
                      .chain_index = ctx.handle.chain_index,
                      .attempt = attempt};
  if (budget.cost_usd() > 0.0) {
    complete_fields["costUsd"] = budget.cost_usd();
    summary.cost_usd = budget.cost_usd();
  }
  emit(events::EVENT_COMPLETE, ctx.run_id, std::move(complete_fields));

  span.set_attribute("llm.finish_reason", FINISH_STOP_ON_BUDGET);
  span.set_attribute("llm.completion_tokens", budget.completion_tokens());
  span.set_attribute("llm.cost_usd", budget.cost_usd());

  AttemptOutcome outcome;
  outcome.status = AttemptStatus::Success;
  outcome.summary = std::move(summary);
  return outcome;
}

void LlmGateway::record_failure(const CallContext &ctx, const GatewayError &error,
                                const std::uint32_t attempt, observability::Span &span) {
  emit(events::EVENT_ERROR, ctx.run_id,
       {{"category", error.category},
        {"message", error.message},
        {"retryable", error.retryable},
        {"attempt", attempt},
        {"violation", error.violation}});
  emit(events::EVENT_PROVIDER_FAILED, ctx.run_id,
       {{"provider", ctx.handle.provider},
        {"model", ctx.model},
        {"attempt", attempt},
        {"chainIndex", ctx.handle.chain_index}});
  count(observability::COUNTER_FAILURES_TOTAL, 1,
        {{"provider", ctx.handle.provider}, {"model", ctx.model}, {"category", error.category}});
  span.record_error(error.message);
  deps_.telemetry.log(observability::LogLevel::Warn, COMPONENT,
                      "attempt " + std::to_string(attempt) + " on " +
                          handle_label(ctx.handle.provider, ctx.model) +
                          " failed: " + error.to_string());
}

common::Status LlmGateway::persist_request(const CallContext &ctx,
                                           const std::optional<std::string> &context_hash,
                                           const std::uint64_t sequence) {
  if (deps_.artifacts == nullptr) {
    return common::Status::success();
  }

  const audit::RequestAuditRecord record{.trace_id = ctx.trace_id,
                                         .run_id = ctx.run_id,
                                         .provider = ctx.handle.provider,
                                         .model = ctx.model,
                                         .params = redacted_params(ctx.params),
                                         .prompt_hash = ctx.prompt_hash,
                                         .instructions_hash = ctx.instructions_hash,
                                         .context_hash = context_hash,
                                         .created_at = common::utc_timestamp_iso8601()};
  const std::string path = audit::request_artifact_path(ctx.run_id, sequence);
  auto stored = deps_.artifacts->put(ctx.run_id, path, record.serialize(), audit::CONTENT_TYPE_JSON);
  if (!stored.ok()) {
    return common::Status::error("audit write failed for " + path + ": " + stored.error());
  }
  deps_.telemetry.log(observability::LogLevel::Debug, COMPONENT,
                      "audit record stored at " + stored.value());
  return common::Status::success();
}

void LlmGateway::emit(const std::string &type, const std::string &run_id,
                      common::JsonValue::Object fields) {
  const events::LlmEvent event{.type = type, .run_id = run_id, .fields = std::move(fields)};
  try {
    deps_.events->emit(event);
  } catch (const std::exception &ex) {
    deps_.telemetry.log(observability::LogLevel::Warn, COMPONENT,
                        "event delivery failed for " + type + ": " + ex.what());
  }
}

void LlmGateway::cancel_stream(providers::ProviderStream &stream) {
  if (!stream.cancel) {
    return;
  }
  try {
    stream.cancel();
  } catch (const std::exception &ex) {
    deps_.telemetry.log(observability::LogLevel::Warn, COMPONENT,
                        std::string("stream cancel failed: ") + ex.what());
  }
}

void LlmGateway::count(const char *name, const std::int64_t value,
                       observability::Attributes labels) {
  deps_.telemetry.counters->add(name, value, labels);
}

ActiveWindowHook active_time_hook(std::shared_ptr<budget::ActiveTimeBudget> budget) {
  return [budget = std::move(budget)](const std::string &, const std::string &,
                                      const std::string_view phase) {
    if (budget == nullptr) {
      return;
    }
    if (phase == "start") {
      budget->start();
    } else if (phase == "stop") {
      budget->stop();
    }
  };
}

} // namespace llmgate::gateway
