#include "test_framework.hpp"

#include "llmgate/budget/active_time.hpp"
#include "llmgate/common/hash.hpp"
#include "llmgate/common/json.hpp"
#include "llmgate/events/event.hpp"
#include "llmgate/gateway/gateway.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace gw = llmgate::gateway;
namespace ev = llmgate::events;
namespace pr = llmgate::providers;
namespace obs = llmgate::observability;
using llmgate::testing::complete;
using llmgate::testing::GatewayHarness;
using llmgate::testing::stream_error;
using llmgate::testing::token;

class FailingArtifactStore final : public llmgate::audit::IArtifactStore {
public:
  [[nodiscard]] llmgate::common::Result<std::string> put(const std::string &, const std::string &,
                                                         const std::string &,
                                                         const std::string &) override {
    return llmgate::common::Result<std::string>::failure("disk full");
  }
  [[nodiscard]] std::string_view name() const override { return "failing"; }
};

class ThrowingEventSink final : public ev::IEventSink {
public:
  void emit(const ev::LlmEvent &) override { throw std::runtime_error("consumer went away"); }
};

/// Trips the cancel token while handing out its only event.
class CancellingEventSource final : public pr::IEventSource {
public:
  CancellingEventSource(gw::CancelToken &cancel, pr::ProviderEvent event)
      : cancel_(cancel), event_(std::move(event)) {}

  [[nodiscard]] std::optional<pr::ProviderEvent> next() override {
    if (done_) {
      return std::nullopt;
    }
    done_ = true;
    cancel_.cancel();
    return event_;
  }

private:
  gw::CancelToken &cancel_;
  pr::ProviderEvent event_;
  bool done_ = false;
};

std::shared_ptr<pr::FunctionStreamAdapter> cancelling_adapter(gw::CancelToken &cancel,
                                                              std::shared_ptr<int> calls) {
  return std::make_shared<pr::FunctionStreamAdapter>(
      [&cancel, calls](const std::string &, const pr::CallParameters &, const pr::ProviderHandle &,
                       const pr::CallMetadata &) {
        ++*calls;
        pr::ProviderStream stream;
        stream.events = std::make_unique<CancellingEventSource>(
            cancel, stream_error("overloaded", true, "server_error"));
        return llmgate::common::Result<pr::ProviderStream, gw::GatewayError>::success(
            std::move(stream));
      });
}

std::size_t index_of(const std::vector<std::string> &types, const std::string &type,
                     const std::size_t from = 0) {
  for (std::size_t i = from; i < types.size(); ++i) {
    if (types[i] == type) {
      return i;
    }
  }
  return types.size();
}

std::size_t last_index_of(const std::vector<std::string> &types, const std::string &type) {
  std::size_t found = types.size();
  for (std::size_t i = 0; i < types.size(); ++i) {
    if (types[i] == type) {
      found = i;
    }
  }
  return found;
}

pr::ProviderEvent priced_token(std::string delta, const double cost) {
  pr::TokenEvent event;
  event.delta = std::move(delta);
  event.usage.cost_usd = cost;
  return event;
}

} // namespace

void register_gateway_tests(std::vector<llmgate::tests::TestCase> &tests) {
  using llmgate::tests::require;
  using llmgate::tests::require_eq;

  tests.push_back({"gateway_streams_tokens_and_returns_summary", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("hello"), token(" world"), complete("stop")});

                     const auto result = h.run("say hi");
                     require(result.ok(), "call should succeed");
                     const auto &summary = result.value();
                     require(summary.provider == "alpha", "provider mismatch");
                     require(summary.model == "alpha-1", "model mismatch");
                     require(summary.tokens_prompt == 2, "prompt estimate should be word count");
                     require(summary.tokens_completion == 2, "completion estimate mismatch");
                     require(summary.finish_reason == "stop", "finish reason mismatch");
                     require(!summary.error.has_value(), "no error expected");

                     const std::vector<std::string> expected = {
                         "provider_selected", "starting", "token", "token", "complete",
                         "provider_succeeded"};
                     require(h.sink->types() == expected, "unexpected event sequence");

                     const auto tokens = h.sink->of_type("token");
                     require(tokens[0].field("idx")->as_int() == 0, "first idx should be 0");
                     require(tokens[1].field("idx")->as_int() == 1, "second idx should be 1");
                     require(tokens[1].field("delta")->as_string() == " world", "delta mismatch");
                     require(tokens[0].to_json().find("runId")->as_string() == "run-1",
                             "events carry the run id");
                   }});

  tests.push_back({"gateway_retries_retryable_error_on_same_provider", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("busy", true, "rate_limit")});
                     h.alpha->push_events({token("ok"), complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "retry should recover");
                     require(result.value().provider == "alpha", "should stay on alpha");
                     require(result.value().attempt == 2, "second attempt should succeed");
                     require(h.alpha->calls() == 2, "alpha should be invoked twice");
                     require(h.beta->calls() == 0, "no failover expected");
                     require(h.sleeps->size() == 1, "one backoff sleep expected");
                     require((*h.sleeps)[0].count() == 10, "first backoff should equal base");

                     const auto metadata = h.alpha->metadata();
                     require(metadata[0].attempt == 1 && metadata[1].attempt == 2,
                             "attempt numbers should increase");
                     require(h.sink->count("starting") == 2, "one starting event per attempt");
                     require(h.sink->count("provider_selected") == 1,
                             "chain position does not change on retry");
                     require(h.sink->count("error") == 1, "failed attempt emits error");
                     require(h.sink->count("provider_failed") == 1, "failed attempt emits provider_failed");
                     require(h.sink->count("provider_failover") == 0, "no failover expected");
                     require(h.telemetry.counters->total(obs::COUNTER_FAILURES_TOTAL) == 1,
                             "failure counter should be 1");
                   }});

  tests.push_back({"gateway_fails_over_after_retries_exhausted", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("slow", true, "timeout")});
                     h.beta->push_events({token("fine"), complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "beta should succeed");
                     require(result.value().provider == "beta", "summary should come from beta");
                     require(result.value().chain_index == 1, "chain index mismatch");
                     require(h.alpha->calls() == 3, "alpha should get retry_max + 1 attempts");
                     require(h.sleeps->size() == 2, "two backoff sleeps expected");
                     require((*h.sleeps)[0].count() == 10 && (*h.sleeps)[1].count() == 20,
                             "backoff should double");

                     const auto failovers = h.sink->of_type("provider_failover");
                     require(failovers.size() == 1, "one failover expected");
                     require(failovers[0].field("fromProvider")->as_string() == "alpha",
                             "fromProvider mismatch");
                     require(failovers[0].field("toProvider")->as_string() == "beta",
                             "toProvider mismatch");
                     require(failovers[0].field("toModel")->as_string() == "beta-1",
                             "toModel mismatch");
                     require(failovers[0].field("category")->as_string() == "timeout",
                             "failover category mismatch");
                     require(failovers[0].field("attempt")->as_int() == 3, "failover attempt mismatch");
                     require(h.telemetry.counters->total(obs::COUNTER_FALLBACK_TOTAL) == 1,
                             "fallback counter should be 1");
                     require(h.telemetry.counters->value(obs::COUNTER_FALLBACK_TOTAL,
                                                         {{"from_provider", "alpha"},
                                                          {"to_provider", "beta"},
                                                          {"category", "timeout"}}) == 1,
                             "fallback labels mismatch");
                   }});

  tests.push_back({"gateway_violation_is_never_retried_or_failed_over", [] {
                     for (const bool retryable : {false, true}) {
                       GatewayHarness h;
                       h.alpha->push_events({stream_error("hard limit", retryable, "quota_exceeded", true)});
                       h.beta->push_events({token("unused"), complete()});

                       const auto result = h.run("hello");
                       require(!result.ok(), "violation should fail the call");
                       require(result.error().violation, "error should keep violation flag");
                       require(result.error().category == "quota_exceeded", "category mismatch");
                       require(result.error().kind != gw::ErrorKind::AllProvidersExhausted,
                               "violation surfaces as-is");
                       require(h.alpha->calls() == 1, "no retry on violation");
                       require(h.beta->calls() == 0, "no failover on violation");
                       require(h.sleeps->empty(), "no backoff on violation");
                       require(h.sink->count("provider_failover") == 0, "no failover event");
                     }
                   }});

  tests.push_back({"gateway_cap_exceeded_error_kind_from_stream", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("over", false, "cap_exceeded", true)});
                     const auto result = h.run("hello");
                     require(!result.ok(), "call should fail");
                     require(result.error().kind == gw::ErrorKind::CapExceeded, "kind should be CapExceeded");
                   }});

  tests.push_back({"gateway_walks_chain_until_last_entry_succeeds", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.provider_chain.push_back(
                         llmgate::config::ProviderFallback{.provider = "gamma", .model = "gamma-1"});
                     GatewayHarness h(config);
                     auto gamma = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     h.gateway().register_adapter("GAMMA", gamma);

                     h.alpha->push_events({stream_error("500", false, "server_error")});
                     h.beta->push_open_error(gw::GatewayError::provider(
                         "no capacity", std::string(gw::CATEGORY_PROVIDER_UNAVAILABLE)));
                     gamma->push_events({token("done"), complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "gamma should succeed");
                     require(result.value().provider == "gamma", "summary should come from gamma");
                     require(result.value().chain_index == 2, "chain index mismatch");
                     require(h.sink->count("provider_selected") == 3, "three selections expected");
                     require(h.sink->count("starting") == 3, "three starts expected");
                     require(h.sink->count("provider_failover") == 2, "two failovers expected");
                     require(h.sink->count("provider_succeeded") == 1, "one success expected");

                     const auto selected = h.sink->of_type("provider_selected");
                     for (std::size_t i = 0; i < selected.size(); ++i) {
                       require(selected[i].field("chainIndex")->as_int() == static_cast<std::int64_t>(i),
                               "selections should follow chain order");
                       require(selected[i].field("chainLength")->as_int() == 3, "chain length mismatch");
                     }
                   }});

  tests.push_back({"gateway_raises_all_providers_exhausted_in_chain_order", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("down", false, "server_error")});
                     h.beta->push_events({stream_error("quota", false, "quota_exceeded")});

                     const auto result = h.run("hello");
                     require(!result.ok(), "call should fail");
                     const auto &error = result.error();
                     require(error.kind == gw::ErrorKind::AllProvidersExhausted, "kind mismatch");
                     const std::vector<std::string> expected = {"alpha:alpha-1", "beta:beta-1"};
                     require(error.attempted == expected, "attempted labels mismatch");
                     require(error.cause != nullptr, "last error should be kept");
                     require(error.cause->category == "quota_exceeded", "cause category mismatch");
                     require(!error.retryable && !error.violation, "exhaustion flags mismatch");
                     require(h.sink->count("provider_failover") == 1, "one failover expected");
                     require(h.store->paths("run-1").size() == 2, "one audit record per chain entry");
                   }});

  tests.push_back({"gateway_propagates_failover_ineligible_error", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("bad request", false, "invalid_request")});
                     const auto result = h.run("hello");
                     require(!result.ok(), "call should fail");
                     require(result.error().kind == gw::ErrorKind::Provider, "kind mismatch");
                     require(result.error().category == "invalid_request", "category mismatch");
                     require(h.beta->calls() == 0, "no failover for ineligible category");
                   }});

  tests.push_back({"gateway_missing_adapter_fails_over_as_unavailable", [] {
                     GatewayHarness h;
                     require(h.gateway().adapters().unregister_adapter("Alpha"),
                             "alpha adapter should be registered");
                     h.beta->push_events({token("ok"), complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "beta should succeed");
                     const auto errors = h.sink->of_type("error");
                     require(errors.size() == 1, "one error event expected");
                     require(errors[0].field("category")->as_string() == "provider_unavailable",
                             "missing adapter category mismatch");
                     require(!errors[0].field("retryable")->as_bool(), "missing adapter is not retryable");
                     require(h.sleeps->empty(), "missing adapter is not retried");
                   }});

  tests.push_back({"gateway_wraps_adapter_exceptions_as_provider_error", [] {
                     GatewayHarness h;
                     h.alpha->push_throw("boom");
                     h.beta->push_events({token("ok"), complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "exception should fail over to beta");
                     const auto errors = h.sink->of_type("error");
                     require(errors.size() == 1, "one error event expected");
                     require(errors[0].field("category")->as_string() == "provider_error",
                             "exception category mismatch");
                     require(errors[0].field("message")->as_string() == "boom", "message mismatch");
                   }});

  tests.push_back({"gateway_redacts_secrets_in_audit_and_hash", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("ok"), complete()});

                     pr::CallParameters params;
                     params.temperature = 0.2;
                     params.extra["api_key"] = "sk-live-123";
                     llmgate::common::JsonValue nested = llmgate::common::JsonValue::object();
                     nested["Secret"] = "hidden-secret";
                     nested["auth_token"] = "tok-999";
                     params.extra["nested"] = nested;
                     llmgate::common::JsonValue list = llmgate::common::JsonValue::array();
                     llmgate::common::JsonValue item = llmgate::common::JsonValue::object();
                     item["password"] = "pw-xyz";
                     list.push_back(item);
                     params.extra["list"] = list;

                     require(h.run("hello", params).ok(), "first call should succeed");
                     const auto stored =
                         h.store->get("run-1", "artifacts/llm/run-1/0001/request.json");
                     require(stored.has_value(), "audit record should be stored");
                     for (const std::string secret :
                          {"sk-live-123", "hidden-secret", "tok-999", "pw-xyz", "hello"}) {
                       require(stored->data.find(secret) == std::string::npos,
                               "audit record leaked " + secret);
                     }
                     require(stored->data.find("***") != std::string::npos, "mask should be present");
                     require(stored->content_type == "application/json", "content type mismatch");

                     params.extra["api_key"] = "sk-other-456";
                     require(h.run("hello", params).ok(), "second call should succeed");
                     params.temperature = 0.9;
                     require(h.run("hello", params).ok(), "third call should succeed");

                     const auto selected = h.sink->of_type("provider_selected");
                     require(selected.size() == 3, "three calls expected");
                     const auto first = selected[0].field("paramsHash")->as_string();
                     require(first.rfind("sha256:", 0) == 0, "hash should be tagged");
                     require(first == selected[1].field("paramsHash")->as_string(),
                             "secret-only change must not change the hash");
                     require(first != selected[2].field("paramsHash")->as_string(),
                             "temperature change must change the hash");
                     require(h.store->paths("run-1").size() == 3, "sequence should advance per call");
                     require(h.store->get("run-1", "artifacts/llm/run-1/0003/request.json").has_value(),
                             "third record should use sequence 0003");
                   }});

  tests.push_back({"gateway_audit_record_fields", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("ok"), complete()});
                     pr::CallParameters params;
                     params.extra["system"] = "be terse";

                     gw::CancelToken cancel;
                     const auto result = h.gateway().run("run-9", "trace-9", "hello there", params,
                                                         std::string("sha256:ctx"), cancel);
                     require(result.ok(), "call should succeed");
                     const auto stored = h.store->get("run-9", "artifacts/llm/run-9/0001/request.json");
                     require(stored.has_value(), "audit record should exist");
                     const auto parsed = llmgate::common::parse_json(stored->data);
                     require(parsed.ok(), "audit record should be valid JSON");
                     const auto &record = parsed.value();
                     require(record.find("traceId")->as_string() == "trace-9", "traceId mismatch");
                     require(record.find("runId")->as_string() == "run-9", "runId mismatch");
                     require(record.find("provider")->as_string() == "alpha", "provider mismatch");
                     require(record.find("model")->as_string() == "alpha-1", "model mismatch");
                     require(record.find("contextHash")->as_string() == "sha256:ctx", "contextHash mismatch");
                     require(record.find("promptHash")->as_string() ==
                                 *llmgate::common::hash_text("hello there"),
                             "promptHash mismatch");
                     require(record.find("instructionsHash")->as_string() ==
                                 *llmgate::common::hash_text("be terse"),
                             "instructionsHash mismatch");
                     require(stored->data.find("be terse") == std::string::npos,
                             "raw instructions must not be persisted");
                     require(record.find("createdAt")->as_string().back() == 'Z', "createdAt should be UTC");
                     require(stored->data.find("\n  \"") != std::string::npos,
                             "record should be pretty printed");

                     const auto starting = h.sink->of_type("starting");
                     require(starting[0].field("instructionsHash")->as_string() ==
                                 record.find("instructionsHash")->as_string(),
                             "starting event should carry the instructions hash");
                     require(!starting[0].field("violation")->as_bool(), "starting violation flag");
                   }});

  tests.push_back({"gateway_audit_failure_stops_before_provider", [] {
                     auto sink = std::make_shared<llmgate::testing::RecordingEventSink>();
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({token("never"), complete()});
                     gw::GatewayDependencies deps;
                     deps.events = sink;
                     deps.artifacts = std::make_shared<FailingArtifactStore>();
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     gw::CancelToken cancel;
                     const auto result = gateway.run("run-a", "trace-a", "hello", {}, std::nullopt, cancel);
                     require(!result.ok(), "audit failure should fail the call");
                     require(result.error().kind == gw::ErrorKind::AuditFailure, "kind mismatch");
                     require(result.error().message.find("disk full") != std::string::npos,
                             "store error should be kept");
                     require(adapter->calls() == 0, "provider must not be contacted");
                     require(sink->count("starting") == 0, "no attempt should start");
                   }});

  tests.push_back({"gateway_without_artifact_store_skips_audit", [] {
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({token("ok"), complete()});
                     auto runs = std::make_shared<gw::RunStateStore>();
                     gw::GatewayDependencies deps;
                     deps.run_states = runs;
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     gw::CancelToken cancel;
                     const auto result = gateway.run("run-b", "trace-b", "hello", {}, std::nullopt, cancel);
                     require(result.ok(), "call should succeed without audit");
                     require(runs->current_sequence("run-b") == 1, "sequence still advances");
                   }});

  tests.push_back({"gateway_token_cap_aborts_stream", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.tokens_cap = 3;
                     GatewayHarness h(config);
                     h.alpha->push_events({token("a"), token("b"), token("c"), token("d"), token("e"),
                                           complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "budget abort is not an error");
                     const auto &summary = result.value();
                     require(summary.finish_reason == "stop_on_budget", "finish reason mismatch");
                     require(summary.error.has_value() && *summary.error == "budget_exhausted",
                             "summary error mismatch");
                     require(summary.tokens_completion == 3, "completion tokens mismatch");
                     require(h.alpha->cancel_calls() == 1, "stream should be cancelled once");
                     require(h.sink->count("budget_exhausted") == 1, "one budget event expected");
                     require(h.sink->count("token") == 3, "no tokens after the cap");

                     const auto errors = h.sink->of_type("error");
                     require(errors.size() == 1, "one error event expected");
                     require(errors[0].field("category")->as_string() == "budget_exhausted",
                             "error category mismatch");

                     const auto budget = h.sink->of_type("budget_exhausted")[0];
                     require(budget.field("reason")->as_string() == "token_cap", "reason mismatch");
                     require(budget.field("tokensCompletion")->as_int() == 3, "counter mismatch");

                     const auto types = h.sink->types();
                     const auto budget_at = index_of(types, "budget_exhausted");
                     require(last_index_of(types, "token") < budget_at, "tokens must precede abort");
                     require(index_of(types, "error") < budget_at, "error precedes budget event");
                     const auto completes = h.sink->of_type("complete");
                     require(completes.size() == 1, "one complete event expected");
                     require(completes[0].field("budgetExhausted")->as_bool(), "budget flag missing");
                     require(completes[0].field("finishReason")->as_string() == "stop_on_budget",
                             "complete finish reason mismatch");

                     require(h.beta->calls() == 0, "budget abort never fails over");
                     require(h.sink->count("provider_failed") == 0, "budget abort is not a failure");
                     require(h.sleeps->empty(), "budget abort is never retried");
                     require(h.telemetry.counters->total(obs::COUNTER_BUDGET_ABORT_TOTAL) == 1,
                             "budget abort counter mismatch");
                   }});

  tests.push_back({"gateway_max_tokens_narrows_token_cap", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.tokens_cap = 10;
                     GatewayHarness h(config);
                     h.alpha->push_events({token("a"), token("b"), token("c"), complete()});
                     pr::CallParameters params;
                     params.max_tokens = 2;

                     const auto result = h.run("hello", params);
                     require(result.ok(), "call should succeed");
                     require(result.value().finish_reason == "stop_on_budget", "cap should apply");
                     require(result.value().tokens_completion == 2, "cap should be 2");
                     require(h.sink->count("token") == 2, "two tokens expected");
                   }});

  tests.push_back({"gateway_cost_cap_aborts_stream", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.cost_cap_usd = 0.05;
                     GatewayHarness h(config);
                     h.alpha->push_events({priced_token("a", 0.02), priced_token("b", 0.04),
                                           priced_token("c", 0.06), priced_token("d", 0.08),
                                           complete()});

                     const auto result = h.run("hello");
                     require(result.ok(), "budget abort is not an error");
                     require(result.value().finish_reason == "stop_on_budget", "finish reason mismatch");
                     require(result.value().cost_usd.has_value() && *result.value().cost_usd == 0.06,
                             "cost should be reported");
                     require(h.sink->count("token") == 3, "abort after the third token");
                     const auto budget = h.sink->of_type("budget_exhausted")[0];
                     require(budget.field("reason")->as_string() == "cost_cap", "reason mismatch");
                   }});

  tests.push_back({"gateway_cancel_failure_does_not_mask_budget_abort", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.tokens_cap = 1;
                     GatewayHarness h(config);
                     llmgate::testing::ScriptedAdapter::Script script;
                     script.events = {token("a"), token("b"), complete()};
                     script.cancel_throws = true;
                     h.alpha->push(script);

                     const auto result = h.run("hello");
                     require(result.ok(), "failing cancel must be swallowed");
                     require(result.value().finish_reason == "stop_on_budget", "finish reason mismatch");
                     require(h.alpha->cancel_calls() == 1, "cancel should still be attempted");
                   }});

  tests.push_back({"gateway_cancel_before_first_event", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("a"), complete()});
                     h.cancel.cancel();

                     const auto result = h.run("hello");
                     require(result.ok(), "cancellation is not an error");
                     require(result.value().finish_reason == "canceled", "finish reason mismatch");
                     require(!result.value().error.has_value(), "no error on cancel");
                     require(h.sink->count("canceled") == 1, "canceled event expected");
                     require(h.sink->count("token") == 0, "no tokens after cancel");
                     require(h.sink->count("error") == 0, "no error events on cancel");
                     require(h.sink->count("provider_succeeded") == 0, "cancel is not a success event");
                     require(h.alpha->cancel_calls() == 1, "stream cancel should be called");
                     const auto canceled = h.sink->of_type("canceled")[0];
                     require(canceled.field("reason")->as_string() == "cancel_token", "reason mismatch");
                   }});

  tests.push_back({"gateway_cancel_skips_pending_retry", [] {
                     GatewayHarness h;
                     auto calls = std::make_shared<int>(0);
                     h.gateway().register_adapter("alpha", cancelling_adapter(h.cancel, calls));

                     const auto result = h.run("hello");
                     require(result.ok(), "cancellation is not an error");
                     require_eq(result.value().finish_reason, std::string("canceled"), "finish reason");
                     require_eq(result.value().provider, std::string("alpha"), "summary names the canceled provider");
                     require_eq(result.value().attempt, std::uint32_t{1}, "attempt");
                     require_eq(*calls, 1, "no second attempt after cancel");
                     require(h.sleeps->empty(), "no backoff sleep after cancel");
                     require(h.sink->count("starting") == 1, "one attempt started");
                     require(h.sink->count("error") == 1, "failed attempt still reported");
                     require(h.sink->count("canceled") == 1, "canceled event expected");
                     require(h.sink->count("provider_succeeded") == 0, "cancel is not a success event");
                     require(h.beta->calls() == 0, "fallback never contacted");
                   }});

  tests.push_back({"gateway_cancel_during_backoff_stops_retry", [] {
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({stream_error("overloaded", true, "server_error")});
                     gw::CancelToken cancel;
                     auto slept = std::make_shared<int>(0);
                     gw::GatewayDependencies deps;
                     auto sink = std::make_shared<llmgate::testing::RecordingEventSink>();
                     deps.events = sink;
                     deps.sleeper = [&cancel, slept](const std::chrono::milliseconds) {
                       ++*slept;
                       cancel.cancel();
                     };
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     const auto result = gateway.run("run-c", "t", "hello", {}, std::nullopt, cancel);
                     require(result.ok(), "cancellation is not an error");
                     require(result.value().finish_reason == "canceled", "finish reason mismatch");
                     require_eq(*slept, 1, "one backoff sleep");
                     require_eq(adapter->calls(), 1, "no attempt after the interrupted sleep");
                     require(sink->count("starting") == 1, "one attempt started");
                     require(sink->count("canceled") == 1, "canceled event expected");
                   }});

  tests.push_back({"gateway_cancel_skips_failover", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.retry_max = 0;
                     GatewayHarness h(config);
                     auto calls = std::make_shared<int>(0);
                     h.gateway().register_adapter("alpha", cancelling_adapter(h.cancel, calls));

                     const auto result = h.run("hello");
                     require(result.ok(), "cancellation is not an error");
                     require(result.value().finish_reason == "canceled", "finish reason mismatch");
                     require(result.value().chain_index == 0, "stopped on the first entry");
                     require(*calls == 1, "primary attempted once");
                     require(h.beta->calls() == 0, "fallback never opened");
                     require(h.sink->count("provider_failover") == 0, "no failover after cancel");
                     require(h.sink->count("provider_selected") == 1, "next entry never selected");
                     require_eq(h.store->paths("run-1").size(), std::size_t{1},
                                "no audit record for the skipped entry");
                     require(h.sink->count("canceled") == 1, "canceled event expected");
                   }});

  tests.push_back({"gateway_stream_without_terminal_event_completes", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("partial")});
                     const auto result = h.run("hello");
                     require(result.ok(), "stream end should complete");
                     require(result.value().finish_reason == "stop", "finish reason should default");
                     require(h.sink->count("complete") == 1, "complete event expected");
                   }});

  tests.push_back({"gateway_reported_usage_overrides_estimates", [] {
                     GatewayHarness h;
                     pr::CompleteEvent done;
                     done.finish_reason = "length";
                     done.usage.prompt_tokens = 11;
                     done.usage.completion_tokens = 7;
                     done.usage.cost_usd = 0.5;
                     pr::TokenEvent metered;
                     metered.delta = "one two three";
                     metered.usage.completion_tokens = 1;
                     h.alpha->push_events({metered, done});

                     const auto result = h.run("hello");
                     require(result.ok(), "call should succeed");
                     require(result.value().tokens_prompt == 11, "prompt tokens should be reported value");
                     require(result.value().tokens_completion == 7, "completion tokens mismatch");
                     require(result.value().finish_reason == "length", "finish reason should pass through");
                     const auto completes = h.sink->of_type("complete");
                     require(completes[0].field("costUsd")->as_double() == 0.5, "cost mismatch");
                     require(completes[0].field("budgetExhausted") == nullptr,
                             "budget flag only on aborts");
                   }});

  tests.push_back({"gateway_caller_model_overrides_chain_model", [] {
                     GatewayHarness h;
                     h.alpha->push_events({stream_error("down", false, "server_error")});
                     h.beta->push_events({token("ok"), complete()});
                     pr::CallParameters params;
                     params.model = "custom-model";

                     const auto result = h.run("hello", params);
                     require(result.ok(), "call should succeed");
                     require(result.value().model == "custom-model", "caller model should win");
                     require(h.alpha->params()[0].model == std::optional<std::string>("custom-model"),
                             "adapter should see caller model");
                     require(h.alpha->params()[0].provider == std::optional<std::string>("alpha"),
                             "adapter should see chain provider");
                     const auto failover = h.sink->of_type("provider_failover")[0];
                     require(failover.field("toModel")->as_string() == "custom-model", "toModel mismatch");
                   }});

  tests.push_back({"gateway_provider_hint_selects_chain_head", [] {
                     GatewayHarness h;
                     h.beta->push_events({token("ok"), complete()});
                     pr::CallParameters params;
                     params.provider = "beta";
                     const auto result = h.run("hello", params);
                     require(result.ok(), "call should succeed");
                     require(result.value().provider == "beta", "hinted provider should run first");
                     require(h.alpha->calls() == 0, "alpha is not in the hinted chain head");
                   }});

  tests.push_back({"gateway_empty_chain_is_configuration_error", [] {
                     auto config = llmgate::testing::gateway_config();
                     config.llm_gateway.default_provider = "";
                     config.llm_gateway.provider_chain.clear();
                     GatewayHarness h(config);
                     const auto result = h.run("hello");
                     require(!result.ok(), "empty chain should fail");
                     require(result.error().kind == gw::ErrorKind::Configuration, "kind mismatch");
                     require(h.sink->events().empty(), "no events for a configuration failure");
                   }});

  tests.push_back({"gateway_records_parent_and_child_spans", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("ok"), complete()});
                     require(h.run("hello").ok(), "call should succeed");

                     std::optional<std::uint64_t> call_id;
                     std::optional<std::uint64_t> provider_parent;
                     for (const auto &event : h.observer->events()) {
                       if (const auto *start = std::get_if<obs::SpanStartEvent>(&event)) {
                         if (start->name == "llm.call") {
                           call_id = start->span_id;
                           require(start->attributes.at("llm.chain") == "alpha:alpha-1,beta:beta-1",
                                   "chain attribute mismatch");
                           require(start->attributes.at("run_id") == "run-1", "run id attribute");
                         } else if (start->name == "llm.provider") {
                           provider_parent = start->parent_id;
                         }
                       }
                     }
                     require(call_id.has_value(), "call span should start");
                     require(provider_parent == call_id, "provider span should be a child");

                     const auto ended = h.observer->ended_spans();
                     require(ended.size() == 2, "both spans should end exactly once");
                     require(ended[0].name == "llm.provider", "child ends first");
                     require(ended[0].attributes.at("llm.finish_reason") == "stop", "finish attribute");
                     require(ended[0].status == obs::SpanStatus::Ok, "provider span status");
                     require(ended[1].name == "llm.call", "parent ends last");
                   }});

  tests.push_back({"gateway_counts_prompt_and_completion_tokens", [] {
                     GatewayHarness h;
                     h.alpha->push_events({token("one two"), token("three"), complete()});
                     require(h.run("a b c d").ok(), "call should succeed");
                     const auto &counters = *h.telemetry.counters;
                     require(counters.value(obs::COUNTER_TOKENS_TOTAL,
                                            {{"provider", "alpha"}, {"model", "alpha-1"}, {"kind", "prompt"}}) == 4,
                             "prompt token counter mismatch");
                     require(counters.value(obs::COUNTER_TOKENS_TOTAL,
                                            {{"provider", "alpha"}, {"model", "alpha-1"}, {"kind", "completion"}}) == 3,
                             "completion token counter mismatch");
                   }});

  tests.push_back({"gateway_reports_active_window", [] {
                     auto phases = std::make_shared<std::vector<std::string>>();
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({token("ok"), complete()});
                     gw::GatewayDependencies deps;
                     deps.on_active_window = [phases](const std::string &run_id, const std::string &,
                                                      std::string_view phase) {
                       phases->push_back(run_id + ":" + std::string(phase));
                     };
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     gw::CancelToken cancel;
                     require(gateway.run("run-w", "t", "hello", {}, std::nullopt, cancel).ok(),
                             "call should succeed");
                     const std::vector<std::string> expected = {"run-w:start", "run-w:stop"};
                     require(*phases == expected, "hook should bracket the call");

                     auto budget = std::make_shared<llmgate::budget::ActiveTimeBudget>();
                     const auto hook = gw::active_time_hook(budget);
                     hook("run", "trace", "start");
                     require(budget->running(), "hook should start the window");
                     hook("run", "trace", "stop");
                     require(!budget->running(), "hook should stop the window");
                   }});

  tests.push_back({"gateway_survives_throwing_active_window_hook", [] {
                     auto observer = std::make_shared<llmgate::testing::RecordingObserver>();
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({token("ok"), complete()});
                     gw::GatewayDependencies deps;
                     deps.telemetry = obs::Telemetry::create(observer);
                     deps.on_active_window = [](const std::string &, const std::string &,
                                                std::string_view phase) {
                       if (phase == "stop") {
                         throw std::runtime_error("meter offline");
                       }
                     };
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     gw::CancelToken cancel;
                     const auto result = gateway.run("run-h", "t", "hello", {}, std::nullopt, cancel);
                     require(result.ok(), "hook failure must not affect the call");

                     bool logged = false;
                     for (const auto &event : observer->events()) {
                       if (const auto *log = std::get_if<obs::LogEvent>(&event)) {
                         logged = logged || (log->level == obs::LogLevel::Warn &&
                                             log->message.find("meter offline") != std::string::npos);
                       }
                     }
                     require(logged, "hook failure should be logged");
                   }});

  tests.push_back({"gateway_survives_failing_event_sink", [] {
                     auto adapter = std::make_shared<llmgate::testing::ScriptedAdapter>();
                     adapter->push_events({token("ok"), complete()});
                     gw::GatewayDependencies deps;
                     deps.events = std::make_shared<ThrowingEventSink>();
                     gw::LlmGateway gateway(llmgate::testing::gateway_config(), std::move(deps));
                     gateway.register_adapter("alpha", adapter);

                     gw::CancelToken cancel;
                     const auto result = gateway.run("run-s", "t", "hello", {}, std::nullopt, cancel);
                     require(result.ok(), "event delivery failures must not abort the call");
                     require(result.value().tokens_completion == 1, "stream should be consumed");
                   }});
}
