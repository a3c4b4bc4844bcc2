#pragma once

#include "llmgate/audit/artifact_store.hpp"
#include "llmgate/config/schema.hpp"
#include "llmgate/events/event.hpp"
#include "llmgate/gateway/gateway.hpp"
#include "llmgate/observability/observer.hpp"
#include "llmgate/providers/stream.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::testing {

/// Gateway settings with no backoff delay and a two-entry chain (alpha, beta).
config::Config gateway_config();

providers::ProviderEvent token(std::string delta);
providers::ProviderEvent complete(std::string finish_reason = "stop");
providers::ProviderEvent stream_error(std::string message, bool retryable,
                                      std::string category = "provider_error",
                                      bool violation = false);

/// Adapter that replays prepared scripts, one per open_stream call. The last script
/// repeats once the queue is drained.
class ScriptedAdapter final : public providers::IStreamAdapter {
public:
  struct Script {
    std::vector<providers::ProviderEvent> events;
    providers::StreamUsage usage;
    std::optional<gateway::GatewayError> open_error;
    std::optional<std::string> throw_message;
    bool cancel_throws = false;
  };

  void push(Script script);
  void push_events(std::vector<providers::ProviderEvent> events);
  void push_open_error(gateway::GatewayError error);
  void push_throw(std::string message);

  [[nodiscard]] common::Result<providers::ProviderStream, gateway::GatewayError>
  open_stream(const std::string &prompt, const providers::CallParameters &params,
              const providers::ProviderHandle &handle,
              const providers::CallMetadata &metadata) override;

  [[nodiscard]] int calls() const;
  [[nodiscard]] int cancel_calls() const { return cancel_calls_->load(); }
  [[nodiscard]] std::vector<providers::CallMetadata> metadata() const;
  [[nodiscard]] std::vector<providers::CallParameters> params() const;

private:
  mutable std::mutex mutex_;
  std::deque<Script> scripts_;
  std::optional<Script> last_;
  std::vector<providers::CallMetadata> metadata_;
  std::vector<providers::CallParameters> params_;
  std::shared_ptr<std::atomic<int>> cancel_calls_ = std::make_shared<std::atomic<int>>(0);
};

class RecordingEventSink final : public events::IEventSink {
public:
  void emit(const events::LlmEvent &event) override;

  [[nodiscard]] std::vector<events::LlmEvent> events() const;
  [[nodiscard]] std::vector<std::string> types() const;
  [[nodiscard]] std::vector<events::LlmEvent> of_type(const std::string &type) const;
  [[nodiscard]] std::size_t count(const std::string &type) const;

private:
  mutable std::mutex mutex_;
  std::vector<events::LlmEvent> events_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  [[nodiscard]] std::vector<observability::SpanEndEvent> ended_spans() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Wires a gateway to recording collaborators.
struct GatewayHarness {
  explicit GatewayHarness(config::Config config = gateway_config());

  [[nodiscard]] gateway::LlmGateway &gateway() { return *gateway_; }
  [[nodiscard]] common::Result<gateway::CallSummary, gateway::GatewayError>
  run(const std::string &prompt, providers::CallParameters params = {});

  std::shared_ptr<ScriptedAdapter> alpha = std::make_shared<ScriptedAdapter>();
  std::shared_ptr<ScriptedAdapter> beta = std::make_shared<ScriptedAdapter>();
  std::shared_ptr<RecordingEventSink> sink = std::make_shared<RecordingEventSink>();
  std::shared_ptr<audit::MemoryArtifactStore> store = std::make_shared<audit::MemoryArtifactStore>();
  std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
  std::shared_ptr<std::vector<std::chrono::milliseconds>> sleeps =
      std::make_shared<std::vector<std::chrono::milliseconds>>();
  observability::Telemetry telemetry;
  gateway::CancelToken cancel;
  std::string run_id = "run-1";

private:
  std::unique_ptr<gateway::LlmGateway> gateway_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

} // namespace llmgate::testing
