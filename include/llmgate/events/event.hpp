#pragma once

#include "llmgate/common/json.hpp"

#include <functional>
#include <string>

namespace llmgate::events {

inline constexpr const char *EVENT_PROVIDER_SELECTED = "provider_selected";
inline constexpr const char *EVENT_STARTING = "starting";
inline constexpr const char *EVENT_TOKEN = "token";
inline constexpr const char *EVENT_COMPLETE = "complete";
inline constexpr const char *EVENT_ERROR = "error";
inline constexpr const char *EVENT_PROVIDER_FAILED = "provider_failed";
inline constexpr const char *EVENT_PROVIDER_SUCCEEDED = "provider_succeeded";
inline constexpr const char *EVENT_PROVIDER_FAILOVER = "provider_failover";
inline constexpr const char *EVENT_BUDGET_EXHAUSTED = "budget_exhausted";
inline constexpr const char *EVENT_CANCELED = "canceled";

/// One lifecycle transition of a gateway call. Serialized as a flat JSON object
/// with `event: "llm"`, `type` and `runId` next to the event specific fields.
struct LlmEvent {
  std::string type;
  std::string run_id;
  common::JsonValue::Object fields;

  [[nodiscard]] common::JsonValue to_json() const;
  [[nodiscard]] std::string serialize() const { return to_json().dump(); }

  [[nodiscard]] const common::JsonValue *field(const std::string &key) const;
};

class IEventSink {
public:
  virtual ~IEventSink() = default;
  virtual void emit(const LlmEvent &event) = 0;
};

class NullEventSink final : public IEventSink {
public:
  void emit(const LlmEvent &) override {}
};

class CallbackEventSink final : public IEventSink {
public:
  explicit CallbackEventSink(std::function<void(const LlmEvent &)> callback)
      : callback_(std::move(callback)) {}

  void emit(const LlmEvent &event) override {
    if (callback_) {
      callback_(event);
    }
  }

private:
  std::function<void(const LlmEvent &)> callback_;
};

} // namespace llmgate::events
