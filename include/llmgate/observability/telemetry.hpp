#pragma once

#include "llmgate/observability/counters.hpp"
#include "llmgate/observability/noop_observer.hpp"
#include "llmgate/observability/observer.hpp"
#include "llmgate/observability/tracer.hpp"

#include <memory>
#include <string>

namespace llmgate::observability {

/// Observer, tracer and counters sharing one recorder. Built once at startup and
/// handed to whatever needs to report.
struct Telemetry {
  std::shared_ptr<IObserver> observer;
  std::shared_ptr<Tracer> tracer;
  std::shared_ptr<Counters> counters;

  [[nodiscard]] static Telemetry create(std::shared_ptr<IObserver> observer) {
    if (observer == nullptr) {
      observer = std::make_shared<NoopObserver>();
    }
    Telemetry telemetry;
    telemetry.tracer = std::make_shared<Tracer>(observer);
    telemetry.counters = std::make_shared<Counters>(observer);
    telemetry.observer = std::move(observer);
    return telemetry;
  }

  void log(const LogLevel level, const std::string &component, const std::string &message) const {
    if (observer != nullptr) {
      observer->record_event(LogEvent{.level = level, .component = component, .message = message});
    }
  }

  void error(const std::string &component, const std::string &message) const {
    if (observer != nullptr) {
      observer->record_event(ErrorEvent{.component = component, .message = message});
    }
  }
};

} // namespace llmgate::observability
