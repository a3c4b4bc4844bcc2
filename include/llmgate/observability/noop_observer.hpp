#pragma once

#include "llmgate/observability/observer.hpp"

#include <string>
#include <utility>

namespace llmgate::observability {

/// Discards everything. Keeps the backend name it was selected under (`none` or `noop`)
/// so `config show` and the factory tests can tell the two spellings apart.
class NoopObserver final : public IObserver {
public:
  explicit NoopObserver(std::string name = "noop") : name_(std::move(name)) {}

  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::string name_;
};

} // namespace llmgate::observability
