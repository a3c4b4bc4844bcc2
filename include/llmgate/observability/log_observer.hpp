#pragma once

#include "llmgate/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace llmgate::observability {

class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out, LogLevel min_level = LogLevel::Debug);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace llmgate::observability
