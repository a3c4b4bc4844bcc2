#pragma once

#include "llmgate/observability/observer.hpp"

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace llmgate::observability {

/// Forwards to every member. A member that throws is reported on `errors` and skipped
/// for that record; the remaining members still receive it.
class MultiObserver final : public IObserver {
public:
  MultiObserver();
  explicit MultiObserver(std::ostream &errors);

  void add(std::shared_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t failures() const { return failures_.load(); }

private:
  template <typename Fn> void for_each(const char *operation, Fn &&fn);

  std::ostream &errors_;
  std::mutex errors_mutex_;
  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<IObserver>> observers_;
  std::atomic<std::size_t> failures_{0};
};

} // namespace llmgate::observability
