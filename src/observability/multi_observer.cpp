#include "llmgate/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace llmgate::observability {

MultiObserver::MultiObserver() : MultiObserver(std::cerr) {}

MultiObserver::MultiObserver(std::ostream &errors) : errors_(errors) {}

void MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  observers_.push_back(std::move(observer));
}

std::size_t MultiObserver::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return observers_.size();
}

template <typename Fn> void MultiObserver::for_each(const char *operation, Fn &&fn) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &observer : observers_) {
    try {
      fn(*observer);
    } catch (const std::exception &ex) {
      ++failures_;
      std::lock_guard<std::mutex> errors_lock(errors_mutex_);
      errors_ << "[WARN] observer " << observer->name() << " failed in " << operation << ": "
              << ex.what() << "\n";
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for_each("record_event", [&event](IObserver &observer) { observer.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for_each("record_metric", [&metric](IObserver &observer) { observer.record_metric(metric); });
}

void MultiObserver::flush() {
  for_each("flush", [](IObserver &observer) { observer.flush(); });
}

} // namespace llmgate::observability
