#include "llmgate/observability/counters.hpp"

namespace llmgate::observability {

Counters::Counters(std::shared_ptr<IObserver> observer) : observer_(std::move(observer)) {}

void Counters::add(const std::string &name, const std::int64_t value, const Attributes &labels) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[name][labels] += value;
  }
  if (observer_ != nullptr) {
    observer_->record_metric(CounterMetric{.name = name, .value = value, .labels = labels});
  }
}

std::int64_t Counters::total(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return 0;
  }
  std::int64_t sum = 0;
  for (const auto &[labels, value] : it->second) {
    (void)labels;
    sum += value;
  }
  return sum;
}

std::int64_t Counters::value(const std::string &name, const Attributes &labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = values_.find(name);
  if (it == values_.end()) {
    return 0;
  }
  const auto series_it = it->second.find(labels);
  return series_it == it->second.end() ? 0 : series_it->second;
}

std::vector<std::pair<Attributes, std::int64_t>> Counters::series(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<Attributes, std::int64_t>> out;
  const auto it = values_.find(name);
  if (it != values_.end()) {
    out.assign(it->second.begin(), it->second.end());
  }
  return out;
}

void Counters::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.clear();
}

} // namespace llmgate::observability
