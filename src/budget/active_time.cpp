#include "llmgate/budget/active_time.hpp"

#include <algorithm>

namespace llmgate::budget {

ActiveTimeBudget::ActiveTimeBudget(const std::optional<std::chrono::seconds> limit)
    : limit_(limit) {}

void ActiveTimeBudget::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (depth_++ == 0) {
    window_start_ = Clock::now();
  }
}

void ActiveTimeBudget::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (depth_ == 0) {
    return;
  }
  if (--depth_ == 0 && window_start_.has_value()) {
    accumulated_ += Clock::now() - *window_start_;
    window_start_.reset();
  }
}

ActiveTimeBudget::Clock::duration ActiveTimeBudget::elapsed_locked() const {
  Clock::duration total = accumulated_;
  if (window_start_.has_value()) {
    total += Clock::now() - *window_start_;
  }
  return total;
}

std::int64_t ActiveTimeBudget::active_ms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed_locked()).count();
}

std::optional<double> ActiveTimeBudget::remaining_seconds() const {
  if (!limit_.has_value()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const double used = std::chrono::duration<double>(elapsed_locked()).count();
  return std::max(0.0, static_cast<double>(limit_->count()) - used);
}

bool ActiveTimeBudget::exceeded() const {
  const auto remaining = remaining_seconds();
  return remaining.has_value() && *remaining <= 0.0;
}

bool ActiveTimeBudget::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return depth_ > 0;
}

} // namespace llmgate::budget
