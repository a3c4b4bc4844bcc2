#include "llmgate/gateway/policy.hpp"

#include <algorithm>
#include <limits>

namespace llmgate::gateway {

namespace {

constexpr std::uint32_t MAX_BACKOFF_SHIFT = 30;
constexpr std::uint64_t MAX_DELAY_MS =
    static_cast<std::uint64_t>(std::chrono::milliseconds::max().count());

} // namespace

bool should_retry(const GatewayError &error, const std::uint32_t attempt,
                  const std::uint32_t max_retries) {
  if (error.violation) {
    return false;
  }
  return error.retryable && attempt <= max_retries;
}

bool should_failover(const GatewayError &error) {
  if (error.violation) {
    return false;
  }
  return error.retryable || is_failover_category(error.category);
}

BackoffPolicy::BackoffPolicy(const std::uint64_t base_ms, const std::uint64_t jitter_ms,
                             const std::optional<std::uint64_t> seed)
    : base_ms_(base_ms), jitter_ms_(jitter_ms),
      rng_(seed.has_value() ? *seed : std::random_device{}()) {}

std::chrono::milliseconds BackoffPolicy::delay(const std::uint32_t attempt_index) {
  const std::uint32_t shift = std::min(attempt_index, MAX_BACKOFF_SHIFT);
  const std::uint64_t factor = 1ULL << shift;
  std::uint64_t delay_ms = MAX_DELAY_MS;
  if (base_ms_ == 0 || factor <= MAX_DELAY_MS / base_ms_) {
    delay_ms = base_ms_ * factor;
  }

  if (jitter_ms_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<std::uint64_t> jitter(0, jitter_ms_);
    const std::uint64_t extra = jitter(rng_);
    delay_ms = extra > MAX_DELAY_MS - delay_ms ? MAX_DELAY_MS : delay_ms + extra;
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay_ms));
}

} // namespace llmgate::gateway
