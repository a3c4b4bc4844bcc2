#pragma once

#include "llmgate/gateway/errors.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace llmgate::gateway {

/// Same provider again? Only for retryable, non-violation errors while `attempt` is
/// within `max_retries` (attempts are numbered from 1).
[[nodiscard]] bool should_retry(const GatewayError &error, std::uint32_t attempt,
                                std::uint32_t max_retries);

/// Move to the next chain entry? Violations never fail over.
[[nodiscard]] bool should_failover(const GatewayError &error);

/// Exponential backoff with uniform jitter: base * 2^index + U(0, jitter).
class BackoffPolicy {
public:
  BackoffPolicy(std::uint64_t base_ms, std::uint64_t jitter_ms,
                std::optional<std::uint64_t> seed = std::nullopt);

  [[nodiscard]] std::chrono::milliseconds delay(std::uint32_t attempt_index);

  [[nodiscard]] std::uint64_t base_ms() const { return base_ms_; }
  [[nodiscard]] std::uint64_t jitter_ms() const { return jitter_ms_; }

private:
  std::uint64_t base_ms_;
  std::uint64_t jitter_ms_;
  std::mutex mutex_;
  std::mt19937_64 rng_;
};

} // namespace llmgate::gateway
