#pragma once

#include <atomic>

namespace llmgate::gateway {

/// Caller-owned cancellation flag, polled once per streamed event.
class CancelToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  void reset() { cancelled_.store(false, std::memory_order_release); }
  [[nodiscard]] bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace llmgate::gateway
