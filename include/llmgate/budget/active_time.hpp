#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace llmgate::budget {

/// Accumulates wall-clock time spent inside LLM calls against an optional limit.
/// Nested start() calls are counted so overlapping windows are not double billed.
class ActiveTimeBudget {
public:
  using Clock = std::chrono::steady_clock;

  explicit ActiveTimeBudget(std::optional<std::chrono::seconds> limit = std::nullopt);

  void start();
  void stop();

  class Window {
  public:
    explicit Window(ActiveTimeBudget &budget) : budget_(&budget) { budget_->start(); }
    ~Window() {
      if (budget_ != nullptr) {
        budget_->stop();
      }
    }
    Window(const Window &) = delete;
    Window &operator=(const Window &) = delete;
    Window(Window &&other) noexcept : budget_(other.budget_) { other.budget_ = nullptr; }
    Window &operator=(Window &&) = delete;

  private:
    ActiveTimeBudget *budget_;
  };

  [[nodiscard]] Window track() { return Window(*this); }

  [[nodiscard]] std::int64_t active_ms() const;
  /// Seconds left before the limit; nullopt when unlimited.
  [[nodiscard]] std::optional<double> remaining_seconds() const;
  [[nodiscard]] bool exceeded() const;
  [[nodiscard]] bool running() const;

private:
  [[nodiscard]] Clock::duration elapsed_locked() const;

  std::optional<std::chrono::seconds> limit_;
  mutable std::mutex mutex_;
  Clock::duration accumulated_{0};
  std::optional<Clock::time_point> window_start_;
  std::uint32_t depth_ = 0;
};

} // namespace llmgate::budget
