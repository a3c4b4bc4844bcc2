#pragma once

#include "llmgate/events/event.hpp"
#include "llmgate/observability/counters.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgate::events {

inline constexpr const char *EVENT_STREAM_EOF = "__EOF__";

/// Bounded queue of serialized events owned by one live consumer.
class SubscriberQueue {
public:
  explicit SubscriberQueue(std::size_t capacity);

  [[nodiscard]] bool try_push(std::string payload);
  [[nodiscard]] std::optional<std::string> try_pop();
  [[nodiscard]] std::optional<std::string> pop(std::chrono::milliseconds timeout);
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
};

/// Best-effort delivery of one run's events to any number of subscribers. A subscriber
/// whose queue is full is dropped so it cannot stall the call or the other consumers.
class EventFanout {
public:
  explicit EventFanout(std::size_t max_queue_size = 256,
                       std::shared_ptr<observability::Counters> counters = nullptr);

  void publish(const std::string &payload);
  void close();

  [[nodiscard]] std::shared_ptr<SubscriberQueue> subscribe();
  void unsubscribe(const std::shared_ptr<SubscriberQueue> &queue);

  [[nodiscard]] std::size_t subscriber_count() const;
  [[nodiscard]] bool closed() const;

private:
  void count_consumers(std::int64_t delta);

  std::size_t max_queue_size_;
  std::shared_ptr<observability::Counters> counters_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<SubscriberQueue>> queues_;
  bool closed_ = false;
};

/// Routes events to the fan-out registered for their run id. Events for runs
/// nobody opened are dropped.
class EventHub final : public IEventSink {
public:
  explicit EventHub(std::size_t max_queue_size = 256,
                    std::shared_ptr<observability::Counters> counters = nullptr);

  std::shared_ptr<EventFanout> open_run(const std::string &run_id);
  [[nodiscard]] std::shared_ptr<EventFanout> find(const std::string &run_id) const;
  void close_run(const std::string &run_id);

  void emit(const LlmEvent &event) override;

private:
  std::size_t max_queue_size_;
  std::shared_ptr<observability::Counters> counters_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<EventFanout>> runs_;
};

} // namespace llmgate::events
