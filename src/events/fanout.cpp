#include "llmgate/events/fanout.hpp"

#include <algorithm>
#include <iterator>

namespace llmgate::events {

namespace {

const observability::Attributes CONSUMER_LABELS = {{"stream", "llm"}};

} // namespace

SubscriberQueue::SubscriberQueue(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool SubscriberQueue::try_push(std::string payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      return false;
    }
    queue_.push_back(std::move(payload));
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> SubscriberQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  std::string payload = std::move(queue_.front());
  queue_.pop_front();
  return payload;
}

std::optional<std::string> SubscriberQueue::pop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
    return std::nullopt;
  }
  std::string payload = std::move(queue_.front());
  queue_.pop_front();
  return payload;
}

std::size_t SubscriberQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

EventFanout::EventFanout(const std::size_t max_queue_size,
                         std::shared_ptr<observability::Counters> counters)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size), counters_(std::move(counters)) {}

void EventFanout::count_consumers(const std::int64_t delta) {
  if (counters_ != nullptr && delta != 0) {
    counters_->add(observability::COUNTER_SSE_CONSUMERS, delta, CONSUMER_LABELS);
  }
}

void EventFanout::publish(const std::string &payload) {
  std::int64_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    const auto stale = std::remove_if(
        queues_.begin(), queues_.end(),
        [&payload](const std::shared_ptr<SubscriberQueue> &queue) { return !queue->try_push(payload); });
    dropped = static_cast<std::int64_t>(std::distance(stale, queues_.end()));
    queues_.erase(stale, queues_.end());
  }
  count_consumers(-dropped);
}

void EventFanout::close() {
  std::int64_t released = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    for (const auto &queue : queues_) {
      (void)queue->try_push(EVENT_STREAM_EOF);
    }
    released = static_cast<std::int64_t>(queues_.size());
    queues_.clear();
  }
  count_consumers(-released);
}

std::shared_ptr<SubscriberQueue> EventFanout::subscribe() {
  auto queue = std::make_shared<SubscriberQueue>(max_queue_size_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      (void)queue->try_push(EVENT_STREAM_EOF);
      return queue;
    }
    queues_.push_back(queue);
  }
  count_consumers(1);
  return queue;
}

void EventFanout::unsubscribe(const std::shared_ptr<SubscriberQueue> &queue) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find(queues_.begin(), queues_.end(), queue);
    if (it != queues_.end()) {
      queues_.erase(it);
      removed = true;
    }
  }
  if (removed) {
    count_consumers(-1);
  }
}

std::size_t EventFanout::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queues_.size();
}

bool EventFanout::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

EventHub::EventHub(const std::size_t max_queue_size,
                   std::shared_ptr<observability::Counters> counters)
    : max_queue_size_(max_queue_size), counters_(std::move(counters)) {}

std::shared_ptr<EventFanout> EventHub::open_run(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &fanout = runs_[run_id];
  if (fanout == nullptr || fanout->closed()) {
    fanout = std::make_shared<EventFanout>(max_queue_size_, counters_);
  }
  return fanout;
}

std::shared_ptr<EventFanout> EventHub::find(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = runs_.find(run_id);
  return it == runs_.end() ? nullptr : it->second;
}

void EventHub::close_run(const std::string &run_id) {
  std::shared_ptr<EventFanout> fanout;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      return;
    }
    fanout = std::move(it->second);
    runs_.erase(it);
  }
  fanout->close();
}

void EventHub::emit(const LlmEvent &event) {
  if (event.run_id.empty()) {
    return;
  }
  const auto fanout = find(event.run_id);
  if (fanout == nullptr) {
    return;
  }
  fanout->publish(event.serialize());
}

} // namespace llmgate::events
