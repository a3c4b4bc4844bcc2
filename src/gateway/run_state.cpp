#include "llmgate/gateway/run_state.hpp"

namespace llmgate::gateway {

std::uint64_t RunStateStore::next_sequence(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ++sequences_[run_id];
}

std::uint64_t RunStateStore::current_sequence(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sequences_.find(run_id);
  return it == sequences_.end() ? 0 : it->second;
}

void RunStateStore::forget(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sequences_.erase(run_id);
}

} // namespace llmgate::gateway
