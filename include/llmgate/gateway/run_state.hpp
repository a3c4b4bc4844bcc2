#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmgate::gateway {

/// Per-run attempt sequence numbers used to name audit records. Concurrent calls on
/// one run id never receive the same number.
class RunStateStore {
public:
  [[nodiscard]] std::uint64_t next_sequence(const std::string &run_id);
  [[nodiscard]] std::uint64_t current_sequence(const std::string &run_id) const;
  void forget(const std::string &run_id);

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::uint64_t> sequences_;
};

} // namespace llmgate::gateway
