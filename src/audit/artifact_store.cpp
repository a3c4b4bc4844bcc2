#include "llmgate/audit/artifact_store.hpp"

namespace llmgate::audit {

common::Result<std::string> MemoryArtifactStore::put(const std::string &run_id,
                                                     const std::string &path,
                                                     const std::string &data,
                                                     const std::string &content_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  artifacts_[{run_id, path}] = StoredArtifact{.data = data, .content_type = content_type};
  return common::Result<std::string>::success("mem://" + run_id + ":" + path);
}

std::optional<StoredArtifact> MemoryArtifactStore::get(const std::string &run_id,
                                                       const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = artifacts_.find({run_id, path});
  if (it == artifacts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> MemoryArtifactStore::paths(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[key, artifact] : artifacts_) {
    (void)artifact;
    if (key.first == run_id) {
      out.push_back(key.second);
    }
  }
  return out;
}

std::size_t MemoryArtifactStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return artifacts_.size();
}

} // namespace llmgate::audit
