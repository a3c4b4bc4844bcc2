#include "llmgate/audit/filesystem_store.hpp"

#include "llmgate/common/fs.hpp"

namespace llmgate::audit {

FilesystemArtifactStore::FilesystemArtifactStore(std::filesystem::path root)
    : root_(std::move(root)) {}

common::Result<std::string> FilesystemArtifactStore::put(const std::string &run_id,
                                                         const std::string &path,
                                                         const std::string &data,
                                                         const std::string &content_type) {
  (void)run_id;
  (void)content_type;
  const std::filesystem::path relative = std::filesystem::path(path).lexically_normal();
  if (relative.empty() || relative.is_absolute() || common::starts_with(relative.string(), "..")) {
    return common::Result<std::string>::failure("artifact path escapes store root: " + path);
  }

  std::error_code ec;
  std::filesystem::path base = std::filesystem::absolute(root_, ec);
  if (ec) {
    return common::Result<std::string>::failure("cannot resolve artifact root: " + ec.message());
  }
  base = base.lexically_normal();
  const std::filesystem::path target = (base / relative).lexically_normal();
  if (!common::is_subpath(target, base)) {
    return common::Result<std::string>::failure("artifact path escapes store root: " + path);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto status = common::write_file_atomic(target, data);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  return common::Result<std::string>::success("file://" + target.string());
}

} // namespace llmgate::audit
