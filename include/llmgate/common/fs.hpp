#pragma once

#include "llmgate/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace llmgate::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Write `data` to `path` through a sibling temp file and rename.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &data);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] std::string utc_timestamp_iso8601();

} // namespace llmgate::common
