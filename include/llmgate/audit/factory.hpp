#pragma once

#include "llmgate/audit/artifact_store.hpp"
#include "llmgate/common/result.hpp"
#include "llmgate/config/schema.hpp"

#include <memory>

namespace llmgate::audit {

/// Store selected by `artifacts.backend`. Disabled or `none` yields a null pointer,
/// which turns audit persistence off.
[[nodiscard]] common::Result<std::shared_ptr<IArtifactStore>>
create_artifact_store(const config::Config &config);

} // namespace llmgate::audit
