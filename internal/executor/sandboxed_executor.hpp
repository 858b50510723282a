#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/executor/executor.hpp"

namespace blockforge::executor {

struct SandboxedExecutorOptions {
  std::string              python_executable = "python3";
  std::filesystem::path    artifact_root     = "block_artifacts";
  int                      timeout_ms        = 30000;
  std::size_t              retain_versions   = 5;
  std::size_t              max_output_bytes  = 1024 * 1024;
  std::vector<std::string> allowed_modules; // empty = DefaultAllowedModules()

  static SandboxedExecutorOptions FromConfig(const blockforge::runtime::config::ExecutorConfig& config);
};

/*
  Executes block code in a Python child process.

  Artifacts for each attempt live at
    <artifact_root>/<block_id>/v<version>/{block_executor.py, execute.py}
  and are rewritten when the same version runs again. After every run only
  the retain_versions highest v<k> directories of the block are kept.
*/
class SandboxedExecutor final : public Executor {
 public:
  explicit SandboxedExecutor(SandboxedExecutorOptions options);

  ExecutionResult Execute(uint64_t block_id, uint32_t version, const std::string& backend_code) override;

  // Removes all but the newest retain_versions directories. Failures are logged only.
  void ApplyRetention(uint64_t block_id);

  std::filesystem::path VersionDirectory(uint64_t block_id, uint32_t version) const;

 private:
  std::filesystem::path Materialize(uint64_t block_id, uint32_t version, const std::string& backend_code);

  SandboxedExecutorOptions options_;
};

} // namespace blockforge::executor
