#include "sandboxed_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

#include "internal/executor/code_wrapper.hpp"
#include "internal/executor/process_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace blockforge::executor {

namespace fs = std::filesystem;

using blockforge::util::ExecutionFailure;

namespace {

constexpr const char* kBlockExecutorFile = "block_executor.py";
constexpr const char* kRunnerFile        = "execute.py";

std::string Trim(const std::string& text) {
  const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
  const auto end   = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ExecutionFailure(ExecutionFailure::Kind::kSpawn, "cannot write " + path.string());
  }
  out << content;
  out.close();
  if (!out) {
    throw ExecutionFailure(ExecutionFailure::Kind::kSpawn, "cannot write " + path.string());
  }
}

// v<digits> -> version number
bool ParseVersionDirectory(const std::string& name, uint32_t* version) {
  if (name.size() < 2 || name[0] != 'v') return false;
  uint64_t value = 0;
  for (std::size_t i = 1; i < name.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
    value = value * 10 + static_cast<uint64_t>(name[i] - '0');
    if (value > UINT32_MAX) return false;
  }
  *version = static_cast<uint32_t>(value);
  return true;
}

} // namespace

SandboxedExecutorOptions SandboxedExecutorOptions::FromConfig(const blockforge::runtime::config::ExecutorConfig& config) {
  SandboxedExecutorOptions options;
  if (!config.python_executable().empty()) options.python_executable = config.python_executable();
  if (!config.artifact_root().empty()) options.artifact_root = config.artifact_root();
  if (config.timeout_ms() != 0) options.timeout_ms = static_cast<int>(config.timeout_ms());
  if (config.retain_versions() != 0) options.retain_versions = config.retain_versions();
  if (config.max_output_bytes() != 0) options.max_output_bytes = static_cast<std::size_t>(config.max_output_bytes());
  options.allowed_modules.assign(config.allowed_modules().begin(), config.allowed_modules().end());
  return options;
}

SandboxedExecutor::SandboxedExecutor(SandboxedExecutorOptions options) : options_(std::move(options)) {
}

fs::path SandboxedExecutor::VersionDirectory(uint64_t block_id, uint32_t version) const {
  return options_.artifact_root / std::to_string(block_id) / ("v" + std::to_string(version));
}

fs::path SandboxedExecutor::Materialize(uint64_t block_id, uint32_t version, const std::string& backend_code) {
  std::error_code ec;
  const auto      dir = fs::absolute(VersionDirectory(block_id, version), ec);
  if (ec) {
    throw ExecutionFailure(ExecutionFailure::Kind::kSpawn, "cannot resolve artifact directory: " + ec.message());
  }
  fs::create_directories(dir, ec);
  if (ec) {
    throw ExecutionFailure(ExecutionFailure::Kind::kSpawn, "cannot create " + dir.string() + ": " + ec.message());
  }

  const auto code_file = dir / kBlockExecutorFile;
  WriteFile(code_file, WrapBlockCode(backend_code, options_.allowed_modules));

  const auto runner_file = dir / kRunnerFile;
  WriteFile(runner_file, BuildRunnerScript(code_file));
  return runner_file;
}

ExecutionResult SandboxedExecutor::Execute(uint64_t block_id, uint32_t version, const std::string& backend_code) {
  observability::SpanScope span("executor.Execute");
  span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));
  span.SetAttribute("block.version", static_cast<std::int64_t>(version));

  const auto runner_file = Materialize(block_id, version, backend_code);

  ProcessLimits limits;
  limits.timeout_ms       = options_.timeout_ms;
  limits.max_output_bytes = options_.max_output_bytes;

  const auto process = RunProcess({options_.python_executable, runner_file.string()}, "", limits);

  ApplyRetention(block_id);

  auto fail = [&](ExecutionFailure::Kind kind, const std::string& message) -> ExecutionFailure {
    observability::Metrics::Instance().ObserveExecutionDurationMs(util::KindName(kind), static_cast<double>(process.duration_ms));
    span.RecordException(message);
    BLOCKFORGE_LOG_WARN("block execution failed", {observability::BlockField(block_id), observability::VersionField(version),
                                                    observability::StringField("kind", util::KindName(kind)),
                                                    observability::IntField("duration_ms", process.duration_ms),
                                                    observability::StringField("error", message)});
    return ExecutionFailure(kind, message);
  };

  if (!process.started) {
    throw fail(ExecutionFailure::Kind::kSpawn, "Block execution could not start: " + process.error);
  }
  if (process.timed_out) {
    throw fail(ExecutionFailure::Kind::kTimeout, "Block execution timed out");
  }
  if (process.exit_code != 0) {
    auto detail = Trim(process.stderr_data);
    if (detail.empty()) detail = Trim(process.stdout_data);
    if (detail.empty()) detail = "Unknown execution error";
    throw fail(ExecutionFailure::Kind::kNonZeroExit, "Block execution failed: " + detail);
  }
  if (process.stdout_truncated) {
    throw fail(ExecutionFailure::Kind::kInvalidOutput, "Block did not return valid JSON");
  }

  auto output = util::ParseJsonValue(Trim(process.stdout_data));
  if (!output) {
    throw fail(ExecutionFailure::Kind::kInvalidOutput, "Block did not return valid JSON");
  }

  observability::Metrics::Instance().ObserveExecutionDurationMs("success", static_cast<double>(process.duration_ms));
  BLOCKFORGE_LOG_INFO("block executed", {observability::BlockField(block_id), observability::VersionField(version),
                                         observability::IntField("duration_ms", process.duration_ms)});

  ExecutionResult result;
  result.output      = std::move(*output);
  result.duration_ms = process.duration_ms;
  return result;
}

void SandboxedExecutor::ApplyRetention(uint64_t block_id) {
  const auto      block_dir = options_.artifact_root / std::to_string(block_id);
  std::error_code ec;
  if (!fs::is_directory(block_dir, ec)) {
    return;
  }

  std::vector<std::pair<uint32_t, fs::path>> versions;
  for (fs::directory_iterator it(block_dir, ec), end; !ec && it != end; it.increment(ec)) {
    uint32_t version = 0;
    if (it->is_directory(ec) && ParseVersionDirectory(it->path().filename().string(), &version)) {
      versions.emplace_back(version, it->path());
    }
  }
  if (ec) {
    BLOCKFORGE_LOG_WARN("artifact retention scan failed", {observability::BlockField(block_id), observability::StringField("error", ec.message())});
    return;
  }
  if (versions.size() <= options_.retain_versions) {
    return;
  }

  std::sort(versions.begin(), versions.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
  for (std::size_t i = options_.retain_versions; i < versions.size(); ++i) {
    std::error_code remove_ec;
    fs::remove_all(versions[i].second, remove_ec);
    if (remove_ec) {
      BLOCKFORGE_LOG_WARN("artifact retention failed", {observability::BlockField(block_id), observability::VersionField(versions[i].first),
                                                        observability::StringField("error", remove_ec.message())});
    }
  }
}

} // namespace blockforge::executor
