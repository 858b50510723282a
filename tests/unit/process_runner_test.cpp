#include "internal/executor/process_runner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

using blockforge::executor::ProcessLimits;
using blockforge::executor::RunProcess;

void TestCapturesStreamsSeparately() {
  ProcessLimits limits;
  limits.timeout_ms = 5000;

  const auto result = RunProcess({"/bin/sh", "-c", "printf '{\"ok\":1}'; printf 'warn' >&2; exit 0"}, "", limits);
  assert(result.started);
  assert(!result.timed_out);
  assert(result.exit_code == 0);
  assert(result.stdout_data == "{\"ok\":1}");
  assert(result.stderr_data == "warn");
  assert(!result.stdout_truncated);
}

void TestReportsExitCode() {
  ProcessLimits limits;
  limits.timeout_ms = 5000;

  const auto result = RunProcess({"/bin/sh", "-c", "echo boom >&2; exit 3"}, "", limits);
  assert(result.started);
  assert(result.exit_code == 3);
  assert(result.stderr_data == "boom\n");
}

void TestTimeoutKillsProcessGroup() {
  ProcessLimits limits;
  limits.timeout_ms = 200;

  // the grandchild keeps the pipe open unless the whole group is killed
  const auto result = RunProcess({"/bin/sh", "-c", "sleep 30 & sleep 30"}, "", limits);
  assert(result.started);
  assert(result.timed_out);
  assert(result.exit_code != 0);
  assert(result.duration_ms < 10000);
}

void TestOutputIsCapped() {
  ProcessLimits limits;
  limits.timeout_ms       = 5000;
  limits.max_output_bytes = 16;

  const auto result = RunProcess({"/bin/sh", "-c", "i=0; while [ $i -lt 1000 ]; do printf 'xxxxxxxxxx'; i=$((i+1)); done"}, "", limits);
  assert(result.started);
  assert(result.exit_code == 0);
  assert(result.stdout_data.size() == 16);
  assert(result.stdout_truncated);
}

void TestSpawnFailureIsReported() {
  const auto result = RunProcess({"/nonexistent/blockforge-python"}, "", ProcessLimits{});
  assert(!result.started);
  assert(result.error.find("cannot start /nonexistent/blockforge-python") == 0);

  const auto empty = RunProcess({}, "", ProcessLimits{});
  assert(!empty.started);
}

void TestWorkingDirectory() {
  ProcessLimits limits;
  limits.timeout_ms = 5000;

  const auto dir    = std::filesystem::temp_directory_path();
  const auto result = RunProcess({"/bin/sh", "-c", "pwd"}, dir.string(), limits);
  assert(result.exit_code == 0);
  assert(std::filesystem::equivalent(result.stdout_data.substr(0, result.stdout_data.size() - 1), dir));
}

} // namespace

int main() {
  TestCapturesStreamsSeparately();
  TestReportsExitCode();
  TestTimeoutKillsProcessGroup();
  TestOutputIsCapped();
  TestSpawnFailureIsReported();
  TestWorkingDirectory();

  std::cout << "blockforge_unit_process_runner: pass\n";
  return 0;
}
