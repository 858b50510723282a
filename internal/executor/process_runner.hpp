#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blockforge::executor {

/*
  Child-process runner.

  Spawns argv in its own process group with stdout and stderr on separate
  non-blocking pipes, waits until exit or the wall-clock deadline and kills
  the whole group on timeout. Limits below are applied in the child before
  exec; they are hygiene, not isolation.
*/

struct ProcessLimits {
  int         timeout_ms       = 30000; // <= 0 disables the deadline
  std::size_t max_output_bytes = 1024 * 1024; // per stream

  int      rlimit_cpu_sec = 0;
  uint64_t rlimit_as_mb   = 0;
  int      rlimit_nofile  = 0;
  bool     no_new_privs   = true;
};

struct ProcessResult {
  bool        started = false;
  std::string error; // set when started == false

  int  exit_code = -1; // 128 + signal when killed
  bool timed_out = false;

  std::string stdout_data;
  std::string stderr_data;
  bool        stdout_truncated = false;
  bool        stderr_truncated = false;

  int64_t duration_ms = 0;
};

// Empty cwd keeps the parent's working directory. Never throws for child
// failures; inspect the result.
ProcessResult RunProcess(const std::vector<std::string>& argv, const std::string& cwd, const ProcessLimits& limits);

} // namespace blockforge::executor
