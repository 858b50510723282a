#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/executor/executor.hpp"
#include "internal/oracle/oracle.hpp"
#include "internal/util/time.hpp"

namespace blockforge::core {

/*
  Automatic healing throttle.

  A failing refresh may trigger one heal when the number of failures in the
  trailing window, counting the one just recorded, is at most
  max_failures_in_window.
*/
struct HealPolicy {
  std::chrono::seconds window{3600};
  uint32_t             max_failures_in_window = 1;

  bool ShouldAutoHeal(uint64_t failures_in_window) const {
    return failures_in_window <= max_failures_in_window;
  }

  util::TimePoint WindowStart(util::TimePoint now) const {
    return now - window;
  }

  static HealPolicy FromConfig(const blockforge::runtime::config::LifecycleConfig& config);
};

struct HealOutcome {
  bool success = false;

  // Set whenever the oracle produced a candidate, even if it then failed.
  std::optional<oracle::GeneratedCode> code;

  std::optional<executor::ExecutionResult> result;
  std::string                              error_message;
};

/*
  Runs one heal attempt: asks the oracle for a fix of the failed code and
  validates the candidate through the executor. Oracle and execution
  failures are reported in the outcome, never thrown.
*/
class HealingCoordinator {
 public:
  HealingCoordinator(std::shared_ptr<oracle::CodeOracle> oracle, std::shared_ptr<executor::Executor> executor, HealPolicy policy);

  const HealPolicy& policy() const {
    return policy_;
  }

  HealOutcome Attempt(uint64_t block_id, uint32_t candidate_version, const std::string& original_prompt, const std::string& error_message,
                      const std::string& failed_code);

 private:
  std::shared_ptr<oracle::CodeOracle> oracle_;
  std::shared_ptr<executor::Executor> executor_;
  HealPolicy                          policy_;
};

} // namespace blockforge::core
