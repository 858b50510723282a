#include "healing_coordinator.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace blockforge::core {

namespace {
constexpr const char* kHealedPrefix = "Auto-healed: ";
}

HealPolicy HealPolicy::FromConfig(const blockforge::runtime::config::LifecycleConfig& config) {
  HealPolicy policy;
  if (config.heal_window_sec() != 0) policy.window = std::chrono::seconds(config.heal_window_sec());
  if (config.heal_max_failures_in_window() != 0) policy.max_failures_in_window = config.heal_max_failures_in_window();
  return policy;
}

HealingCoordinator::HealingCoordinator(std::shared_ptr<oracle::CodeOracle> oracle, std::shared_ptr<executor::Executor> executor, HealPolicy policy)
    : oracle_(std::move(oracle)), executor_(std::move(executor)), policy_(policy) {
}

HealOutcome HealingCoordinator::Attempt(uint64_t block_id, uint32_t candidate_version, const std::string& original_prompt,
                                        const std::string& error_message, const std::string& failed_code) {
  observability::SpanScope span("heal.Attempt");
  span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));

  HealOutcome outcome;
  try {
    outcome.code = oracle_->Heal(original_prompt, error_message, failed_code);
  } catch (const util::OracleFailure& e) {
    outcome.error_message = e.what();
    span.RecordException(outcome.error_message);
    BLOCKFORGE_LOG_WARN("heal oracle call failed", {observability::BlockField(block_id), observability::StringField("error", e.what())});
    return outcome;
  }
  outcome.code->explanation = kHealedPrefix + outcome.code->explanation;

  try {
    outcome.result  = executor_->Execute(block_id, candidate_version, outcome.code->backend_code);
    outcome.success = true;
  } catch (const util::ExecutionFailure& e) {
    outcome.error_message = e.what();
    span.RecordException(outcome.error_message);
  }
  return outcome;
}

} // namespace blockforge::core
