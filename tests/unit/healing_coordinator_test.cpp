#include "internal/core/healing_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "tests/support/fake_collaborators.hpp"

namespace {

using blockforge::core::HealingCoordinator;
using blockforge::core::HealPolicy;
using blockforge::testing::FakeExecutor;
using blockforge::testing::FakeOracle;
using blockforge::testing::MakeCode;

void TestPolicyThrottle() {
  HealPolicy policy;
  assert(policy.ShouldAutoHeal(1));
  assert(!policy.ShouldAutoHeal(2));
  assert(!policy.ShouldAutoHeal(3));

  const auto now = blockforge::util::FromUnixMillis(10'000'000);
  assert(now - policy.WindowStart(now) == std::chrono::hours(1));

  blockforge::runtime::config::LifecycleConfig config;
  config.set_heal_window_sec(60);
  config.set_heal_max_failures_in_window(3);
  const auto configured = HealPolicy::FromConfig(config);
  assert(configured.window == std::chrono::seconds(60));
  assert(configured.ShouldAutoHeal(3));
  assert(!configured.ShouldAutoHeal(4));

  const auto defaults = HealPolicy::FromConfig(blockforge::runtime::config::LifecycleConfig());
  assert(defaults.window == std::chrono::hours(1));
  assert(defaults.max_failures_in_window == 1);
}

void TestSuccessfulAttemptPrefixesExplanation() {
  auto oracle   = std::make_shared<FakeOracle>();
  auto executor = std::make_shared<FakeExecutor>();
  oracle->QueueHeal(MakeCode("fixed", "uses the v2 endpoint"));

  HealingCoordinator healer(oracle, executor, HealPolicy{});
  const auto         outcome = healer.Attempt(9, 4, "btc price", "KeyError: 'usd'", "broken");

  assert(outcome.success);
  assert(outcome.code.has_value());
  assert(outcome.code->explanation == "Auto-healed: uses the v2 endpoint");
  assert(outcome.result.has_value());
  assert(outcome.error_message.empty());

  assert(oracle->heal_calls.size() == 1);
  assert(oracle->heal_calls[0].original_prompt == "btc price");
  assert(oracle->heal_calls[0].error_message == "KeyError: 'usd'");
  assert(oracle->heal_calls[0].failed_code == "broken");

  assert(executor->calls.size() == 1);
  assert(executor->calls[0].block_id == 9);
  assert(executor->calls[0].version == 4);
}

void TestFailuresAreReportedNotThrown() {
  auto oracle   = std::make_shared<FakeOracle>();
  auto executor = std::make_shared<FakeExecutor>();
  HealingCoordinator healer(oracle, executor, HealPolicy{});

  oracle->QueueHealFailure("oracle request failed: HTTP 503");
  auto outcome = healer.Attempt(1, 2, "p", "e", "c");
  assert(!outcome.success);
  assert(!outcome.code.has_value());
  assert(outcome.error_message == "oracle request failed: HTTP 503");
  assert(executor->calls.empty());

  oracle->QueueHeal(MakeCode("slow"));
  executor->timing_out.insert("slow");
  outcome = healer.Attempt(1, 2, "p", "e", "c");
  assert(!outcome.success);
  assert(outcome.code.has_value());
  assert(outcome.code->backend_code == "slow");
  assert(!outcome.result.has_value());
  assert(outcome.error_message == "Block execution timed out");
}

} // namespace

int main() {
  TestPolicyThrottle();
  TestSuccessfulAttemptPrefixesExplanation();
  TestFailuresAreReportedNotThrown();

  std::cout << "blockforge_unit_healing_coordinator: pass\n";
  return 0;
}
