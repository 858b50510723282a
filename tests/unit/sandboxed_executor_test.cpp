#include "internal/executor/sandboxed_executor.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/executor/code_wrapper.hpp"
#include "internal/executor/process_runner.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using blockforge::executor::SandboxedExecutor;
using blockforge::executor::SandboxedExecutorOptions;
using blockforge::util::ExecutionFailure;

constexpr const char* kWorkingBlock = R"(class BlockExecutor:
    def fetch_data(self):
        return {"temps": [20, 22, 24]}

    def process_data(self, raw):
        temps = raw["temps"]
        return {"avg": sum(temps) / len(temps), "label": "NYC"}
)";

constexpr const char* kAsyncBlock = R"(import asyncio

class BlockExecutor:
    async def fetch_data(self):
        await asyncio.sleep(0)
        return [1, 2, 3]

    async def process_data(self, raw):
        return {"count": len(raw)}
)";

constexpr const char* kRaisingBlock = R"(class BlockExecutor:
    def fetch_data(self):
        raise ValueError("upstream returned 500")

    def process_data(self, raw):
        return raw
)";

constexpr const char* kSlowBlock = R"(import time

class BlockExecutor:
    def fetch_data(self):
        time.sleep(30)
        return {}

    def process_data(self, raw):
        return raw
)";

constexpr const char* kChattyBlock = R"(class BlockExecutor:
    def fetch_data(self):
        print("debug: fetching")
        return {}

    def process_data(self, raw):
        return raw
)";

constexpr const char* kForbiddenImportBlock = R"(import blockforge_not_a_real_module

class BlockExecutor:
    def fetch_data(self):
        return {}

    def process_data(self, raw):
        return raw
)";

bool PythonAvailable() {
  blockforge::executor::ProcessLimits limits;
  limits.timeout_ms = 10000;
  const auto result = blockforge::executor::RunProcess({"python3", "-c", "pass"}, "", limits);
  return result.started && result.exit_code == 0;
}

fs::path FreshRoot(const std::string& name) {
  const auto root = fs::temp_directory_path() / "blockforge_executor_tests" / name;
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

SandboxedExecutorOptions Options(const std::string& name) {
  SandboxedExecutorOptions options;
  options.artifact_root = FreshRoot(name);
  options.timeout_ms    = 10000;
  return options;
}

ExecutionFailure::Kind FailureKind(SandboxedExecutor& executor, uint64_t block_id, uint32_t version, const std::string& code,
                                   std::string* message) {
  try {
    executor.Execute(block_id, version, code);
  } catch (const ExecutionFailure& e) {
    *message = e.what();
    return e.kind();
  }
  assert(false && "execution was expected to fail");
  return ExecutionFailure::Kind::kSpawn;
}

void TestSuccessfulRunReturnsJson() {
  SandboxedExecutor executor(Options("success"));

  const auto result = executor.Execute(1, 1, kWorkingBlock);
  const auto& fields = result.output.struct_value().fields();
  assert(fields.at("avg").number_value() == 22);
  assert(fields.at("label").string_value() == "NYC");
  assert(result.duration_ms >= 0);

  const auto dir = executor.VersionDirectory(1, 1);
  assert(fs::exists(dir / "block_executor.py"));
  assert(fs::exists(dir / "execute.py"));

  const auto async_result = executor.Execute(1, 2, kAsyncBlock);
  assert(async_result.output.struct_value().fields().at("count").number_value() == 3);
}

void TestFailureKinds() {
  SandboxedExecutor executor(Options("failures"));

  std::string message;
  assert(FailureKind(executor, 1, 1, kRaisingBlock, &message) == ExecutionFailure::Kind::kNonZeroExit);
  assert(message.find("Block execution failed: ") == 0);
  assert(message.find("upstream returned 500") != std::string::npos);

  assert(FailureKind(executor, 1, 3, kChattyBlock, &message) == ExecutionFailure::Kind::kInvalidOutput);
  assert(message == "Block did not return valid JSON");

  assert(FailureKind(executor, 1, 4, kForbiddenImportBlock, &message) == ExecutionFailure::Kind::kNonZeroExit);
  assert(message.find("is not allowed") != std::string::npos);
}

void TestSlowBlockTimesOut() {
  auto options       = Options("timeout");
  options.timeout_ms = 1000;
  SandboxedExecutor executor(options);

  std::string message;
  assert(FailureKind(executor, 1, 1, kSlowBlock, &message) == ExecutionFailure::Kind::kTimeout);
  assert(message == "Block execution timed out");
}

void TestMissingInterpreterIsSpawnFailure() {
  auto options              = Options("spawn");
  options.python_executable = "/nonexistent/python3";
  SandboxedExecutor executor(options);

  std::string message;
  assert(FailureKind(executor, 1, 1, kWorkingBlock, &message) == ExecutionFailure::Kind::kSpawn);
  assert(message.find("Block execution could not start: ") == 0);
}

void TestRetentionKeepsNewestVersions() {
  auto options            = Options("retention");
  options.retain_versions = 5;
  SandboxedExecutor executor(options);

  for (uint32_t version = 1; version <= 7; ++version) {
    executor.Execute(42, version, kWorkingBlock);
  }

  std::size_t count = 0;
  for (const auto& entry : fs::directory_iterator(options.artifact_root / "42")) {
    assert(entry.is_directory());
    ++count;
  }
  assert(count == 5);
  assert(!fs::exists(executor.VersionDirectory(42, 1)));
  assert(!fs::exists(executor.VersionDirectory(42, 2)));
  for (uint32_t version = 3; version <= 7; ++version) {
    assert(fs::exists(executor.VersionDirectory(42, version)));
  }

  // unrelated entries are left alone
  fs::create_directories(options.artifact_root / "42" / "scratch");
  executor.ApplyRetention(42);
  assert(fs::exists(options.artifact_root / "42" / "scratch"));
}

void TestCodeWrapper() {
  using blockforge::executor::PythonStringLiteral;
  using blockforge::executor::WrapBlockCode;

  assert(PythonStringLiteral("a'b\\c\n") == "'a\\'b\\\\c\\n'");

  const auto script = WrapBlockCode("class BlockExecutor:\n    pass", {"requests"});
  assert(script.find("ALLOWED_PACKAGES = {'requests'}") != std::string::npos);
  assert(script.find("class BlockExecutor:\n    pass\n") != std::string::npos);
  assert(script.find("asyncio.run(") != std::string::npos);
}

} // namespace

int main() {
  TestCodeWrapper();

  if (!PythonAvailable()) {
    std::cout << "blockforge_unit_sandboxed_executor: skipped (python3 not found)\n";
    return 0;
  }

  TestSuccessfulRunReturnsJson();
  TestFailureKinds();
  TestSlowBlockTimesOut();
  TestMissingInterpreterIsSpawnFailure();
  TestRetentionKeepsNewestVersions();

  std::cout << "blockforge_unit_sandboxed_executor: pass\n";
  return 0;
}
