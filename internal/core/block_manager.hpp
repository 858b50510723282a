#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/healing_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/executor/executor.hpp"
#include "internal/oracle/oracle.hpp"
#include "internal/util/time.hpp"

namespace blockforge::core {

struct DataSnapshot {
  db::model::BlockDataRecord record;
  bool                       cached = false;
};

struct BlockManagerOptions {
  uint32_t      default_refresh_interval_sec = 3600;
  HealPolicy    heal_policy;
  util::ClockFn clock = util::Now;
};

/*
  Block lifecycle state machine.

  Every operation on one block runs under that block's mutex, so version
  numbers (max + 1) are assigned race-free. Store reads happen in a short
  transaction, the oracle and executor run with no transaction open, and
  each step's writes commit together.

  current_version only advances after a successful execution. A version
  rejected by Update or Heal is kept with status FAILED.
*/
class BlockManager {
 public:
  BlockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<oracle::CodeOracle> oracle,
               std::shared_ptr<executor::Executor> executor, BlockManagerOptions options = {});

  // refresh_interval_sec == 0 selects the default. Throws OracleFailure before writing anything.
  db::model::BlockRecord Create(const std::string& prompt, const std::string& title, uint32_t refresh_interval_sec);

  db::model::BlockRecord Update(uint64_t block_id, const std::string& prompt);

  // Throws HealPrecondition when there is no current version or no failure to heal.
  db::model::BlockRecord Heal(uint64_t block_id);

  // Always executes. On failure may auto-heal once and retry once before rethrowing.
  DataSnapshot RefreshData(uint64_t block_id);

  // Serves unexpired cached data, otherwise refreshes.
  DataSnapshot GetData(uint64_t block_id);

  void                   Delete(uint64_t block_id);
  db::model::BlockRecord UpdateLayout(uint64_t block_id, const google::protobuf::Struct& layout);

  db::model::BlockRecord                 GetBlock(uint64_t block_id);
  std::vector<db::model::BlockRecord>    ListBlocks();
  std::vector<db::model::BlockVersionRecord> ListVersions(uint64_t block_id);
  std::vector<db::model::ExecutionLogRecord> ListExecutionLogs(uint64_t block_id, uint32_t limit);

  static std::string DefaultTitle(const std::string& prompt);

 private:
  std::shared_ptr<std::mutex> BlockMutex(uint64_t block_id);

  db::model::BlockRecord HealLocked(uint64_t block_id, const char* trigger);
  DataSnapshot           RefreshLocked(uint64_t block_id);

  int64_t NowMs() const;

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<oracle::CodeOracle> oracle_;
  std::shared_ptr<executor::Executor> executor_;
  HealingCoordinator                  healer_;
  uint32_t                            default_refresh_interval_sec_;
  util::ClockFn                       clock_;

  mutable std::mutex                                        block_mutexes_guard_;
  std::unordered_map<uint64_t, std::shared_ptr<std::mutex>> block_mutexes_;
};

} // namespace blockforge::core
