#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace blockforge::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertBlock(Transaction&, model::BlockRecord&) override;
  std::optional<model::BlockRecord> GetBlock(Transaction&, uint64_t block_id) override;
  std::vector<model::BlockRecord>   ListBlocks(Transaction&, bool include_deleted) override;
  Result                            UpdateBlock(Transaction&, const model::BlockRecord&) override;

  Result                                   InsertVersion(Transaction&, const model::BlockVersionRecord&) override;
  std::optional<model::BlockVersionRecord> GetVersion(Transaction&, uint64_t block_id, uint32_t version) override;
  uint32_t                                 GetMaxVersion(Transaction&, uint64_t block_id) override;
  std::vector<model::BlockVersionRecord>   ListVersions(Transaction&, uint64_t block_id) override;
  Result UpdateVersionStatus(Transaction&, uint64_t block_id, uint32_t version, blockforge::core::v1::VersionStatus status) override;

  Result                                InsertBlockData(Transaction&, model::BlockDataRecord&) override;
  std::optional<model::BlockDataRecord> GetLatestBlockData(Transaction&, uint64_t block_id) override;

  Result                                   InsertExecutionLog(Transaction&, model::ExecutionLogRecord&) override;
  std::optional<model::ExecutionLogRecord> GetLatestFailure(Transaction&, uint64_t block_id) override;
  uint64_t                                 CountFailuresSince(Transaction&, uint64_t block_id, int64_t since_ms) override;
  std::vector<model::ExecutionLogRecord>   ListExecutionLogs(Transaction&, uint64_t block_id, uint32_t limit) override;

 private:
  friend class MemoryTransaction;

  using VersionKey = std::pair<uint64_t, uint32_t>;

  struct State {
    std::map<uint64_t, model::BlockRecord>          blocks;
    std::map<VersionKey, model::BlockVersionRecord> versions;
    std::vector<model::BlockDataRecord>             block_data;
    std::vector<model::ExecutionLogRecord>          execution_logs;

    uint64_t next_block_id = 1;
    uint64_t next_data_id  = 1;
    uint64_t next_log_id   = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace blockforge::db::memory
