#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/block_data_record.hpp"
#include "internal/db/model/block_record.hpp"
#include "internal/db/model/block_version_record.hpp"
#include "internal/db/model/execution_log_record.hpp"

namespace blockforge::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Rows written inside one transaction commit together or not at all

  The DB is the source of truth for:
    blocks and their current version
    version history
    cached block data
    the execution audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Blocks
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertBlock(Transaction&, model::BlockRecord& record) = 0;

  virtual std::optional<model::BlockRecord> GetBlock(Transaction&, uint64_t block_id) = 0;

  // Ordered by id.
  virtual std::vector<model::BlockRecord> ListBlocks(Transaction&, bool include_deleted) = 0;

  virtual Result UpdateBlock(Transaction&, const model::BlockRecord& record) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, const model::BlockVersionRecord& record) = 0;

  virtual std::optional<model::BlockVersionRecord> GetVersion(Transaction&, uint64_t block_id, uint32_t version) = 0;

  // 0 when the block has no versions.
  virtual uint32_t GetMaxVersion(Transaction&, uint64_t block_id) = 0;

  // Ascending by version.
  virtual std::vector<model::BlockVersionRecord> ListVersions(Transaction&, uint64_t block_id) = 0;

  virtual Result UpdateVersionStatus(Transaction&, uint64_t block_id, uint32_t version, blockforge::core::v1::VersionStatus status) = 0;

  // ---------------------------------------------------------------------
  // Cached data
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertBlockData(Transaction&, model::BlockDataRecord& record) = 0;

  // Most recent by fetched_at, ties broken by id.
  virtual std::optional<model::BlockDataRecord> GetLatestBlockData(Transaction&, uint64_t block_id) = 0;

  // ---------------------------------------------------------------------
  // Execution logs
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertExecutionLog(Transaction&, model::ExecutionLogRecord& record) = 0;

  virtual std::optional<model::ExecutionLogRecord> GetLatestFailure(Transaction&, uint64_t block_id) = 0;

  // Failures with created_at_ms >= since_ms.
  virtual uint64_t CountFailuresSince(Transaction&, uint64_t block_id, int64_t since_ms) = 0;

  // Newest first. limit == 0 returns every row.
  virtual std::vector<model::ExecutionLogRecord> ListExecutionLogs(Transaction&, uint64_t block_id, uint32_t limit) = 0;
};

} // namespace blockforge::db
