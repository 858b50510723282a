#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace blockforge::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace blockforge::db::postgres
