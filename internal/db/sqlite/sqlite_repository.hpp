#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace blockforge::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace blockforge::db::sqlite
