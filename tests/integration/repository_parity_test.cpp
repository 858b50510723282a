#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/block_data_record.hpp"
#include "internal/db/model/block_record.hpp"
#include "internal/db/model/block_version_record.hpp"
#include "internal/db/model/execution_log_record.hpp"

#if BLOCKFORGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if BLOCKFORGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using namespace blockforge::core::v1;
using blockforge::db::ErrorCode;
using blockforge::db::Repository;
using blockforge::db::memory::MemoryRepository;
using blockforge::db::model::BlockDataRecord;
using blockforge::db::model::BlockRecord;
using blockforge::db::model::BlockVersionRecord;
using blockforge::db::model::ExecutionLogRecord;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

BlockRecord MakeBlock(const std::string& prompt) {
  BlockRecord block;
  block.user_prompt          = prompt;
  block.title                = "Title for " + prompt;
  block.current_version      = 1;
  block.refresh_interval_sec = 900;
  block.layout_json          = R"({"x":0,"y":0,"w":6,"h":4})";
  block.status               = BLOCK_STATUS_ACTIVE;
  block.created_at_ms        = NowMs();
  block.updated_at_ms        = block.created_at_ms;
  return block;
}

BlockVersionRecord MakeVersion(uint64_t block_id, uint32_t version, VersionStatus status) {
  BlockVersionRecord record;
  record.block_id      = block_id;
  record.version       = version;
  record.backend_code  = "class BlockExecutor:\n    pass  # v" + std::to_string(version) + "\n";
  record.frontend_code = "export default () => null;";
  record.explanation   = "version " + std::to_string(version);
  record.status        = status;
  record.created_at_ms = NowMs();
  return record;
}

ExecutionLogRecord MakeLog(uint64_t block_id, uint32_t version, bool success, int64_t created_at_ms) {
  ExecutionLogRecord log;
  log.block_id       = block_id;
  log.version        = version;
  log.execution_type = EXECUTION_TYPE_FETCH;
  log.success        = success;
  log.error_message  = success ? "" : "Block execution failed: boom";
  log.created_at_ms  = created_at_ms;
  return log;
}

uint64_t InsertBlock(Repository& repo, const std::string& prompt) {
  auto tx    = repo.Begin();
  auto block = MakeBlock(prompt);
  assert(repo.InsertBlock(*tx, block));
  assert(block.id != 0);
  tx->Commit();
  return block.id;
}

void VerifyBlockReadWrite(Repository& repo, const std::string& prompt) {
  auto tx = repo.Begin();

  auto block = MakeBlock(prompt);
  assert(repo.InsertBlock(*tx, block));
  const auto id = block.id;
  assert(id != 0);

  auto read = repo.GetBlock(*tx, id);
  assert(read.has_value());
  assert(read->user_prompt == prompt);
  assert(read->title == block.title);
  assert(read->refresh_interval_sec == 900);
  assert(read->layout_json == block.layout_json);
  assert(read->status == BLOCK_STATUS_ACTIVE);
  assert(read->created_at_ms == block.created_at_ms);

  read->current_version = 3;
  read->status          = BLOCK_STATUS_ERROR;
  read->updated_at_ms   = block.updated_at_ms + 5;
  assert(repo.UpdateBlock(*tx, *read));

  auto updated = repo.GetBlock(*tx, id);
  assert(updated->current_version == 3);
  assert(updated->status == BLOCK_STATUS_ERROR);
  assert(updated->updated_at_ms == block.updated_at_ms + 5);

  BlockRecord missing = *updated;
  missing.id          = id + 100000;
  assert(repo.UpdateBlock(*tx, missing).code == ErrorCode::NotFound);
  assert(!repo.GetBlock(*tx, id + 100000).has_value());

  tx->Commit();
}

void VerifyListExcludesDeleted(Repository& repo, const std::string& prefix) {
  const auto kept    = InsertBlock(repo, prefix + "-kept");
  const auto deleted = InsertBlock(repo, prefix + "-deleted");

  auto tx    = repo.Begin();
  auto block = repo.GetBlock(*tx, deleted);
  block->status = BLOCK_STATUS_DELETED;
  assert(repo.UpdateBlock(*tx, *block));

  bool saw_kept = false;
  for (const auto& record : repo.ListBlocks(*tx, false)) {
    assert(record.id != deleted);
    saw_kept = saw_kept || record.id == kept;
  }
  assert(saw_kept);

  bool saw_deleted = false;
  for (const auto& record : repo.ListBlocks(*tx, true)) {
    saw_deleted = saw_deleted || record.id == deleted;
  }
  assert(saw_deleted);
  tx->Commit();
}

void VerifyVersions(Repository& repo, const std::string& prompt) {
  const auto id = InsertBlock(repo, prompt);
  auto       tx = repo.Begin();

  assert(repo.GetMaxVersion(*tx, id) == 0);
  assert(repo.InsertVersion(*tx, MakeVersion(id, 1, VERSION_STATUS_ACTIVE)));
  assert(repo.InsertVersion(*tx, MakeVersion(id, 2, VERSION_STATUS_FAILED)));
  assert(repo.GetMaxVersion(*tx, id) == 2);

  const auto duplicate = repo.InsertVersion(*tx, MakeVersion(id, 2, VERSION_STATUS_ACTIVE));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto v1 = repo.GetVersion(*tx, id, 1);
  assert(v1.has_value());
  assert(v1->backend_code == "class BlockExecutor:\n    pass  # v1\n");
  assert(v1->explanation == "version 1");
  assert(v1->status == VERSION_STATUS_ACTIVE);
  assert(!repo.GetVersion(*tx, id, 9).has_value());

  assert(repo.UpdateVersionStatus(*tx, id, 1, VERSION_STATUS_DEPRECATED));
  assert(repo.GetVersion(*tx, id, 1)->status == VERSION_STATUS_DEPRECATED);
  assert(repo.UpdateVersionStatus(*tx, id, 9, VERSION_STATUS_ACTIVE).code == ErrorCode::NotFound);

  const auto versions = repo.ListVersions(*tx, id);
  assert(versions.size() == 2);
  assert(versions[0].version == 1);
  assert(versions[1].version == 2);
  assert(versions[1].status == VERSION_STATUS_FAILED);

  tx->Commit();
}

void VerifyBlockData(Repository& repo, const std::string& prompt) {
  const auto id  = InsertBlock(repo, prompt);
  const auto now = NowMs();
  auto       tx  = repo.Begin();

  assert(!repo.GetLatestBlockData(*tx, id).has_value());

  BlockDataRecord older;
  older.block_id      = id;
  older.data_json     = R"({"n":1})";
  older.fetched_at_ms = now;
  older.expires_at_ms = now + 1000;
  assert(repo.InsertBlockData(*tx, older));
  assert(older.id != 0);

  BlockDataRecord newer = older;
  newer.id              = 0;
  newer.data_json       = R"({"n":2})";
  newer.fetched_at_ms   = now + 10;
  newer.expires_at_ms   = now + 1010;
  assert(repo.InsertBlockData(*tx, newer));
  assert(newer.id != older.id);

  auto latest = repo.GetLatestBlockData(*tx, id);
  assert(latest.has_value());
  assert(latest->id == newer.id);
  assert(latest->fetched_at_ms == now + 10);
  assert(latest->expires_at_ms == now + 1010);
  assert(latest->data_json.find("2") != std::string::npos);

  tx->Commit();
}

void VerifyExecutionLogs(Repository& repo, const std::string& prompt) {
  const auto id  = InsertBlock(repo, prompt);
  const auto now = NowMs();
  auto       tx  = repo.Begin();

  assert(!repo.GetLatestFailure(*tx, id).has_value());

  auto old_failure = MakeLog(id, 1, false, now - 7'200'000);
  assert(repo.InsertExecutionLog(*tx, old_failure));
  assert(old_failure.id != 0);

  auto success        = MakeLog(id, 1, true, now - 1000);
  success.duration_ms = 42;
  assert(repo.InsertExecutionLog(*tx, success));

  auto recent_failure           = MakeLog(id, 2, false, now);
  recent_failure.execution_type = EXECUTION_TYPE_HEAL;
  assert(repo.InsertExecutionLog(*tx, recent_failure));

  assert(repo.CountFailuresSince(*tx, id, now - 3'600'000) == 1);
  assert(repo.CountFailuresSince(*tx, id, now - 10'000'000) == 2);
  assert(repo.CountFailuresSince(*tx, id, now + 1) == 0);

  auto latest = repo.GetLatestFailure(*tx, id);
  assert(latest.has_value());
  assert(latest->id == recent_failure.id);
  assert(latest->version == 2);
  assert(latest->execution_type == EXECUTION_TYPE_HEAL);
  assert(latest->error_message == "Block execution failed: boom");
  assert(!latest->duration_ms.has_value());

  const auto all = repo.ListExecutionLogs(*tx, id, 0);
  assert(all.size() == 3);
  assert(all[0].id == recent_failure.id);
  assert(all[1].success);
  assert(all[1].duration_ms.has_value() && *all[1].duration_ms == 42);
  assert(all[1].error_message.empty());
  assert(all[2].id == old_failure.id);

  const auto limited = repo.ListExecutionLogs(*tx, id, 2);
  assert(limited.size() == 2);
  assert(limited[1].id == success.id);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prompt) {
  uint64_t id = 0;
  {
    auto tx    = repo.Begin();
    auto block = MakeBlock(prompt);
    assert(repo.InsertBlock(*tx, block));
    id = block.id;
    tx->Rollback();
  }
  {
    auto tx    = repo.Begin();
    auto block = MakeBlock(prompt + "-dropped");
    assert(repo.InsertBlock(*tx, block));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetBlock(*tx, id).has_value());
  for (const auto& record : repo.ListBlocks(*tx, true)) {
    assert(record.user_prompt != prompt);
    assert(record.user_prompt != prompt + "-dropped");
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prompt) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  const auto id = InsertBlock(*repo, prompt);
  {
    auto tx = repo->Begin();
    assert(repo->InsertVersion(*tx, MakeVersion(id, 1, VERSION_STATUS_ACTIVE)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto block = repo->GetBlock(*tx, id);
  assert(block.has_value());
  assert(block->user_prompt == prompt);
  assert(repo->GetMaxVersion(*tx, id) == 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if BLOCKFORGE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("blockforge_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<blockforge::db::sqlite::SqliteDB>(db_path);
    blockforge::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<blockforge::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if BLOCKFORGE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("BLOCKFORGE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("BLOCKFORGE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<blockforge::db::postgres::PgPool>(conninfo);
    blockforge::db::postgres::BootstrapSchema(pool);
    return std::make_shared<blockforge::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyBlockReadWrite(*repo, backend.name + "-block");
    VerifyListExcludesDeleted(*repo, backend.name + "-list");
    VerifyVersions(*repo, backend.name + "-versions");
    VerifyBlockData(*repo, backend.name + "-data");
    VerifyExecutionLogs(*repo, backend.name + "-logs");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback-" + std::to_string(NowMs()));
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if BLOCKFORGE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if BLOCKFORGE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "blockforge_integration_repository_parity: pass\n";
  return 0;
}
