#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace blockforge::db::sqlite {

using blockforge::db::ErrorCode;
using blockforge::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kBlockColumns   = "id,user_prompt,title,current_version,refresh_interval_sec,layout,status,created_at_ms,updated_at_ms";
constexpr const char* kVersionColumns = "block_id,version,backend_code,frontend_code,explanation,status,created_at_ms";
constexpr const char* kLogColumns     = "id,block_id,version,execution_type,success,error_message,duration_ms,created_at_ms";

// Reads have no Result channel; a statement that cannot be prepared is a schema bug.
Statement PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    return Statement(nullptr, &sqlite3_finalize);
  }
  return Statement(st, &sqlite3_finalize);
}

void StepOrThrow(sqlite3* db, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::BlockRecord ReadBlock(sqlite3_stmt* st) {
  model::BlockRecord r;
  r.id                   = ColU64(st, 0);
  r.user_prompt          = ColText(st, 1);
  r.title                = ColText(st, 2);
  r.current_version      = static_cast<uint32_t>(ColI64(st, 3));
  r.refresh_interval_sec = static_cast<uint32_t>(ColI64(st, 4));
  r.layout_json          = ColText(st, 5);
  r.status               = static_cast<blockforge::core::v1::BlockStatus>(ColI32(st, 6));
  r.created_at_ms        = ColI64(st, 7);
  r.updated_at_ms        = ColI64(st, 8);
  return r;
}

model::BlockVersionRecord ReadVersion(sqlite3_stmt* st) {
  model::BlockVersionRecord r;
  r.block_id      = ColU64(st, 0);
  r.version       = static_cast<uint32_t>(ColI64(st, 1));
  r.backend_code  = ColText(st, 2);
  r.frontend_code = ColText(st, 3);
  r.explanation   = ColText(st, 4);
  r.status        = static_cast<blockforge::core::v1::VersionStatus>(ColI32(st, 5));
  r.created_at_ms = ColI64(st, 6);
  return r;
}

model::ExecutionLogRecord ReadLog(sqlite3_stmt* st) {
  model::ExecutionLogRecord r;
  r.id             = ColU64(st, 0);
  r.block_id       = ColU64(st, 1);
  r.version        = static_cast<uint32_t>(ColI64(st, 2));
  r.execution_type = static_cast<blockforge::core::v1::ExecutionType>(ColI32(st, 3));
  r.success        = ColI32(st, 4) != 0;
  r.error_message  = ColText(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) {
    r.duration_ms = ColI64(st, 6);
  }
  r.created_at_ms = ColI64(st, 7);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Blocks
// ------------------------------------------------------------------

Result SqliteRepository::InsertBlock(Transaction& t, model::BlockRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO blocks(user_prompt,title,current_version,refresh_interval_sec,layout,status,created_at_ms,updated_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_prompt);
  BindText(st.get(), 2, r.title);
  BindI64(st.get(), 3, r.current_version);
  BindI64(st.get(), 4, r.refresh_interval_sec);
  BindText(st.get(), 5, r.layout_json);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindI64(st.get(), 7, r.created_at_ms);
  BindI64(st.get(), 8, r.updated_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Translate(db, rc);
}

std::optional<model::BlockRecord> SqliteRepository::GetBlock(Transaction& t, uint64_t block_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kBlockColumns + " FROM blocks WHERE id=?;");
  BindU64(st.get(), 1, block_id);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadBlock(st.get());
}

std::vector<model::BlockRecord> SqliteRepository::ListBlocks(Transaction& t, bool include_deleted) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kBlockColumns + " FROM blocks";
  if (!include_deleted) {
    sql += " WHERE status<>" + std::to_string(static_cast<int>(blockforge::core::v1::BLOCK_STATUS_DELETED));
  }
  sql += " ORDER BY id;";

  auto                            st = PrepareOrThrow(db, sql);
  std::vector<model::BlockRecord> out;
  int                             rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadBlock(st.get()));
  }
  StepOrThrow(db, rc);
  return out;
}

Result SqliteRepository::UpdateBlock(Transaction& t, const model::BlockRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE blocks SET user_prompt=?,title=?,current_version=?,refresh_interval_sec=?,layout=?,status=?,created_at_ms=?,"
                    "updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_prompt);
  BindText(st.get(), 2, r.title);
  BindI64(st.get(), 3, r.current_version);
  BindI64(st.get(), 4, r.refresh_interval_sec);
  BindText(st.get(), 5, r.layout_json);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindI64(st.get(), 7, r.created_at_ms);
  BindI64(st.get(), 8, r.updated_at_ms);
  BindU64(st.get(), 9, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "block " + std::to_string(r.id) + " not found");
  }
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, const model::BlockVersionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO block_versions(") + kVersionColumns + ") VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.block_id);
  BindI64(st.get(), 2, r.version);
  BindText(st.get(), 3, r.backend_code);
  BindText(st.get(), 4, r.frontend_code);
  BindText(st.get(), 5, r.explanation);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindI64(st.get(), 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BlockVersionRecord> SqliteRepository::GetVersion(Transaction& t, uint64_t block_id, uint32_t version) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kVersionColumns + " FROM block_versions WHERE block_id=? AND version=?;");
  BindU64(st.get(), 1, block_id);
  BindI64(st.get(), 2, version);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadVersion(st.get());
}

uint32_t SqliteRepository::GetMaxVersion(Transaction& t, uint64_t block_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COALESCE(MAX(version),0) FROM block_versions WHERE block_id=?;");
  BindU64(st.get(), 1, block_id);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  return rc == SQLITE_ROW ? static_cast<uint32_t>(ColI64(st.get(), 0)) : 0;
}

std::vector<model::BlockVersionRecord> SqliteRepository::ListVersions(Transaction& t, uint64_t block_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kVersionColumns + " FROM block_versions WHERE block_id=? ORDER BY version;");
  BindU64(st.get(), 1, block_id);

  std::vector<model::BlockVersionRecord> out;
  int                                    rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadVersion(st.get()));
  }
  StepOrThrow(db, rc);
  return out;
}

Result SqliteRepository::UpdateVersionStatus(Transaction& t, uint64_t block_id, uint32_t version, blockforge::core::v1::VersionStatus status) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE block_versions SET status=? WHERE block_id=? AND version=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(status));
  BindU64(st.get(), 2, block_id);
  BindI64(st.get(), 3, version);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "version " + std::to_string(version) + " not found");
  }
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Cached data
// ------------------------------------------------------------------

Result SqliteRepository::InsertBlockData(Transaction& t, model::BlockDataRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO block_data(block_id,data,fetched_at_ms,expires_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.block_id);
  BindText(st.get(), 2, r.data_json);
  BindI64(st.get(), 3, r.fetched_at_ms);
  BindI64(st.get(), 4, r.expires_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Translate(db, rc);
}

std::optional<model::BlockDataRecord> SqliteRepository::GetLatestBlockData(Transaction& t, uint64_t block_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT id,block_id,data,fetched_at_ms,expires_at_ms FROM block_data WHERE block_id=? "
                             "ORDER BY fetched_at_ms DESC, id DESC LIMIT 1;");
  BindU64(st.get(), 1, block_id);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;

  model::BlockDataRecord r;
  r.id            = ColU64(st.get(), 0);
  r.block_id      = ColU64(st.get(), 1);
  r.data_json     = ColText(st.get(), 2);
  r.fetched_at_ms = ColI64(st.get(), 3);
  r.expires_at_ms = ColI64(st.get(), 4);
  return r;
}

// ------------------------------------------------------------------
// Execution logs
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecutionLog(Transaction& t, model::ExecutionLogRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO execution_logs(block_id,version,execution_type,success,error_message,duration_ms,created_at_ms) "
                    "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.block_id);
  BindI64(st.get(), 2, r.version);
  BindI32(st.get(), 3, static_cast<int>(r.execution_type));
  BindI32(st.get(), 4, r.success ? 1 : 0);
  BindOptionalText(st.get(), 5, r.error_message);
  if (r.duration_ms) {
    BindI64(st.get(), 6, *r.duration_ms);
  } else {
    sqlite3_bind_null(st.get(), 6);
  }
  BindI64(st.get(), 7, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Translate(db, rc);
}

std::optional<model::ExecutionLogRecord> SqliteRepository::GetLatestFailure(Transaction& t, uint64_t block_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kLogColumns +
                                    " FROM execution_logs WHERE block_id=? AND success=0 ORDER BY created_at_ms DESC, id DESC LIMIT 1;");
  BindU64(st.get(), 1, block_id);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadLog(st.get());
}

uint64_t SqliteRepository::CountFailuresSince(Transaction& t, uint64_t block_id, int64_t since_ms) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM execution_logs WHERE block_id=? AND success=0 AND created_at_ms>=?;");
  BindU64(st.get(), 1, block_id);
  BindI64(st.get(), 2, since_ms);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc);
  return rc == SQLITE_ROW ? ColU64(st.get(), 0) : 0;
}

std::vector<model::ExecutionLogRecord> SqliteRepository::ListExecutionLogs(Transaction& t, uint64_t block_id, uint32_t limit) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kLogColumns + " FROM execution_logs WHERE block_id=? ORDER BY created_at_ms DESC, id DESC";
  if (limit != 0) {
    sql += " LIMIT " + std::to_string(limit);
  }
  sql += ";";

  auto st = PrepareOrThrow(db, sql);
  BindU64(st.get(), 1, block_id);

  std::vector<model::ExecutionLogRecord> out;
  int                                    rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadLog(st.get()));
  }
  StepOrThrow(db, rc);
  return out;
}

} // namespace blockforge::db::sqlite
