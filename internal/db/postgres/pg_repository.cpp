#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace blockforge::db::postgres {

namespace {

constexpr const char* kBlockColumns   = "id,user_prompt,title,current_version,refresh_interval_sec,layout::text,status,created_at_ms,updated_at_ms";
constexpr const char* kVersionColumns = "block_id,version,backend_code,frontend_code,explanation,status,created_at_ms";
constexpr const char* kLogColumns     = "id,block_id,version,execution_type,success,error_message,duration_ms,created_at_ms";

model::BlockRecord ReadBlock(const pqxx::row& row) {
  model::BlockRecord r;
  r.id                   = row[0].as<uint64_t>();
  r.user_prompt          = row[1].c_str();
  r.title                = row[2].c_str();
  r.current_version      = row[3].as<uint32_t>();
  r.refresh_interval_sec = row[4].as<uint32_t>();
  r.layout_json          = row[5].c_str();
  r.status               = static_cast<blockforge::core::v1::BlockStatus>(row[6].as<int>());
  r.created_at_ms        = row[7].as<int64_t>();
  r.updated_at_ms        = row[8].as<int64_t>();
  return r;
}

model::BlockVersionRecord ReadVersion(const pqxx::row& row) {
  model::BlockVersionRecord r;
  r.block_id      = row[0].as<uint64_t>();
  r.version       = row[1].as<uint32_t>();
  r.backend_code  = row[2].c_str();
  r.frontend_code = row[3].c_str();
  r.explanation   = row[4].is_null() ? "" : row[4].c_str();
  r.status        = static_cast<blockforge::core::v1::VersionStatus>(row[5].as<int>());
  r.created_at_ms = row[6].as<int64_t>();
  return r;
}

model::ExecutionLogRecord ReadLog(const pqxx::row& row) {
  model::ExecutionLogRecord r;
  r.id             = row[0].as<uint64_t>();
  r.block_id       = row[1].as<uint64_t>();
  r.version        = row[2].as<uint32_t>();
  r.execution_type = static_cast<blockforge::core::v1::ExecutionType>(row[3].as<int>());
  r.success        = row[4].as<bool>();
  r.error_message  = row[5].is_null() ? "" : row[5].c_str();
  if (!row[6].is_null()) {
    r.duration_ms = row[6].as<int64_t>();
  }
  r.created_at_ms = row[7].as<int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Blocks
// ------------------------------------------------------------------

Result PgRepository::InsertBlock(Transaction& t, model::BlockRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO blocks(user_prompt,title,current_version,refresh_interval_sec,layout,status,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8) RETURNING id;",
        r.user_prompt, r.title, r.current_version, r.refresh_interval_sec, r.layout_json, static_cast<int>(r.status), r.created_at_ms,
        r.updated_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BlockRecord> PgRepository::GetBlock(Transaction& t, uint64_t block_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kBlockColumns + " FROM blocks WHERE id=$1;", block_id);
  if (res.empty()) return std::nullopt;
  return ReadBlock(res[0]);
}

std::vector<model::BlockRecord> PgRepository::ListBlocks(Transaction& t, bool include_deleted) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kBlockColumns + " FROM blocks WHERE $1 OR status<>$2 ORDER BY id;", include_deleted,
                                      static_cast<int>(blockforge::core::v1::BLOCK_STATUS_DELETED));

  std::vector<model::BlockRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadBlock(row));
  }
  return out;
}

Result PgRepository::UpdateBlock(Transaction& t, const model::BlockRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE blocks SET user_prompt=$2,title=$3,current_version=$4,refresh_interval_sec=$5,layout=$6::jsonb,status=$7,created_at_ms=$8,"
        "updated_at_ms=$9 WHERE id=$1;",
        r.id, r.user_prompt, r.title, r.current_version, r.refresh_interval_sec, r.layout_json, static_cast<int>(r.status), r.created_at_ms,
        r.updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "block " + std::to_string(r.id) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result PgRepository::InsertVersion(Transaction& t, const model::BlockVersionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO block_versions(") + kVersionColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7);", r.block_id,
                             r.version, r.backend_code, r.frontend_code, r.explanation, static_cast<int>(r.status), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BlockVersionRecord> PgRepository::GetVersion(Transaction& t, uint64_t block_id, uint32_t version) {
  auto res =
      TX(t).Work().exec_params(std::string("SELECT ") + kVersionColumns + " FROM block_versions WHERE block_id=$1 AND version=$2;", block_id, version);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

uint32_t PgRepository::GetMaxVersion(Transaction& t, uint64_t block_id) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(version),0) FROM block_versions WHERE block_id=$1;", block_id);
  return res[0][0].as<uint32_t>();
}

std::vector<model::BlockVersionRecord> PgRepository::ListVersions(Transaction& t, uint64_t block_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kVersionColumns + " FROM block_versions WHERE block_id=$1 ORDER BY version;", block_id);

  std::vector<model::BlockVersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

Result PgRepository::UpdateVersionStatus(Transaction& t, uint64_t block_id, uint32_t version, blockforge::core::v1::VersionStatus status) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE block_versions SET status=$3 WHERE block_id=$1 AND version=$2;", block_id, version,
                                        static_cast<int>(status));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "version " + std::to_string(version) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Cached data
// ------------------------------------------------------------------

Result PgRepository::InsertBlockData(Transaction& t, model::BlockDataRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO block_data(block_id,data,fetched_at_ms,expires_at_ms) VALUES($1,$2::jsonb,$3,$4) RETURNING id;", r.block_id, r.data_json,
        r.fetched_at_ms, r.expires_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BlockDataRecord> PgRepository::GetLatestBlockData(Transaction& t, uint64_t block_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,block_id,data::text,fetched_at_ms,expires_at_ms FROM block_data WHERE block_id=$1 ORDER BY fetched_at_ms DESC, id DESC LIMIT 1;",
      block_id);
  if (res.empty()) return std::nullopt;

  model::BlockDataRecord r;
  r.id            = res[0][0].as<uint64_t>();
  r.block_id      = res[0][1].as<uint64_t>();
  r.data_json     = res[0][2].c_str();
  r.fetched_at_ms = res[0][3].as<int64_t>();
  r.expires_at_ms = res[0][4].as<int64_t>();
  return r;
}

// ------------------------------------------------------------------
// Execution logs
// ------------------------------------------------------------------

Result PgRepository::InsertExecutionLog(Transaction& t, model::ExecutionLogRecord& r) {
  try {
    const std::optional<std::string> error_message =
        r.error_message.empty() ? std::nullopt : std::optional<std::string>(r.error_message);
    auto res = TX(t).Work().exec_params(
        "INSERT INTO execution_logs(block_id,version,execution_type,success,error_message,duration_ms,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id;",
        r.block_id, r.version, static_cast<int>(r.execution_type), r.success, error_message, r.duration_ms, r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ExecutionLogRecord> PgRepository::GetLatestFailure(Transaction& t, uint64_t block_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kLogColumns +
                                          " FROM execution_logs WHERE block_id=$1 AND NOT success ORDER BY created_at_ms DESC, id DESC LIMIT 1;",
                                      block_id);
  if (res.empty()) return std::nullopt;
  return ReadLog(res[0]);
}

uint64_t PgRepository::CountFailuresSince(Transaction& t, uint64_t block_id, int64_t since_ms) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM execution_logs WHERE block_id=$1 AND NOT success AND created_at_ms>=$2;", block_id,
                                      since_ms);
  return res[0][0].as<uint64_t>();
}

std::vector<model::ExecutionLogRecord> PgRepository::ListExecutionLogs(Transaction& t, uint64_t block_id, uint32_t limit) {
  // LIMIT NULL means no limit in postgres
  const std::optional<int64_t> row_limit = limit == 0 ? std::nullopt : std::optional<int64_t>(limit);
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kLogColumns +
                                          " FROM execution_logs WHERE block_id=$1 ORDER BY created_at_ms DESC, id DESC LIMIT $2;",
                                      block_id, row_limit);

  std::vector<model::ExecutionLogRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadLog(row));
  }
  return out;
}

} // namespace blockforge::db::postgres
