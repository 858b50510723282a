#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace blockforge::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// ------------------------------------------------------------
// Blocks
// ------------------------------------------------------------

Result MemoryRepository::InsertBlock(Transaction& t, model::BlockRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_block_id++;
  } else if (s.blocks.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "block " + std::to_string(r.id) + " already exists");
  } else {
    s.next_block_id = std::max(s.next_block_id, r.id + 1);
  }
  s.blocks[r.id] = r;
  return Result::Ok();
}

std::optional<model::BlockRecord> MemoryRepository::GetBlock(Transaction& t, uint64_t block_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.blocks.find(block_id);
  if (it == s.blocks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BlockRecord> MemoryRepository::ListBlocks(Transaction& t, bool include_deleted) {
  std::vector<model::BlockRecord> out;
  for (const auto& [_, record] : TX(t).View().blocks) {
    if (!include_deleted && record.status == blockforge::core::v1::BLOCK_STATUS_DELETED) continue;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpdateBlock(Transaction& t, const model::BlockRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.blocks.find(r.id);
  if (it == s.blocks.end()) return Result::Err(ErrorCode::NotFound, "block " + std::to_string(r.id) + " not found");
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------
// Versions
// ------------------------------------------------------------

Result MemoryRepository::InsertVersion(Transaction& t, const model::BlockVersionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.blocks.contains(r.block_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown block " + std::to_string(r.block_id));
  }
  const VersionKey key{r.block_id, r.version};
  if (s.versions.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version) + " already exists");
  }
  s.versions[key] = r;
  return Result::Ok();
}

std::optional<model::BlockVersionRecord> MemoryRepository::GetVersion(Transaction& t, uint64_t block_id, uint32_t version) {
  const auto& s  = TX(t).View();
  const auto  it = s.versions.find(VersionKey{block_id, version});
  if (it == s.versions.end()) return std::nullopt;
  return it->second;
}

uint32_t MemoryRepository::GetMaxVersion(Transaction& t, uint64_t block_id) {
  uint32_t max_version = 0;
  for (const auto& record : ListVersions(t, block_id)) {
    max_version = std::max(max_version, record.version);
  }
  return max_version;
}

std::vector<model::BlockVersionRecord> MemoryRepository::ListVersions(Transaction& t, uint64_t block_id) {
  std::vector<model::BlockVersionRecord> out;
  const auto&                            s = TX(t).View();
  // map order is (block_id, version) so the range is already ascending
  for (auto it = s.versions.lower_bound(VersionKey{block_id, 0}); it != s.versions.end() && it->first.first == block_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpdateVersionStatus(Transaction& t, uint64_t block_id, uint32_t version, blockforge::core::v1::VersionStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.versions.find(VersionKey{block_id, version});
  if (it == s.versions.end()) return Result::Err(ErrorCode::NotFound, "version " + std::to_string(version) + " not found");
  it->second.status = status;
  return Result::Ok();
}

// ------------------------------------------------------------
// Cached data
// ------------------------------------------------------------

Result MemoryRepository::InsertBlockData(Transaction& t, model::BlockDataRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.blocks.contains(r.block_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown block " + std::to_string(r.block_id));
  }
  r.id = s.next_data_id++;
  s.block_data.push_back(r);
  return Result::Ok();
}

std::optional<model::BlockDataRecord> MemoryRepository::GetLatestBlockData(Transaction& t, uint64_t block_id) {
  std::optional<model::BlockDataRecord> latest;
  for (const auto& record : TX(t).View().block_data) {
    if (record.block_id != block_id) continue;
    if (!latest || record.fetched_at_ms > latest->fetched_at_ms ||
        (record.fetched_at_ms == latest->fetched_at_ms && record.id > latest->id)) {
      latest = record;
    }
  }
  return latest;
}

// ------------------------------------------------------------
// Execution logs
// ------------------------------------------------------------

Result MemoryRepository::InsertExecutionLog(Transaction& t, model::ExecutionLogRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.blocks.contains(r.block_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown block " + std::to_string(r.block_id));
  }
  r.id = s.next_log_id++;
  s.execution_logs.push_back(r);
  return Result::Ok();
}

std::optional<model::ExecutionLogRecord> MemoryRepository::GetLatestFailure(Transaction& t, uint64_t block_id) {
  std::optional<model::ExecutionLogRecord> latest;
  for (const auto& record : TX(t).View().execution_logs) {
    if (record.block_id != block_id || record.success) continue;
    if (!latest || record.created_at_ms > latest->created_at_ms ||
        (record.created_at_ms == latest->created_at_ms && record.id > latest->id)) {
      latest = record;
    }
  }
  return latest;
}

uint64_t MemoryRepository::CountFailuresSince(Transaction& t, uint64_t block_id, int64_t since_ms) {
  const auto& logs = TX(t).View().execution_logs;
  return static_cast<uint64_t>(std::count_if(logs.begin(), logs.end(), [&](const model::ExecutionLogRecord& record) {
    return record.block_id == block_id && !record.success && record.created_at_ms >= since_ms;
  }));
}

std::vector<model::ExecutionLogRecord> MemoryRepository::ListExecutionLogs(Transaction& t, uint64_t block_id, uint32_t limit) {
  std::vector<model::ExecutionLogRecord> out;
  for (const auto& record : TX(t).View().execution_logs) {
    if (record.block_id == block_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const model::ExecutionLogRecord& a, const model::ExecutionLogRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  if (limit != 0 && out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

} // namespace blockforge::db::memory
