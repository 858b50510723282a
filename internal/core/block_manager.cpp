#include "block_manager.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace blockforge::core {

using namespace blockforge::core::v1;
using db::model::BlockDataRecord;
using db::model::BlockRecord;
using db::model::BlockVersionRecord;
using db::model::ExecutionLogRecord;
using observability::BlockField;
using observability::StringField;
using observability::VersionField;

namespace {

constexpr const char* kDefaultLayoutJson = R"({"x":0,"y":0,"w":6,"h":4})";
constexpr std::size_t kTitleWords        = 4;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

BlockRecord RequireBlock(db::Repository& repository, db::Transaction& tx, uint64_t block_id) {
  auto block = repository.GetBlock(tx, block_id);
  if (!block) {
    throw util::NotFound("block " + std::to_string(block_id) + " not found");
  }
  return *block;
}

void RequireNotDeleted(const BlockRecord& block) {
  if (block.status == BLOCK_STATUS_DELETED) {
    throw util::InvalidState("block " + std::to_string(block.id) + " is deleted");
  }
}

void RequireServable(const BlockRecord& block) {
  RequireNotDeleted(block);
  if (block.status == BLOCK_STATUS_DISABLED) {
    throw util::InvalidState("block " + std::to_string(block.id) + " is disabled");
  }
}

ExecutionLogRecord MakeLog(uint64_t block_id, uint32_t version, ExecutionType type, bool success, std::string error_message, int64_t now_ms) {
  ExecutionLogRecord log;
  log.block_id       = block_id;
  log.version        = version;
  log.execution_type = type;
  log.success        = success;
  log.error_message  = std::move(error_message);
  log.created_at_ms  = now_ms;
  return log;
}

BlockVersionRecord MakeVersion(uint64_t block_id, uint32_t version, const oracle::GeneratedCode& code, VersionStatus status, int64_t now_ms) {
  BlockVersionRecord record;
  record.block_id      = block_id;
  record.version       = version;
  record.backend_code  = code.backend_code;
  record.frontend_code = code.frontend_code;
  record.explanation   = code.explanation;
  record.status        = status;
  record.created_at_ms = now_ms;
  return record;
}

} // namespace

BlockManager::BlockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<oracle::CodeOracle> oracle,
                           std::shared_ptr<executor::Executor> executor, BlockManagerOptions options)
    : repository_(std::move(repository)),
      oracle_(oracle),
      executor_(executor),
      healer_(std::move(oracle), std::move(executor), options.heal_policy),
      default_refresh_interval_sec_(options.default_refresh_interval_sec == 0 ? 3600 : options.default_refresh_interval_sec),
      clock_(options.clock ? std::move(options.clock) : util::ClockFn(util::Now)) {
}

std::shared_ptr<std::mutex> BlockManager::BlockMutex(uint64_t block_id) {
  std::lock_guard<std::mutex> lock(block_mutexes_guard_);
  auto&                       block_mutex = block_mutexes_[block_id];
  if (!block_mutex) {
    block_mutex = std::make_shared<std::mutex>();
  }
  return block_mutex;
}

int64_t BlockManager::NowMs() const {
  return util::ToUnixMillis(clock_());
}

std::string BlockManager::DefaultTitle(const std::string& prompt) {
  std::istringstream in(prompt);
  std::string        word;
  std::string        joined;
  for (std::size_t count = 0; count < kTitleWords && in >> word; ++count) {
    if (!joined.empty()) joined.push_back(' ');
    joined += word;
  }

  // capitalize the first letter of each alphabetic run, lowercase the rest
  bool previous_alpha = false;
  for (auto& c : joined) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c              = static_cast<char>(previous_alpha ? std::tolower(uc) : std::toupper(uc));
      previous_alpha = true;
    } else {
      previous_alpha = false;
    }
  }
  return joined;
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

BlockRecord BlockManager::Create(const std::string& prompt, const std::string& title, uint32_t refresh_interval_sec) {
  observability::SpanScope span("block.Create");

  auto code = oracle_->Generate(prompt, std::nullopt);

  const auto  now_ms = NowMs();
  BlockRecord block;
  block.user_prompt          = prompt;
  block.title                = title.empty() ? DefaultTitle(prompt) : title;
  block.current_version      = 1;
  block.refresh_interval_sec = refresh_interval_sec == 0 ? default_refresh_interval_sec_ : refresh_interval_sec;
  block.layout_json          = kDefaultLayoutJson;
  block.status               = BLOCK_STATUS_ACTIVE;
  block.created_at_ms        = now_ms;
  block.updated_at_ms        = now_ms;

  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertBlock(*tx, block), "insert block");
    ThrowIfDbError(repository_->InsertVersion(*tx, MakeVersion(block.id, 1, code, VERSION_STATUS_ACTIVE, now_ms)), "insert version");
    tx->Commit();
  }
  span.SetAttribute("block.id", static_cast<std::int64_t>(block.id));

  auto                        block_mutex = BlockMutex(block.id);
  std::lock_guard<std::mutex> lock(*block_mutex);

  try {
    executor_->Execute(block.id, 1, code.backend_code);
  } catch (const util::ExecutionFailure& e) {
    auto tx = repository_->Begin();
    block.status        = BLOCK_STATUS_ERROR;
    block.updated_at_ms = NowMs();
    auto log            = MakeLog(block.id, 1, EXECUTION_TYPE_FETCH, false, e.what(), block.updated_at_ms);
    ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");
    ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update block");
    tx->Commit();
  }

  BLOCKFORGE_LOG_INFO("block created", {BlockField(block.id), VersionField(1), StringField("status", BlockStatus_Name(block.status))});
  return block;
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

BlockRecord BlockManager::Update(uint64_t block_id, const std::string& prompt) {
  observability::SpanScope span("block.Update");
  span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));

  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);

  BlockRecord                       block;
  std::optional<BlockVersionRecord> current;
  uint32_t                          new_version = 0;
  {
    auto tx = repository_->Begin();
    block   = RequireBlock(*repository_, *tx, block_id);
    RequireNotDeleted(block);
    current     = repository_->GetVersion(*tx, block_id, block.current_version);
    new_version = repository_->GetMaxVersion(*tx, block_id) + 1;
  }

  oracle::GenerationContext context;
  context.original_prompt = block.user_prompt;
  context.previous_code   = current ? current->backend_code : std::string();
  context.iteration       = prompt;

  const auto code = oracle_->Generate(prompt, context);

  std::optional<std::string> failure;
  try {
    executor_->Execute(block_id, new_version, code.backend_code);
  } catch (const util::ExecutionFailure& e) {
    failure = e.what();
  }

  const auto now_ms = NowMs();
  auto       tx     = repository_->Begin();
  if (!failure) {
    ThrowIfDbError(repository_->InsertVersion(*tx, MakeVersion(block_id, new_version, code, VERSION_STATUS_ACTIVE, now_ms)), "insert version");
    if (current) {
      ThrowIfDbError(repository_->UpdateVersionStatus(*tx, block_id, current->version, VERSION_STATUS_DEPRECATED), "deprecate version");
    }
    block.current_version = new_version;
    block.status          = BLOCK_STATUS_ACTIVE;
  } else {
    ThrowIfDbError(repository_->InsertVersion(*tx, MakeVersion(block_id, new_version, code, VERSION_STATUS_FAILED, now_ms)), "insert version");
    auto log = MakeLog(block_id, new_version, EXECUTION_TYPE_FETCH, false, *failure, now_ms);
    ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");
    block.status = BLOCK_STATUS_ERROR;
  }
  block.updated_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update block");
  tx->Commit();

  BLOCKFORGE_LOG_INFO("block updated", {BlockField(block_id), VersionField(new_version), observability::BoolField("success", !failure),
                                        observability::IntField("current_version", block.current_version)});
  return block;
}

// ------------------------------------------------------------
// Heal
// ------------------------------------------------------------

BlockRecord BlockManager::Heal(uint64_t block_id) {
  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);
  return HealLocked(block_id, "manual");
}

BlockRecord BlockManager::HealLocked(uint64_t block_id, const char* trigger) {
  observability::SpanScope span("block.Heal");
  span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));
  span.SetAttribute("heal.trigger", trigger);

  BlockRecord                       block;
  std::optional<BlockVersionRecord> current;
  std::optional<ExecutionLogRecord> latest_failure;
  uint32_t                          new_version = 0;
  {
    auto tx = repository_->Begin();
    block   = RequireBlock(*repository_, *tx, block_id);
    RequireNotDeleted(block);
    current        = repository_->GetVersion(*tx, block_id, block.current_version);
    latest_failure = repository_->GetLatestFailure(*tx, block_id);
    new_version    = repository_->GetMaxVersion(*tx, block_id) + 1;
  }
  if (!current || !latest_failure) {
    throw util::HealPrecondition("nothing to heal: block " + std::to_string(block_id) + " has no " +
                                 (current ? "recorded failure" : "current version"));
  }

  const auto outcome = healer_.Attempt(block_id, new_version, block.user_prompt, latest_failure->error_message, current->backend_code);
  const auto prior   = block.current_version;
  const auto now_ms  = NowMs();
  auto       tx      = repository_->Begin();
  if (outcome.code) {
    const auto status = outcome.success ? VERSION_STATUS_ACTIVE : VERSION_STATUS_FAILED;
    ThrowIfDbError(repository_->InsertVersion(*tx, MakeVersion(block_id, new_version, *outcome.code, status, now_ms)), "insert version");
  }

  if (outcome.success) {
    ThrowIfDbError(repository_->UpdateVersionStatus(*tx, block_id, prior, VERSION_STATUS_DEPRECATED), "deprecate version");
    block.current_version = new_version;
    block.status          = BLOCK_STATUS_ACTIVE;
    block.updated_at_ms   = now_ms;
    ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update block");

    auto log = MakeLog(block_id, new_version, EXECUTION_TYPE_HEAL, true, "", now_ms);
    ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");
  } else {
    auto log = MakeLog(block_id, prior, EXECUTION_TYPE_HEAL, false, outcome.error_message, now_ms);
    ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");
  }
  tx->Commit();

  observability::Metrics::Instance().RecordHealAttempt(trigger, outcome.success);
  if (outcome.success) {
    BLOCKFORGE_LOG_INFO("block healed", {BlockField(block_id), VersionField(new_version), StringField("trigger", trigger)});
  } else {
    BLOCKFORGE_LOG_WARN("block heal failed",
                        {BlockField(block_id), VersionField(prior), StringField("trigger", trigger), StringField("error", outcome.error_message)});
  }
  return block;
}

// ------------------------------------------------------------
// Data
// ------------------------------------------------------------

DataSnapshot BlockManager::RefreshData(uint64_t block_id) {
  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);
  return RefreshLocked(block_id);
}

DataSnapshot BlockManager::GetData(uint64_t block_id) {
  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);

  {
    auto tx    = repository_->Begin();
    auto block = RequireBlock(*repository_, *tx, block_id);
    RequireServable(block);

    auto latest = repository_->GetLatestBlockData(*tx, block_id);
    if (latest && latest->expires_at_ms > NowMs()) {
      return DataSnapshot{std::move(*latest), true};
    }
  }
  return RefreshLocked(block_id);
}

DataSnapshot BlockManager::RefreshLocked(uint64_t block_id) {
  observability::SpanScope span("block.RefreshData");
  span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));

  std::optional<util::ExecutionFailure> original_failure;

  // first run, then at most one retry after a successful auto-heal
  for (int attempt = 0; attempt < 2; ++attempt) {
    BlockRecord        block;
    BlockVersionRecord current;
    {
      auto tx = repository_->Begin();
      block   = RequireBlock(*repository_, *tx, block_id);
      RequireServable(block);
      auto version = repository_->GetVersion(*tx, block_id, block.current_version);
      if (!version) {
        throw util::InvalidState("block " + std::to_string(block_id) + " has no current version");
      }
      current = std::move(*version);
    }

    std::optional<executor::ExecutionResult> result;
    std::optional<util::ExecutionFailure>    failure;
    try {
      result = executor_->Execute(block_id, current.version, current.backend_code);
    } catch (const util::ExecutionFailure& e) {
      failure = e;
    }

    const auto now    = clock_();
    const auto now_ms = util::ToUnixMillis(now);

    if (result) {
      auto tx = repository_->Begin();

      BlockDataRecord data;
      data.block_id      = block_id;
      data.data_json     = util::ToJson(result->output);
      data.fetched_at_ms = now_ms;
      data.expires_at_ms = now_ms + static_cast<int64_t>(block.refresh_interval_sec) * 1000;
      ThrowIfDbError(repository_->InsertBlockData(*tx, data), "insert block data");

      auto log        = MakeLog(block_id, current.version, EXECUTION_TYPE_FETCH, true, "", now_ms);
      log.duration_ms = result->duration_ms;
      ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");

      if (block.status != BLOCK_STATUS_ACTIVE) {
        block.status        = BLOCK_STATUS_ACTIVE;
        block.updated_at_ms = now_ms;
        ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update block");
      }
      tx->Commit();
      return DataSnapshot{std::move(data), false};
    }

    uint64_t failures_in_window = 0;
    {
      auto tx  = repository_->Begin();
      auto log = MakeLog(block_id, current.version, EXECUTION_TYPE_FETCH, false, failure->what(), now_ms);
      ThrowIfDbError(repository_->InsertExecutionLog(*tx, log), "insert execution log");
      if (block.status != BLOCK_STATUS_ERROR) {
        block.status        = BLOCK_STATUS_ERROR;
        block.updated_at_ms = now_ms;
        ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update block");
      }
      failures_in_window = repository_->CountFailuresSince(*tx, block_id, util::ToUnixMillis(healer_.policy().WindowStart(now)));
      tx->Commit();
    }

    if (original_failure) {
      BLOCKFORGE_LOG_WARN("refresh retry after heal failed", {BlockField(block_id), VersionField(current.version), StringField("error", failure->what())});
      throw *original_failure;
    }
    original_failure = failure;

    if (!healer_.policy().ShouldAutoHeal(failures_in_window)) {
      BLOCKFORGE_LOG_INFO("auto-heal skipped", {BlockField(block_id), observability::IntField("failures_in_window", static_cast<int64_t>(failures_in_window))});
      throw *original_failure;
    }

    BlockRecord healed;
    try {
      healed = HealLocked(block_id, "auto");
    } catch (const std::exception& e) {
      BLOCKFORGE_LOG_WARN("auto-heal aborted", {BlockField(block_id), StringField("error", e.what())});
      throw *original_failure;
    }
    if (healed.status != BLOCK_STATUS_ACTIVE) {
      throw *original_failure;
    }
  }
  throw *original_failure;
}

// ------------------------------------------------------------
// Mutations without execution
// ------------------------------------------------------------

void BlockManager::Delete(uint64_t block_id) {
  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);

  auto tx    = repository_->Begin();
  auto block = RequireBlock(*repository_, *tx, block_id);
  if (block.status == BLOCK_STATUS_DELETED) {
    return;
  }
  block.status        = BLOCK_STATUS_DELETED;
  block.updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpdateBlock(*tx, block), "delete block");
  tx->Commit();

  BLOCKFORGE_LOG_INFO("block deleted", {BlockField(block_id)});
}

BlockRecord BlockManager::UpdateLayout(uint64_t block_id, const google::protobuf::Struct& layout) {
  auto                        block_mutex = BlockMutex(block_id);
  std::lock_guard<std::mutex> lock(*block_mutex);

  auto tx    = repository_->Begin();
  auto block = RequireBlock(*repository_, *tx, block_id);
  RequireNotDeleted(block);
  block.layout_json   = util::ToJson(layout);
  block.updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpdateBlock(*tx, block), "update layout");
  tx->Commit();
  return block;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

BlockRecord BlockManager::GetBlock(uint64_t block_id) {
  auto tx = repository_->Begin();
  return RequireBlock(*repository_, *tx, block_id);
}

std::vector<BlockRecord> BlockManager::ListBlocks() {
  auto tx = repository_->Begin();
  return repository_->ListBlocks(*tx, false);
}

std::vector<BlockVersionRecord> BlockManager::ListVersions(uint64_t block_id) {
  auto tx = repository_->Begin();
  RequireBlock(*repository_, *tx, block_id);
  return repository_->ListVersions(*tx, block_id);
}

std::vector<ExecutionLogRecord> BlockManager::ListExecutionLogs(uint64_t block_id, uint32_t limit) {
  auto tx = repository_->Begin();
  RequireBlock(*repository_, *tx, block_id);
  return repository_->ListExecutionLogs(*tx, block_id, limit);
}

} // namespace blockforge::core
