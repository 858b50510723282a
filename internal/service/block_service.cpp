#include "block_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/core/block_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace blockforge::service {

using namespace blockforge::v1;

namespace {

BlockID ToBlockID(uint64_t id) {
  BlockID out;
  out.set_value(id);
  return out;
}

uint64_t RequireBlockID(bool has_id, const BlockID& id) {
  if (!has_id || id.value() == 0) {
    throw blockforge::util::InvalidState("request is missing a block id");
  }
  return id.value();
}

Block ToProto(const blockforge::db::model::BlockRecord& record) {
  Block block;
  *block.mutable_id() = ToBlockID(record.id);
  block.set_user_prompt(record.user_prompt);
  block.set_title(record.title);
  block.set_current_version(record.current_version);
  block.set_refresh_interval_sec(record.refresh_interval_sec);
  if (auto layout = blockforge::util::ParseJsonObject(record.layout_json)) {
    *block.mutable_layout() = std::move(*layout);
  }
  block.set_status(record.status);
  *block.mutable_created_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(record.created_at_ms));
  *block.mutable_updated_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(record.updated_at_ms));
  return block;
}

BlockVersion ToProto(const blockforge::db::model::BlockVersionRecord& record) {
  BlockVersion version;
  *version.mutable_block_id() = ToBlockID(record.block_id);
  version.set_version(record.version);
  version.set_backend_code(record.backend_code);
  version.set_frontend_code(record.frontend_code);
  version.set_explanation(record.explanation);
  version.set_status(record.status);
  *version.mutable_created_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(record.created_at_ms));
  return version;
}

ExecutionLog ToProto(const blockforge::db::model::ExecutionLogRecord& record) {
  ExecutionLog log;
  log.set_id(record.id);
  *log.mutable_block_id() = ToBlockID(record.block_id);
  log.set_version(record.version);
  log.set_execution_type(record.execution_type);
  log.set_success(record.success);
  log.set_error_message(record.error_message);
  if (record.duration_ms) {
    log.set_duration_ms(*record.duration_ms);
  }
  *log.mutable_created_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(record.created_at_ms));
  return log;
}

BlockDataSnapshot ToProto(const blockforge::core::DataSnapshot& snapshot) {
  BlockDataSnapshot out;
  *out.mutable_block_id() = ToBlockID(snapshot.record.block_id);
  auto data               = blockforge::util::ParseJsonValue(snapshot.record.data_json);
  if (!data) {
    throw std::runtime_error("stored block data is not valid JSON");
  }
  *out.mutable_data()       = std::move(*data);
  *out.mutable_fetched_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(snapshot.record.fetched_at_ms));
  *out.mutable_expires_at() = blockforge::util::ToProto(blockforge::util::FromUnixMillis(snapshot.record.expires_at_ms));
  out.set_cached(snapshot.cached);
  return out;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, uint64_t block_id, Fn&& fn) {
  blockforge::observability::SpanScope span(route);
  if (block_id != 0) {
    span.SetAttribute("block.id", static_cast<std::int64_t>(block_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    blockforge::observability::Metrics::Instance().RecordRequest(route, success);
    blockforge::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BLOCKFORGE_LOG_ERROR("RPC failed", {blockforge::observability::StringField("route", route),
                                        blockforge::observability::StringField("error", ex.what()),
                                        blockforge::observability::BlockField(block_id)});
    finish(false);
    throw;
  }
}

} // namespace

BlockService::BlockService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Block BlockService::Create(const CreateBlockRequest& req) {
  return ObserveRpc("BlockService.CreateBlock", 0, [&] {
    if (req.user_prompt().empty()) {
      throw blockforge::util::InvalidState("create block: user_prompt must not be empty");
    }
    return ToProto(ctx_.manager->Create(req.user_prompt(), req.title(), req.refresh_interval_sec()));
  });
}

Block BlockService::Get(const GetBlockRequest& req) {
  return ObserveRpc("BlockService.GetBlock", req.id().value(), [&] {
    return ToProto(ctx_.manager->GetBlock(RequireBlockID(req.has_id(), req.id())));
  });
}

ListBlocksResponse BlockService::List(const ListBlocksRequest&) {
  return ObserveRpc("BlockService.ListBlocks", 0, [&] {
    ListBlocksResponse resp;
    for (const auto& record : ctx_.manager->ListBlocks()) {
      *resp.add_blocks() = ToProto(record);
    }
    return resp;
  });
}

Block BlockService::Update(const UpdateBlockRequest& req) {
  return ObserveRpc("BlockService.UpdateBlock", req.id().value(), [&] {
    const auto id = RequireBlockID(req.has_id(), req.id());
    if (req.user_prompt().empty()) {
      throw blockforge::util::InvalidState("update block: user_prompt must not be empty");
    }
    return ToProto(ctx_.manager->Update(id, req.user_prompt()));
  });
}

void BlockService::Delete(const DeleteBlockRequest& req) {
  ObserveRpc("BlockService.DeleteBlock", req.id().value(), [&] { ctx_.manager->Delete(RequireBlockID(req.has_id(), req.id())); });
}

Block BlockService::Heal(const HealBlockRequest& req) {
  return ObserveRpc("BlockService.HealBlock", req.id().value(), [&] {
    return ToProto(ctx_.manager->Heal(RequireBlockID(req.has_id(), req.id())));
  });
}

BlockDataSnapshot BlockService::RefreshData(const RefreshBlockDataRequest& req) {
  return ObserveRpc("BlockService.RefreshBlockData", req.id().value(), [&] {
    return ToProto(ctx_.manager->RefreshData(RequireBlockID(req.has_id(), req.id())));
  });
}

BlockDataSnapshot BlockService::GetData(const GetBlockDataRequest& req) {
  return ObserveRpc("BlockService.GetBlockData", req.id().value(), [&] {
    return ToProto(ctx_.manager->GetData(RequireBlockID(req.has_id(), req.id())));
  });
}

Block BlockService::UpdateLayout(const UpdateBlockLayoutRequest& req) {
  return ObserveRpc("BlockService.UpdateBlockLayout", req.id().value(), [&] {
    return ToProto(ctx_.manager->UpdateLayout(RequireBlockID(req.has_id(), req.id()), req.layout()));
  });
}

ListBlockVersionsResponse BlockService::ListVersions(const ListBlockVersionsRequest& req) {
  return ObserveRpc("BlockService.ListBlockVersions", req.id().value(), [&] {
    ListBlockVersionsResponse resp;
    for (const auto& record : ctx_.manager->ListVersions(RequireBlockID(req.has_id(), req.id()))) {
      *resp.add_versions() = ToProto(record);
    }
    return resp;
  });
}

ListExecutionLogsResponse BlockService::ListExecutionLogs(const ListExecutionLogsRequest& req) {
  return ObserveRpc("BlockService.ListExecutionLogs", req.id().value(), [&] {
    ListExecutionLogsResponse resp;
    for (const auto& record : ctx_.manager->ListExecutionLogs(RequireBlockID(req.has_id(), req.id()), req.limit())) {
      *resp.add_logs() = ToProto(record);
    }
    return resp;
  });
}

} // namespace blockforge::service
