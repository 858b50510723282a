#pragma once

#include "blockforge/services/v1/block_service.pb.h"
#include "service_context.hpp"
#include "blockforge/v1.hpp"

namespace blockforge::service {

/*
  Transport-neutral block API.

  Converts requests into BlockManager calls and records back into protos.
  Every call is wrapped in a span, request metrics and an error log.
*/
class BlockService {
public:
  explicit BlockService(ServiceContext ctx);

  blockforge::v1::Block Create(const blockforge::v1::CreateBlockRequest& req);

  blockforge::v1::Block Get(const blockforge::v1::GetBlockRequest& req);

  blockforge::v1::ListBlocksResponse List(const blockforge::v1::ListBlocksRequest& req);

  blockforge::v1::Block Update(const blockforge::v1::UpdateBlockRequest& req);

  void Delete(const blockforge::v1::DeleteBlockRequest& req);

  blockforge::v1::Block Heal(const blockforge::v1::HealBlockRequest& req);

  blockforge::v1::BlockDataSnapshot RefreshData(const blockforge::v1::RefreshBlockDataRequest& req);

  blockforge::v1::BlockDataSnapshot GetData(const blockforge::v1::GetBlockDataRequest& req);

  blockforge::v1::Block UpdateLayout(const blockforge::v1::UpdateBlockLayoutRequest& req);

  blockforge::v1::ListBlockVersionsResponse
  ListVersions(const blockforge::v1::ListBlockVersionsRequest& req);

  blockforge::v1::ListExecutionLogsResponse
  ListExecutionLogs(const blockforge::v1::ListExecutionLogsRequest& req);

private:
  ServiceContext ctx_;
};

}
