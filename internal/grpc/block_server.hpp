#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "blockforge/services/v1/block_service.grpc.pb.h"
#include "internal/service/block_service.hpp"
#include "blockforge/v1.hpp"

namespace blockforge::grpc {

class BlockServer final : public blockforge::services::v1::BlockService::Service {
public:
  explicit BlockServer(std::shared_ptr<blockforge::service::BlockService> svc);

  ::grpc::Status CreateBlock(::grpc::ServerContext*, const blockforge::v1::CreateBlockRequest*, blockforge::v1::Block*) override;

  ::grpc::Status GetBlock(::grpc::ServerContext*, const blockforge::v1::GetBlockRequest*, blockforge::v1::Block*) override;

  ::grpc::Status ListBlocks(::grpc::ServerContext*, const blockforge::v1::ListBlocksRequest*,
                            blockforge::v1::ListBlocksResponse*) override;

  ::grpc::Status UpdateBlock(::grpc::ServerContext*, const blockforge::v1::UpdateBlockRequest*, blockforge::v1::Block*) override;

  ::grpc::Status DeleteBlock(::grpc::ServerContext*, const blockforge::v1::DeleteBlockRequest*, google::protobuf::Empty*) override;

  ::grpc::Status HealBlock(::grpc::ServerContext*, const blockforge::v1::HealBlockRequest*, blockforge::v1::Block*) override;

  ::grpc::Status RefreshBlockData(::grpc::ServerContext*, const blockforge::v1::RefreshBlockDataRequest*,
                                  blockforge::v1::BlockDataSnapshot*) override;

  ::grpc::Status GetBlockData(::grpc::ServerContext*, const blockforge::v1::GetBlockDataRequest*,
                              blockforge::v1::BlockDataSnapshot*) override;

  ::grpc::Status UpdateBlockLayout(::grpc::ServerContext*, const blockforge::v1::UpdateBlockLayoutRequest*,
                                   blockforge::v1::Block*) override;

  ::grpc::Status ListBlockVersions(::grpc::ServerContext*, const blockforge::v1::ListBlockVersionsRequest*,
                                   blockforge::v1::ListBlockVersionsResponse*) override;

  ::grpc::Status ListExecutionLogs(::grpc::ServerContext*, const blockforge::v1::ListExecutionLogsRequest*,
                                   blockforge::v1::ListExecutionLogsResponse*) override;

private:
  std::shared_ptr<blockforge::service::BlockService> service_;
};

}
