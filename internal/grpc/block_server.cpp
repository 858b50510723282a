#include "block_server.hpp"
#include "grpc_error.hpp"

namespace blockforge::grpc {

using namespace blockforge::v1;

namespace {

template <typename Fn>
::grpc::Status Guard(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

BlockServer::BlockServer(std::shared_ptr<blockforge::service::BlockService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BlockServer::CreateBlock(::grpc::ServerContext*, const CreateBlockRequest* req, Block* resp) {
  return Guard([&] { *resp = service_->Create(*req); });
}

::grpc::Status BlockServer::GetBlock(::grpc::ServerContext*, const GetBlockRequest* req, Block* resp) {
  return Guard([&] { *resp = service_->Get(*req); });
}

::grpc::Status BlockServer::ListBlocks(::grpc::ServerContext*, const ListBlocksRequest* req, ListBlocksResponse* resp) {
  return Guard([&] { *resp = service_->List(*req); });
}

::grpc::Status BlockServer::UpdateBlock(::grpc::ServerContext*, const UpdateBlockRequest* req, Block* resp) {
  return Guard([&] { *resp = service_->Update(*req); });
}

::grpc::Status BlockServer::DeleteBlock(::grpc::ServerContext*, const DeleteBlockRequest* req, google::protobuf::Empty*) {
  return Guard([&] { service_->Delete(*req); });
}

::grpc::Status BlockServer::HealBlock(::grpc::ServerContext*, const HealBlockRequest* req, Block* resp) {
  return Guard([&] { *resp = service_->Heal(*req); });
}

::grpc::Status BlockServer::RefreshBlockData(::grpc::ServerContext*, const RefreshBlockDataRequest* req, BlockDataSnapshot* resp) {
  return Guard([&] { *resp = service_->RefreshData(*req); });
}

::grpc::Status BlockServer::GetBlockData(::grpc::ServerContext*, const GetBlockDataRequest* req, BlockDataSnapshot* resp) {
  return Guard([&] { *resp = service_->GetData(*req); });
}

::grpc::Status BlockServer::UpdateBlockLayout(::grpc::ServerContext*, const UpdateBlockLayoutRequest* req, Block* resp) {
  return Guard([&] { *resp = service_->UpdateLayout(*req); });
}

::grpc::Status BlockServer::ListBlockVersions(::grpc::ServerContext*, const ListBlockVersionsRequest* req,
                                              ListBlockVersionsResponse* resp) {
  return Guard([&] { *resp = service_->ListVersions(*req); });
}

::grpc::Status BlockServer::ListExecutionLogs(::grpc::ServerContext*, const ListExecutionLogsRequest* req,
                                              ListExecutionLogsResponse* resp) {
  return Guard([&] { *resp = service_->ListExecutionLogs(*req); });
}

}
