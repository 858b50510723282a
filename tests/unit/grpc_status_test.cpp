#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/block_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/block_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/block_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "blockforge/v1.hpp"
#include "tests/support/fake_collaborators.hpp"

namespace {

using blockforge::testing::FakeExecutor;
using blockforge::testing::FakeOracle;
using blockforge::testing::MakeCode;
using blockforge::util::ExecutionFailure;

struct Fixture {
  std::shared_ptr<FakeOracle>   oracle   = std::make_shared<FakeOracle>();
  std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>();
  std::unique_ptr<blockforge::grpc::BlockServer> server;

  Fixture() {
    blockforge::service::ServiceContext ctx;
    ctx.manager = std::make_shared<blockforge::core::BlockManager>(std::make_shared<blockforge::db::memory::MemoryRepository>(), oracle,
                                                                  executor);
    server      = std::make_unique<blockforge::grpc::BlockServer>(std::make_shared<blockforge::service::BlockService>(ctx));
  }

  uint64_t Create(const std::string& code) {
    oracle->QueueGenerate(MakeCode(code));
    blockforge::v1::CreateBlockRequest req;
    req.set_user_prompt("prompt for " + code);
    blockforge::v1::Block resp;
    ::grpc::ServerContext grpc_ctx;
    const auto status = server->CreateBlock(&grpc_ctx, &req, &resp);
    assert(status.ok());
    return resp.id().value();
  }
};

void TestExceptionMapping() {
  using blockforge::grpc::ToStatus;

  assert(ToStatus(blockforge::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(blockforge::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(blockforge::util::HealPrecondition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(blockforge::util::OracleFailure("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(ExecutionFailure(ExecutionFailure::Kind::kTimeout, "x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(ExecutionFailure(ExecutionFailure::Kind::kNonZeroExit, "x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(ExecutionFailure(ExecutionFailure::Kind::kInvalidOutput, "x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(blockforge::util::NotFound("block 7 not found")).error_message() == "block 7 not found");
}

void TestGetMissingBlockReturnsNotFound() {
  Fixture f;

  blockforge::v1::GetBlockRequest req;
  req.mutable_id()->set_value(12345);
  blockforge::v1::Block resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server->GetBlock(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestHealWithoutFailureReturnsFailedPrecondition() {
  Fixture f;
  const auto id = f.Create("healthy");

  blockforge::v1::HealBlockRequest req;
  req.mutable_id()->set_value(id);
  blockforge::v1::Block resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server->HealBlock(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestCreateWithOracleOutageReturnsUnavailable() {
  Fixture f;
  f.oracle->QueueGenerateFailure("oracle request failed: connection refused");

  blockforge::v1::CreateBlockRequest req;
  req.set_user_prompt("anything");
  blockforge::v1::Block resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server->CreateBlock(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestRefreshTimeoutReturnsDeadlineExceeded() {
  Fixture f;
  const auto id = f.Create("slow");
  f.executor->timing_out.insert("slow");
  f.oracle->QueueHealFailure("oracle unavailable");

  blockforge::v1::RefreshBlockDataRequest req;
  req.mutable_id()->set_value(id);
  blockforge::v1::BlockDataSnapshot resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server->RefreshBlockData(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingBlockReturnsNotFound();
  TestHealWithoutFailureReturnsFailedPrecondition();
  TestCreateWithOracleOutageReturnsUnavailable();
  TestRefreshTimeoutReturnsDeadlineExceeded();

  std::cout << "blockforge_unit_grpc_status: pass\n";
  return 0;
}
