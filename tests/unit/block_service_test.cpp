#include "internal/service/block_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/block_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "tests/support/fake_collaborators.hpp"

namespace {

using namespace blockforge::v1;
using blockforge::testing::FakeExecutor;
using blockforge::testing::FakeOracle;
using blockforge::testing::MakeCode;

struct Fixture {
  std::shared_ptr<FakeOracle>   oracle   = std::make_shared<FakeOracle>();
  std::shared_ptr<FakeExecutor> executor = std::make_shared<FakeExecutor>();
  std::unique_ptr<blockforge::service::BlockService> service;

  Fixture() {
    blockforge::service::ServiceContext ctx;
    ctx.manager = std::make_shared<blockforge::core::BlockManager>(std::make_shared<blockforge::db::memory::MemoryRepository>(), oracle,
                                                                  executor);
    service     = std::make_unique<blockforge::service::BlockService>(ctx);
  }

  Block Create(const std::string& prompt) {
    CreateBlockRequest req;
    req.set_user_prompt(prompt);
    return service->Create(req);
  }
};

template <typename Req>
Req WithId(uint64_t id) {
  Req req;
  req.mutable_id()->set_value(id);
  return req;
}

void TestCreateAndGetRoundTripThroughProtos() {
  Fixture f;
  f.oracle->QueueGenerate(MakeCode("weather", "fetches weather"));

  const auto created = f.Create("NYC weather today");
  assert(created.id().value() != 0);
  assert(created.title() == "Nyc Weather Today");
  assert(created.status() == BLOCK_STATUS_ACTIVE);
  assert(created.current_version() == 1);
  assert(created.layout().fields().at("h").number_value() == 4);
  assert(created.created_at().seconds() > 0);

  const auto fetched = f.service->Get(WithId<GetBlockRequest>(created.id().value()));
  assert(fetched.user_prompt() == "NYC weather today");
  assert(fetched.updated_at().seconds() == created.updated_at().seconds());

  const auto versions = f.service->ListVersions(WithId<ListBlockVersionsRequest>(created.id().value()));
  assert(versions.versions_size() == 1);
  assert(versions.versions(0).backend_code() == "weather");
  assert(versions.versions(0).explanation() == "fetches weather");
  assert(versions.versions(0).status() == VERSION_STATUS_ACTIVE);
}

void TestDataSnapshotsCarryJsonAndCacheFlag() {
  Fixture f;
  f.oracle->QueueGenerate(MakeCode("prices"));
  const auto created = f.Create("btc price");

  const auto first = f.service->GetData(WithId<GetBlockDataRequest>(created.id().value()));
  assert(!first.cached());
  assert(first.block_id().value() == created.id().value());
  assert(first.data().struct_value().fields().at("code").string_value() == "prices");
  assert(first.expires_at().seconds() - first.fetched_at().seconds() == 3600);

  const auto second = f.service->GetData(WithId<GetBlockDataRequest>(created.id().value()));
  assert(second.cached());

  const auto refreshed = f.service->RefreshData(WithId<RefreshBlockDataRequest>(created.id().value()));
  assert(!refreshed.cached());
}

void TestFailuresSurfaceInLogs() {
  Fixture f;
  f.oracle->QueueGenerate(MakeCode("broken"));
  f.executor->failing_code.insert("broken");
  const auto created = f.Create("broken block");
  assert(created.status() == BLOCK_STATUS_ERROR);

  auto req = WithId<ListExecutionLogsRequest>(created.id().value());
  req.set_limit(10);
  const auto logs = f.service->ListExecutionLogs(req);
  assert(logs.logs_size() == 1);
  assert(!logs.logs(0).success());
  assert(logs.logs(0).execution_type() == EXECUTION_TYPE_FETCH);
  assert(!logs.logs(0).has_duration_ms());

  f.oracle->QueueHeal(MakeCode("fixed"));
  const auto healed = f.service->Heal(WithId<HealBlockRequest>(created.id().value()));
  assert(healed.current_version() == 2);
  assert(healed.status() == BLOCK_STATUS_ACTIVE);
}

void TestUpdateLayoutListAndDelete() {
  Fixture f;
  const auto first  = f.Create("first block");
  const auto second = f.Create("second block");

  auto layout_req = WithId<UpdateBlockLayoutRequest>(first.id().value());
  (*layout_req.mutable_layout()->mutable_fields())["x"].set_number_value(3);
  const auto moved = f.service->UpdateLayout(layout_req);
  assert(moved.layout().fields().at("x").number_value() == 3);
  assert(moved.layout().fields().count("w") == 0);

  assert(f.service->List(ListBlocksRequest()).blocks_size() == 2);
  f.service->Delete(WithId<DeleteBlockRequest>(second.id().value()));
  const auto remaining = f.service->List(ListBlocksRequest());
  assert(remaining.blocks_size() == 1);
  assert(remaining.blocks(0).id().value() == first.id().value());
}

void TestInvalidRequestsAreRejected() {
  Fixture f;

  bool threw = false;
  try {
    f.service->Create(CreateBlockRequest());
  } catch (const blockforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.service->Get(GetBlockRequest());
  } catch (const blockforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.service->Get(WithId<GetBlockRequest>(77));
  } catch (const blockforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto created = f.Create("a block");
  threw              = false;
  try {
    f.service->Update(WithId<UpdateBlockRequest>(created.id().value()));
  } catch (const blockforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateAndGetRoundTripThroughProtos();
  TestDataSnapshotsCarryJsonAndCacheFlag();
  TestFailuresSurfaceInLogs();
  TestUpdateLayoutListAndDelete();
  TestInvalidRequestsAreRejected();

  std::cout << "blockforge_unit_block_service: pass\n";
  return 0;
}
