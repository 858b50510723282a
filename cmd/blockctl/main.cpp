#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "blockforge/services/v1/block_service.grpc.pb.h"
#include "blockforge/v1.hpp"

using namespace blockforge::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  blockctl <addr> create <prompt> [title] [refresh_interval_sec]\n"
            << "  blockctl <addr> get <block_id>\n"
            << "  blockctl <addr> list\n"
            << "  blockctl <addr> update <block_id> <prompt>\n"
            << "  blockctl <addr> delete <block_id>\n"
            << "  blockctl <addr> heal <block_id>\n"
            << "  blockctl <addr> refresh <block_id>\n"
            << "  blockctl <addr> data <block_id>\n"
            << "  blockctl <addr> layout <block_id> <layout_json>\n"
            << "  blockctl <addr> versions <block_id>\n"
            << "  blockctl <addr> logs <block_id> [limit]\n";
}

static BlockID MakeID(const std::string& s) {
  std::size_t consumed = 0;
  uint64_t    value    = 0;
  try {
    value = std::stoull(s, &consumed);
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (consumed != s.size() || value == 0) {
    std::cerr << "invalid block id: '" << s << "'\n";
    std::exit(1);
  }

  BlockID id;
  id.set_value(value);
  return id;
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.ToString() << "\n";
    std::exit(2);
  }
  std::cout << out;
}

// Issues one unary call and prints the response as JSON.
template <typename Req, typename Resp, typename Call>
static int Invoke(const Req& req, Resp* resp, Call&& call) {
  grpc::ClientContext ctx;

  auto status = call(&ctx, req, resp);
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }

  Print(*resp);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = BlockService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    CreateBlockRequest req;
    req.set_user_prompt(argv[3]);
    if (argc >= 5) req.set_title(argv[4]);
    if (argc >= 6) req.set_refresh_interval_sec(static_cast<uint32_t>(std::stoul(argv[5])));

    Block resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->CreateBlock(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetBlockRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    Block resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->GetBlock(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListBlocksRequest  req;
    ListBlocksResponse resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->ListBlocks(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "update") {
    if (argc < 5) return 1;

    UpdateBlockRequest req;
    *req.mutable_id() = MakeID(argv[3]);
    req.set_user_prompt(argv[4]);

    Block resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->UpdateBlock(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteBlockRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    grpc::ClientContext     ctx;
    google::protobuf::Empty resp;

    auto status = stub->DeleteBlock(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
      return 2;
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "heal") {
    if (argc < 4) return 1;

    HealBlockRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    Block resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->HealBlock(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "refresh") {
    if (argc < 4) return 1;

    RefreshBlockDataRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    BlockDataSnapshot resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->RefreshBlockData(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "data") {
    if (argc < 4) return 1;

    GetBlockDataRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    BlockDataSnapshot resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->GetBlockData(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "layout") {
    if (argc < 5) return 1;

    UpdateBlockLayoutRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    auto parsed = google::protobuf::util::JsonStringToMessage(argv[4], req.mutable_layout());
    if (!parsed.ok()) {
      std::cerr << "invalid layout json: " << parsed.ToString() << "\n";
      return 1;
    }

    Block resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->UpdateBlockLayout(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "versions") {
    if (argc < 4) return 1;

    ListBlockVersionsRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    ListBlockVersionsResponse resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->ListBlockVersions(ctx, r, out); });
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    if (argc < 4) return 1;

    ListExecutionLogsRequest req;
    *req.mutable_id() = MakeID(argv[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    ListExecutionLogsResponse resp;
    return Invoke(req, &resp, [&](auto* ctx, const auto& r, auto* out) { return stub->ListExecutionLogs(ctx, r, out); });
  }

  Usage();
  return 1;
}
