#pragma once

#include <cstdint>
#include <string>

#include "blockforge/core/v1/block.pb.h"

namespace blockforge::db::model {

// One generated code artifact. (block_id, version) is unique.
struct BlockVersionRecord {
  uint64_t block_id = 0;
  uint32_t version  = 0;

  std::string backend_code;
  std::string frontend_code;
  std::string explanation;

  blockforge::core::v1::VersionStatus status = blockforge::core::v1::VERSION_STATUS_UNSPECIFIED;

  int64_t created_at_ms = 0;
};

} // namespace blockforge::db::model
