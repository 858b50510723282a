#pragma once

#include <cstdint>
#include <string>

#include "blockforge/core/v1/block.pb.h"

namespace blockforge::db::model {

/*
  Persistent block row.

  current_version always names a version row of this block and only moves
  forward after a successful execution. layout_json is an opaque JSON object.
*/

struct BlockRecord {
  uint64_t id = 0; // assigned by InsertBlock

  std::string user_prompt;
  std::string title;

  uint32_t current_version      = 0;
  uint32_t refresh_interval_sec = 3600;

  std::string layout_json;

  blockforge::core::v1::BlockStatus status = blockforge::core::v1::BLOCK_STATUS_UNSPECIFIED;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace blockforge::db::model
