#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "blockforge/core/v1/block.pb.h"

namespace blockforge::db::model {

/*
  Audit row for one execution or heal attempt.

  Also the input of the healing throttle: failures are counted over a
  trailing window of created_at_ms.
*/

struct ExecutionLogRecord {
  uint64_t id       = 0; // assigned by InsertExecutionLog
  uint64_t block_id = 0;
  uint32_t version  = 0;

  blockforge::core::v1::ExecutionType execution_type = blockforge::core::v1::EXECUTION_TYPE_UNSPECIFIED;

  bool success = false;

  std::string            error_message; // empty when none
  std::optional<int64_t> duration_ms;

  int64_t created_at_ms = 0;
};

} // namespace blockforge::db::model
