#pragma once

#include <cstdint>
#include <string>

namespace blockforge::db::model {

// Immutable cached execution output.
struct BlockDataRecord {
  uint64_t id       = 0; // assigned by InsertBlockData
  uint64_t block_id = 0;

  std::string data_json;

  int64_t fetched_at_ms = 0;
  int64_t expires_at_ms = 0;
};

} // namespace blockforge::db::model
