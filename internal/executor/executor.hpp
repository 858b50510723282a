#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>

namespace blockforge::executor {

struct ExecutionResult {
  google::protobuf::Value output;
  int64_t                 duration_ms = 0;
};

/*
  Runs one version's backend code to completion.

  Returns the single JSON document the code printed, or throws
  util::ExecutionFailure. Implementations never retry.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  virtual ExecutionResult Execute(uint64_t block_id, uint32_t version, const std::string& backend_code) = 0;
};

} // namespace blockforge::executor
