#include "errors.hpp"

namespace blockforge::util {

const char* KindName(ExecutionFailure::Kind kind) {
  switch (kind) {
    case ExecutionFailure::Kind::kSpawn:
      return "spawn";
    case ExecutionFailure::Kind::kNonZeroExit:
      return "non_zero_exit";
    case ExecutionFailure::Kind::kTimeout:
      return "timeout";
    case ExecutionFailure::Kind::kInvalidOutput:
      return "invalid_output";
  }
  return "unknown";
}

} // namespace blockforge::util
