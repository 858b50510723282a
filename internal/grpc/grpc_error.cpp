#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace blockforge::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace blockforge::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const HealPrecondition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const OracleFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (const auto* failure = dynamic_cast<const ExecutionFailure*>(&e)) {
    if (failure->kind() == ExecutionFailure::Kind::kTimeout) {
      return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
    }
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace blockforge::grpc
