#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace loadplan::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace loadplan::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace loadplan::grpc
