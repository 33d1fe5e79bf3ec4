#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace tablebook::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Retryable failures (lock busy, transient storage errors) map to
  UNAVAILABLE so clients know to try again.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace tablebook::grpc
