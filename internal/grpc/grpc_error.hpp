#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace tierbridge::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  RetrievalRequired maps to UNAVAILABLE; the status details carry the
  estimated retrieval seconds.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace tierbridge::grpc
