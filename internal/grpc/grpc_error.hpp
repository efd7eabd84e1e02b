#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace pulse::grpc {

/*
  Converts exceptions into gRPC status codes.

  Domain errors (util::Error) map by kind; anything else is INTERNAL.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace pulse::grpc
