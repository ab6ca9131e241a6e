#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>
#include <string_view>

#include "internal/util/errors.hpp"

namespace vkyc::grpc {

/*
  Maps the session engine's exception taxonomy onto gRPC status codes.

  The status carries the exception message and, in error_details, a stable
  snake_case kind ("link_expired", "verification_busy", ...) so a client can
  tell apart errors that share a code such as FAILED_PRECONDITION.
*/

std::string_view ErrorKind(const std::exception& e);

::grpc::Status ToStatus(const std::exception& e);

} // namespace vkyc::grpc
