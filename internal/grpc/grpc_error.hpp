#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace discovery::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Client side of the same mapping: NOT_FOUND becomes NotFound, any other
  failure (deadline included) PeerUnavailable. No-op for OK.
*/
void ThrowIfError(const ::grpc::Status& status, std::string_view action);

} // namespace discovery::grpc
