#include "grpc_error.hpp"

#include <string>

namespace discovery::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace discovery::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ConnectionClosed*>(&e) || dynamic_cast<const PeerUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) return;

  const auto message = std::string(action) + " failed: " + status.error_message();
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    throw discovery::util::NotFound(message);
  }
  throw discovery::util::PeerUnavailable(message);
}

} // namespace discovery::grpc
