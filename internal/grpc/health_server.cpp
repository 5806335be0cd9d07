#include "health_server.hpp"

#include "grpc_error.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;

HealthServer::HealthServer(std::vector<std::shared_ptr<discovery::health::HealthStatusProvider>> providers)
    : providers_(std::move(providers)) {
}

::grpc::Status HealthServer::Check(::grpc::ServerContext*, const HealthCheckRequest*, HealthCheckResponse* resp) {
  try {
    for (const auto& provider : providers_) *resp->add_subsystems() = provider->Current();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace discovery::grpc
