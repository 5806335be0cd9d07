#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/health/health_status_provider.hpp"

namespace discovery::grpc {

class HealthServer final : public discovery::registry::v1::HealthService::Service {
 public:
  explicit HealthServer(std::vector<std::shared_ptr<discovery::health::HealthStatusProvider>> providers);

  ::grpc::Status Check(::grpc::ServerContext*, const discovery::registry::v1::HealthCheckRequest*,
                       discovery::registry::v1::HealthCheckResponse*) override;

 private:
  std::vector<std::shared_ptr<discovery::health::HealthStatusProvider>> providers_;
};

} // namespace discovery::grpc
