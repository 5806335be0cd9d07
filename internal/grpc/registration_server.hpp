#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/registry/peer_aware_registry.hpp"

namespace discovery::grpc {

class RegistrationServer final : public discovery::registry::v1::RegistrationService::Service {
 public:
  explicit RegistrationServer(std::shared_ptr<discovery::registry::PeerAwareRegistry> registry);

  ::grpc::Status Register(::grpc::ServerContext*, const discovery::registry::v1::RegisterRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Renew(::grpc::ServerContext*, const discovery::registry::v1::RenewRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const discovery::registry::v1::CancelRequest*, google::protobuf::Empty*) override;

  ::grpc::Status UpdateStatus(::grpc::ServerContext*, const discovery::registry::v1::UpdateStatusRequest*,
                              google::protobuf::Empty*) override;

 private:
  std::shared_ptr<discovery::registry::PeerAwareRegistry> registry_;
};

} // namespace discovery::grpc
