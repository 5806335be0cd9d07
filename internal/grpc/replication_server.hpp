#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/registry/peer_aware_registry.hpp"

namespace discovery::grpc {

/*
  Endpoint peers replicate into. Applied writes are never fanned out again.
*/
class ReplicationServer final : public discovery::registry::v1::ReplicationService::Service {
 public:
  explicit ReplicationServer(std::shared_ptr<discovery::registry::PeerAwareRegistry> registry);

  ::grpc::Status Replicate(::grpc::ServerContext*, const discovery::registry::v1::ReplicationRequest*,
                           discovery::registry::v1::ReplicationResponse*) override;

  ::grpc::Status FetchSnapshot(::grpc::ServerContext*, const discovery::registry::v1::FetchSnapshotRequest*,
                               discovery::registry::v1::InstanceInfoList*) override;

 private:
  std::shared_ptr<discovery::registry::PeerAwareRegistry> registry_;
};

} // namespace discovery::grpc
