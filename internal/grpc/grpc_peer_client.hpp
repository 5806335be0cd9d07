#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/peer/peer_client.hpp"

namespace discovery::grpc {

class GrpcPeerClient final : public discovery::peer::PeerClient {
 public:
  GrpcPeerClient(std::string address, std::string self_node_id, std::chrono::milliseconds timeout);

  std::vector<discovery::registry::v1::InstanceInfo> FetchSnapshot() override;

  void Replicate(const discovery::registry::v1::ReplicationRequest& request) override;

  const std::string& address() const override {
    return address_;
  }

 private:
  void SetDeadline(::grpc::ClientContext* ctx) const;

  const std::string               address_;
  const std::string               self_node_id_;
  const std::chrono::milliseconds timeout_;

  std::unique_ptr<discovery::registry::v1::ReplicationService::Stub> stub_;
};

class GrpcPeerClientFactory final : public discovery::peer::PeerClientFactory {
 public:
  GrpcPeerClientFactory(std::string self_node_id, std::chrono::milliseconds timeout);

  std::shared_ptr<discovery::peer::PeerClient> Create(const std::string& address) override;

 private:
  const std::string               self_node_id_;
  const std::chrono::milliseconds timeout_;
};

} // namespace discovery::grpc
