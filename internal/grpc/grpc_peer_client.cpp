#include "grpc_peer_client.hpp"

#include "grpc_error.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;

GrpcPeerClient::GrpcPeerClient(std::string address, std::string self_node_id, std::chrono::milliseconds timeout)
    : address_(std::move(address)),
      self_node_id_(std::move(self_node_id)),
      timeout_(timeout),
      stub_(ReplicationService::NewStub(::grpc::CreateChannel(address_, ::grpc::InsecureChannelCredentials()))) {
}

void GrpcPeerClient::SetDeadline(::grpc::ClientContext* ctx) const {
  ctx->set_deadline(std::chrono::system_clock::now() + timeout_);
}

std::vector<InstanceInfo> GrpcPeerClient::FetchSnapshot() {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx);

  FetchSnapshotRequest req;
  req.set_requester_node_id(self_node_id_);
  InstanceInfoList resp;

  ThrowIfError(stub_->FetchSnapshot(&ctx, req, &resp), "FetchSnapshot from " + address_);
  return {resp.instances().begin(), resp.instances().end()};
}

void GrpcPeerClient::Replicate(const ReplicationRequest& request) {
  ::grpc::ClientContext ctx;
  SetDeadline(&ctx);

  ReplicationResponse resp;
  ThrowIfError(stub_->Replicate(&ctx, request, &resp), "Replicate to " + address_);
}

GrpcPeerClientFactory::GrpcPeerClientFactory(std::string self_node_id, std::chrono::milliseconds timeout)
    : self_node_id_(std::move(self_node_id)), timeout_(timeout) {
}

std::shared_ptr<discovery::peer::PeerClient> GrpcPeerClientFactory::Create(const std::string& address) {
  return std::make_shared<GrpcPeerClient>(address, self_node_id_, timeout_);
}

} // namespace discovery::grpc
