#include "replication_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;
using discovery::observability::IntField;
using discovery::observability::StringField;

ReplicationServer::ReplicationServer(std::shared_ptr<discovery::registry::PeerAwareRegistry> registry) : registry_(std::move(registry)) {
}

::grpc::Status ReplicationServer::Replicate(::grpc::ServerContext*, const ReplicationRequest* req, ReplicationResponse*) {
  try {
    registry_->ApplyReplication(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReplicationServer::FetchSnapshot(::grpc::ServerContext*, const FetchSnapshotRequest* req, InstanceInfoList* resp) {
  try {
    for (auto& instance : registry_->Snapshot()) *resp->add_instances() = std::move(instance);
    DISCOVERY_LOG_INFO("Served registry snapshot",
                       {StringField("requester", req->requester_node_id()), IntField("instances", resp->instances_size())});
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace discovery::grpc
