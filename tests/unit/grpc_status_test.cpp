#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/health_server.hpp"
#include "internal/grpc/registration_server.hpp"
#include "internal/grpc/replication_server.hpp"
#include "internal/lease/self_preservation.hpp"
#include "internal/peer/peer_node_set.hpp"
#include "internal/registry/peer_aware_registry.hpp"
#include "internal/store/memory_registry_store.hpp"
#include "discovery/registry/v1.hpp"

namespace {

using namespace std::chrono_literals;
using namespace discovery::registry::v1;

class NoPeerClients final : public discovery::peer::PeerClientFactory {
 public:
  std::shared_ptr<discovery::peer::PeerClient> Create(const std::string&) override {
    return nullptr;
  }
};

std::shared_ptr<discovery::registry::PeerAwareRegistry> BuildRegistry() {
  auto policy = std::make_shared<discovery::lease::SelfPreservation>(discovery::lease::SelfPreservationOptions{});
  auto store  = std::make_shared<discovery::store::MemoryRegistryStore>(policy, 16);
  auto peers  = std::make_shared<discovery::peer::PeerNodeSet>(
      std::make_shared<NoPeerClients>(), [] { return std::vector<std::string>{}; }, "self:8761", discovery::peer::ReplicationOptions{}, 1h);
  peers->Start();

  discovery::registry::RegistryOptions options;
  options.node_id = "self:8761";
  return std::make_shared<discovery::registry::PeerAwareRegistry>(store, policy, peers, options);
}

void TestRenewUnknownInstanceReturnsNotFound() {
  auto                                registry = BuildRegistry();
  discovery::grpc::RegistrationServer server(registry);

  RenewRequest req;
  req.set_app_name("ORDERS");
  req.set_instance_id("missing");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.Renew(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRegisterWithoutIdReturnsFailedPrecondition() {
  auto                                registry = BuildRegistry();
  discovery::grpc::RegistrationServer server(registry);

  RegisterRequest req;
  req.mutable_instance()->set_app_name("ORDERS");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.Register(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestRegisteredInstanceIsInSnapshot() {
  auto                                registry = BuildRegistry();
  discovery::grpc::RegistrationServer registration(registry);
  discovery::grpc::ReplicationServer  replication(registry);

  RegisterRequest req;
  req.mutable_instance()->set_id("orders-1");
  req.mutable_instance()->set_app_name("ORDERS");
  google::protobuf::Empty empty;
  ::grpc::ServerContext   register_ctx;
  assert(registration.Register(&register_ctx, &req, &empty).ok());

  FetchSnapshotRequest snapshot_req;
  snapshot_req.set_requester_node_id("peer-1:8761");
  InstanceInfoList      snapshot;
  ::grpc::ServerContext snapshot_ctx;
  assert(replication.FetchSnapshot(&snapshot_ctx, &snapshot_req, &snapshot).ok());
  assert(snapshot.instances_size() == 1);
  assert(snapshot.instances(0).status() == INSTANCE_STATUS_UP);
}

void TestHealthCheckReportsSubsystems() {
  auto                          registry = BuildRegistry();
  discovery::grpc::HealthServer server(std::vector<std::shared_ptr<discovery::health::HealthStatusProvider>>{registry->health()});

  HealthCheckRequest    req;
  HealthCheckResponse   resp;
  ::grpc::ServerContext grpc_ctx;
  assert(server.Check(&grpc_ctx, &req, &resp).ok());
  assert(resp.subsystems_size() == 1);
  assert(resp.subsystems(0).status() == INSTANCE_STATUS_STARTING);
  assert(resp.subsystems(0).subsystem().name() == "PeerAwareRegistry");
}

void TestErrorMappingBothWays() {
  using discovery::grpc::ToStatus;

  assert(ToStatus(discovery::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(discovery::util::PeerUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(discovery::util::ConnectionClosed("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  discovery::grpc::ThrowIfError(::grpc::Status::OK, "noop");

  bool not_found = false;
  try {
    discovery::grpc::ThrowIfError({::grpc::StatusCode::NOT_FOUND, "gone"}, "Replicate");
  } catch (const discovery::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  bool unavailable = false;
  try {
    discovery::grpc::ThrowIfError({::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"}, "Replicate");
  } catch (const discovery::util::PeerUnavailable&) {
    unavailable = true;
  }
  assert(unavailable && "a timeout counts as a peer failure");
}

} // namespace

int main() {
  TestRenewUnknownInstanceReturnsNotFound();
  TestRegisterWithoutIdReturnsFailedPrecondition();
  TestRegisteredInstanceIsInSnapshot();
  TestHealthCheckReportsSubsystems();
  TestErrorMappingBothWays();

  std::cout << "discovery_unit_grpc_status: pass\n";
  return 0;
}
