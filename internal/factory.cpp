#include "factory.hpp"

#include <string>

#include "internal/grpc/grpc_interest_channel.hpp"
#include "internal/grpc/grpc_peer_client.hpp"
#include "internal/grpc/health_server.hpp"
#include "internal/grpc/interest_server.hpp"
#include "internal/grpc/registration_server.hpp"
#include "internal/grpc/replication_server.hpp"
#include "internal/lease/self_preservation.hpp"
#include "internal/store/memory_registry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace discovery::factory {

using discovery::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kRegistryAppName = "DISCOVERY-REGISTRY";

discovery::registry::v1::InstanceInfo SelfInstance(const RuntimeConfig& config) {
  const auto& node_id = config.server().node_id();

  discovery::registry::v1::InstanceInfo self;
  self.set_id(node_id);
  self.set_app_name(kRegistryAppName);
  self.set_vip_address(kRegistryAppName);
  self.set_status(discovery::registry::v1::INSTANCE_STATUS_STARTING);

  const auto colon = node_id.rfind(':');
  self.set_hostname(node_id.substr(0, colon));
  if (colon != std::string::npos) self.set_port(static_cast<uint32_t>(std::stoul(node_id.substr(colon + 1))));
  return self;
}

lease::SelfPreservationOptions SelfPreservationOptionsFrom(const RuntimeConfig& config) {
  const auto& registry = config.registry();

  lease::SelfPreservationOptions options;
  options.enabled                   = registry.self_preservation_enabled();
  options.renewal_percent_threshold = registry.renewal_percent_threshold();
  options.expected_renewal_interval = util::FromProto(registry.expected_renewal_interval());
  return options;
}

peer::ReplicationOptions ReplicationOptionsFrom(const RuntimeConfig& config) {
  const auto& replication = config.peers().replication();

  peer::ReplicationOptions options;
  options.max_retries    = replication.max_retries();
  options.backoff        = util::FromProto(replication.backoff());
  options.queue_capacity = replication.queue_capacity();
  return options;
}

} // namespace

/*
    Build the write node dependency graph
*/
RegistryNode BuildRegistryNode(const RuntimeConfig& config) {
  RegistryNode node;

  const auto& node_id = config.server().node_id();

  // ------------------------------------------------------------------
  // Store and lease policy
  // ------------------------------------------------------------------
  auto self_preservation = std::make_shared<lease::SelfPreservation>(SelfPreservationOptionsFrom(config));
  auto store             = std::make_shared<store::MemoryRegistryStore>(self_preservation, config.registry().subscription_buffer());

  // ------------------------------------------------------------------
  // Peers
  // ------------------------------------------------------------------
  const std::vector<std::string> urls(config.peers().urls().begin(), config.peers().urls().end());
  auto client_factory = std::make_shared<grpc::GrpcPeerClientFactory>(node_id, util::FromProto(config.peers().replication().timeout()));

  node.peers = std::make_shared<peer::PeerNodeSet>(
      client_factory, [urls] { return urls; }, node_id, ReplicationOptionsFrom(config), util::FromProto(config.peers().reconcile_interval()));
  node.peers->Start();

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  registry::RegistryOptions options;
  options.node_id                = node_id;
  options.default_lease_duration = util::FromProto(config.registry().default_lease_duration());
  options.eviction_interval      = util::FromProto(config.registry().eviction_interval());

  node.registry  = std::make_shared<registry::PeerAwareRegistry>(store, self_preservation, node.peers, options);
  node.self_info = SelfInstance(config);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto peer_aware = node.registry;
  node.grpc_services.push_back(std::make_unique<grpc::RegistrationServer>(peer_aware));
  node.grpc_services.push_back(std::make_unique<grpc::ReplicationServer>(peer_aware));
  node.grpc_services.push_back(
      std::make_unique<grpc::InterestServer>([peer_aware](const model::Interest& interest) { return peer_aware->Query(interest); }));
  node.grpc_services.push_back(std::make_unique<grpc::HealthServer>(
      std::vector<std::shared_ptr<health::HealthStatusProvider>>{peer_aware->health()}));

  return node;
}

/*
    Build the read node dependency graph
*/
ReadNode BuildReadNode(const RuntimeConfig& config) {
  const auto& upstream = config.interest_client().upstream_address();
  if (upstream.empty()) throw util::InvalidState("interest_client.upstream_address is required for a read node");

  ReadNode node;

  // no self-preservation: a replica never evicts on its own
  node.store = std::make_shared<store::MemoryRegistryStore>(nullptr, config.registry().subscription_buffer());

  auto channel_factory = std::make_shared<grpc::GrpcInterestChannelFactory>(upstream, node.store);
  node.interest_client =
      std::make_shared<interest::InterestClient>(node.store, channel_factory, util::FromProto(config.interest_client().retry_wait()));

  auto client = node.interest_client;
  node.grpc_services.push_back(
      std::make_unique<grpc::InterestServer>([client](const model::Interest& interest) { return client->ForInterest(interest); }));
  node.grpc_services.push_back(std::make_unique<grpc::HealthServer>(
      std::vector<std::shared_ptr<health::HealthStatusProvider>>{client->health()}));

  return node;
}

} // namespace discovery::factory
