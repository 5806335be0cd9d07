#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "discovery/registry/v1/instance.pb.h"
#include "internal/interest/interest_client.hpp"
#include "internal/peer/peer_node_set.hpp"
#include "internal/registry/peer_aware_registry.hpp"

namespace discovery::factory {

/*
  Write node: owns the peer-aware registry and its peer set.
  Everything here lives for the lifetime of the process.
*/
struct RegistryNode {
  std::shared_ptr<discovery::peer::PeerNodeSet>           peers;
  std::shared_ptr<discovery::registry::PeerAwareRegistry> registry;
  discovery::registry::v1::InstanceInfo                   self_info;
  std::vector<std::unique_ptr<::grpc::Service>>           grpc_services;
};

/*
  Read node: a local replica fed from an upstream write node.
*/
struct ReadNode {
  std::shared_ptr<discovery::store::RegistryStore>       store;
  std::shared_ptr<discovery::interest::InterestClient>  interest_client;
  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;
};

/*
  Composition roots. The only place that knows concrete store and
  transport types. Peer nodes are started; the registry is not yet open
  for traffic.
*/
RegistryNode BuildRegistryNode(const discovery::runtime::config::RuntimeConfig& config);

// Throws InvalidState when no upstream address is configured.
ReadNode BuildReadNode(const discovery::runtime::config::RuntimeConfig& config);

} // namespace discovery::factory
