#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/replication.pb.h"
#include "internal/health/health_status_provider.hpp"
#include "internal/lease/self_preservation.hpp"
#include "internal/peer/peer_node_set.hpp"
#include "internal/registry/eviction_task.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::registry {

struct RegistryOptions {
  // URL under which peers reach this node; replication requests carry it as origin.
  std::string               node_id;
  std::chrono::milliseconds default_lease_duration = std::chrono::seconds(90);
  std::chrono::milliseconds eviction_interval      = std::chrono::seconds(60);
};

/*
  Registry of a write node in a peer cluster.

  Lifecycle: SyncUp() pulls the peers' registries into the local store,
  OpenForTraffic() flips the node to serving. Until then subscribers get no
  BufferSentinel and nothing is evicted.

  Local mutations are applied to the store first and then handed to every
  peer's replication queue; callers never wait for peers. Mutations that
  arrive from a peer go through ApplyReplication() and are never replicated
  again.
*/
class PeerAwareRegistry {
 public:
  using InstanceInfo   = discovery::registry::v1::InstanceInfo;
  using InstanceStatus = discovery::registry::v1::InstanceStatus;

  PeerAwareRegistry(std::shared_ptr<store::RegistryStore> store, std::shared_ptr<lease::SelfPreservation> self_preservation,
                    std::shared_ptr<peer::PeerNodeSet> peers, RegistryOptions options);
  ~PeerAwareRegistry();

  PeerAwareRegistry(const PeerAwareRegistry&)            = delete;
  PeerAwareRegistry& operator=(const PeerAwareRegistry&) = delete;

  // Returns the number of entries absorbed into the local store.
  std::size_t SyncUp();

  // Throws InvalidState when already serving.
  void OpenForTraffic(InstanceInfo self_info, int64_t count);

  // Throws InvalidState for an instance without id or app name.
  InstanceInfo Register(InstanceInfo instance);

  // Throw NotFound when the instance is unknown or registered under another app.
  InstanceInfo Renew(const std::string& app_name, const std::string& instance_id);
  void         Cancel(const std::string& app_name, const std::string& instance_id);
  InstanceInfo UpdateStatus(const std::string& app_name, const std::string& instance_id, InstanceStatus status);

  void ApplyReplication(const discovery::registry::v1::ReplicationRequest& request);

  std::size_t Evict(util::TimePoint now = util::Now());

  store::InstanceStream     Query(const discovery::model::Interest& interest);
  std::vector<InstanceInfo> Snapshot() const;

  bool         IsServing() const;
  InstanceInfo SelfInfo() const;

  void Shutdown();

  std::shared_ptr<health::HealthStatusProvider> health() const {
    return health_;
  }

  std::shared_ptr<store::RegistryStore> store() const {
    return store_;
  }

 private:
  void ReplicateToPeers(discovery::registry::v1::ReplicationAction action, const InstanceInfo& instance);

  void ApplyRegister(const InstanceInfo& incoming);
  void ApplyHeartbeat(const InstanceInfo& incoming);
  void ApplyCancel(const InstanceInfo& incoming);
  void ApplyStatusUpdate(const InstanceInfo& incoming, InstanceStatus status);

  // Throws NotFound unless `instance_id` is registered under `app_name`.
  InstanceInfo RequireOwned(const std::string& app_name, const std::string& instance_id) const;

  const std::shared_ptr<store::RegistryStore>    store_;
  const std::shared_ptr<lease::SelfPreservation> self_preservation_;
  const std::shared_ptr<peer::PeerNodeSet>       peers_;
  const RegistryOptions                          options_;

  std::shared_ptr<health::HealthStatusProvider> health_;
  EvictionTask                                  eviction_;

  mutable std::mutex lifecycle_mutex_;
  InstanceInfo       self_info_;
  std::atomic<bool>  serving_{false};
  bool               shut_down_ = false;
};

} // namespace discovery::registry
