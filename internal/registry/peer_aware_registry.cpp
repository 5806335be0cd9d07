#include "peer_aware_registry.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <unordered_map>

#include "internal/lease/lease.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace discovery::registry {

using namespace discovery::registry::v1;
using discovery::observability::IntField;
using discovery::observability::StringField;
using discovery::store::PutOutcome;

namespace {

InstanceStatus DefaultStatus(InstanceStatus status) {
  return status == INSTANCE_STATUS_UNKNOWN ? INSTANCE_STATUS_UP : status;
}

} // namespace

PeerAwareRegistry::PeerAwareRegistry(std::shared_ptr<store::RegistryStore> store, std::shared_ptr<lease::SelfPreservation> self_preservation,
                                     std::shared_ptr<peer::PeerNodeSet> peers, RegistryOptions options)
    : store_(std::move(store)),
      self_preservation_(std::move(self_preservation)),
      peers_(std::move(peers)),
      options_(std::move(options)),
      health_(std::make_shared<health::HealthStatusProvider>(
          INSTANCE_STATUS_STARTING, health::MakeDescriptor("PeerAwareRegistry", "Peer-aware registry",
                                                           "Write-side registry replicating to peer nodes"))),
      eviction_([this](util::TimePoint now) { return Evict(now); }, options_.eviction_interval) {
}

PeerAwareRegistry::~PeerAwareRegistry() {
  Shutdown();
}

std::size_t PeerAwareRegistry::SyncUp() {
  const auto peers = peers_->Peers();
  if (peers->empty()) {
    DISCOVERY_LOG_INFO("No peers to sync from; starting with an empty registry");
    return 0;
  }

  // merge every snapshot first so the result does not depend on peer order
  std::unordered_map<std::string, InstanceInfo> merged;
  std::size_t                                   responding = 0;

  for (const auto& node : *peers) {
    try {
      auto instances = node->FetchSnapshot();
      ++responding;
      for (auto& instance : instances) {
        auto it = merged.find(instance.id());
        if (it == merged.end()) {
          merged.emplace(instance.id(), std::move(instance));
        } else if (lease::IsNewer(instance, it->second)) {
          it->second = std::move(instance);
        }
      }
      DISCOVERY_LOG_INFO("Fetched peer registry", {StringField("peer", node->address()), IntField("instances", static_cast<int64_t>(instances.size()))});
    } catch (const std::exception& e) {
      DISCOVERY_LOG_WARN("Peer registry fetch failed", {StringField("peer", node->address()), StringField("error", e.what())});
    }
  }

  if (responding == 0) {
    DISCOVERY_LOG_WARN("No peer answered during sync; starting with an empty registry",
                       {IntField("peers", static_cast<int64_t>(peers->size()))});
    return 0;
  }

  std::size_t absorbed = 0;
  for (const auto& [id, candidate] : merged) {
    const auto outcome = store_->PutIf(candidate, [&candidate](const InstanceInfo* existing) {
      return existing == nullptr || !lease::IsNewer(*existing, candidate);
    });
    if (outcome != PutOutcome::kRejected) ++absorbed;
  }

  DISCOVERY_LOG_INFO("Registry sync completed",
                     {IntField("peers", static_cast<int64_t>(peers->size())), IntField("responding", static_cast<int64_t>(responding)),
                      IntField("absorbed", static_cast<int64_t>(absorbed))});
  return absorbed;
}

void PeerAwareRegistry::OpenForTraffic(InstanceInfo self_info, int64_t count) {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (shut_down_) throw util::InvalidState("registry has shut down");
    if (serving_) throw util::InvalidState("registry is already open for traffic");

    self_info.set_status(INSTANCE_STATUS_UP);
    *self_info.mutable_last_updated_timestamp() = util::ToProto(util::Now());
    self_info_                                  = std::move(self_info);

    self_preservation_->SetExpectedClients(count);
    serving_ = true;
  }

  self_preservation_->Activate();
  store_->MarkPrimed();
  eviction_.Start();
  health_->MoveHealthTo(INSTANCE_STATUS_UP);

  DISCOVERY_LOG_INFO("Registry open for traffic",
                     {IntField("expected_clients", count), IntField("renewal_threshold", self_preservation_->RenewalThreshold()),
                      IntField("instances", static_cast<int64_t>(store_->Size()))});
}

InstanceInfo PeerAwareRegistry::Register(InstanceInfo instance) {
  if (instance.id().empty()) throw util::InvalidState("instance id is required");
  if (instance.app_name().empty()) throw util::InvalidState("app name is required");

  const auto now = util::Now();
  lease::Start(&instance, now, options_.default_lease_duration);
  instance.set_status(DefaultStatus(instance.status()));
  *instance.mutable_last_updated_timestamp() = util::ToProto(now);

  if (store_->Put(instance) == PutOutcome::kAdded) self_preservation_->AddExpectedClients(1);

  ReplicateToPeers(REPLICATION_ACTION_REGISTER, instance);
  return instance;
}

InstanceInfo PeerAwareRegistry::Renew(const std::string& app_name, const std::string& instance_id) {
  RequireOwned(app_name, instance_id);

  const auto now     = util::Now();
  auto       renewed = store_->Update(instance_id, [&](InstanceInfo* instance) {
    if (instance->app_name() != app_name) return false;
    lease::Renew(instance, now);
    return true;
  });
  if (!renewed) throw util::NotFound("instance not registered: " + instance_id);

  self_preservation_->RecordRenewal(now);
  ReplicateToPeers(REPLICATION_ACTION_HEARTBEAT, *renewed);
  return *renewed;
}

void PeerAwareRegistry::Cancel(const std::string& app_name, const std::string& instance_id) {
  RequireOwned(app_name, instance_id);

  auto removed = store_->RemoveIf(instance_id, [&](const InstanceInfo& existing) { return existing.app_name() == app_name; });
  if (!removed) throw util::NotFound("instance not registered: " + instance_id);

  self_preservation_->AddExpectedClients(-1);
  ReplicateToPeers(REPLICATION_ACTION_CANCEL, *removed);
}

InstanceInfo PeerAwareRegistry::UpdateStatus(const std::string& app_name, const std::string& instance_id, InstanceStatus status) {
  if (status == INSTANCE_STATUS_UNKNOWN) throw util::InvalidState("status is required");
  RequireOwned(app_name, instance_id);

  const auto now     = util::Now();
  auto       updated = store_->Update(instance_id, [&](InstanceInfo* instance) {
    if (instance->app_name() != app_name) return false;
    instance->set_status(status);
    *instance->mutable_last_updated_timestamp() = util::ToProto(now);
    return true;
  });
  if (!updated) throw util::NotFound("instance not registered: " + instance_id);

  ReplicateToPeers(REPLICATION_ACTION_STATUS_UPDATE, *updated);
  return *updated;
}

void PeerAwareRegistry::ApplyReplication(const ReplicationRequest& request) {
  const auto& incoming = request.instance();
  if (incoming.id().empty()) throw util::InvalidState("replicated instance has no id");

  switch (request.action()) {
    case REPLICATION_ACTION_REGISTER:
      ApplyRegister(incoming);
      return;
    case REPLICATION_ACTION_HEARTBEAT:
      ApplyHeartbeat(incoming);
      return;
    case REPLICATION_ACTION_CANCEL:
      ApplyCancel(incoming);
      return;
    case REPLICATION_ACTION_STATUS_UPDATE:
      ApplyStatusUpdate(incoming, request.status());
      return;
    default:
      throw util::InvalidState("unsupported replication action: " + ReplicationAction_Name(request.action()));
  }
}

void PeerAwareRegistry::ApplyRegister(const InstanceInfo& incoming) {
  const auto outcome = store_->PutIf(incoming, [&incoming](const InstanceInfo* existing) {
    return existing == nullptr || !lease::IsNewer(*existing, incoming);
  });
  if (outcome == PutOutcome::kAdded) self_preservation_->AddExpectedClients(1);
}

void PeerAwareRegistry::ApplyHeartbeat(const InstanceInfo& incoming) {
  const auto local = store_->Get(incoming.id());
  if (!local) throw util::NotFound("instance not registered: " + incoming.id());

  // the sender holds a newer version than ours: it should re-register instead
  if (util::FromProto(incoming.last_updated_timestamp()) > util::FromProto(local->last_updated_timestamp())) {
    throw util::NotFound("instance out of date: " + incoming.id());
  }

  const auto incoming_renewal = lease::LastRenewal(incoming);
  auto       renewed          = store_->Update(incoming.id(), [&](InstanceInfo* instance) {
    if (incoming_renewal <= lease::LastRenewal(*instance)) return false;
    lease::Renew(instance, incoming_renewal);
    return true;
  });
  if (renewed) self_preservation_->RecordRenewal();
}

void PeerAwareRegistry::ApplyCancel(const InstanceInfo& incoming) {
  if (!store_->Remove(incoming.id())) throw util::NotFound("instance not registered: " + incoming.id());
  self_preservation_->AddExpectedClients(-1);
}

void PeerAwareRegistry::ApplyStatusUpdate(const InstanceInfo& incoming, InstanceStatus status) {
  if (status == INSTANCE_STATUS_UNKNOWN) status = incoming.status();
  const auto stamp = util::FromProto(incoming.last_updated_timestamp());

  auto updated = store_->Update(incoming.id(), [&](InstanceInfo* instance) {
    if (stamp < util::FromProto(instance->last_updated_timestamp())) return false;
    instance->set_status(status);
    *instance->mutable_last_updated_timestamp() = incoming.last_updated_timestamp();
    return true;
  });
  if (!updated && !store_->Get(incoming.id())) throw util::NotFound("instance not registered: " + incoming.id());
}

std::size_t PeerAwareRegistry::Evict(util::TimePoint now) {
  if (!serving_) return 0;
  if (!store_->IsEvictionAllowed()) {
    DISCOVERY_LOG_INFO("Lease expiration disabled by self-preservation",
                       {IntField("renewals_last_minute", self_preservation_->RenewalsLastMinute(now)),
                        IntField("renewal_threshold", self_preservation_->RenewalThreshold())});
    return 0;
  }

  std::vector<InstanceInfo> expired;
  for (auto& instance : store_->Snapshot()) {
    if (lease::IsExpired(instance, now)) expired.push_back(std::move(instance));
  }
  if (expired.empty()) return 0;

  // evicting more than this at once would bypass self-preservation
  const auto size  = store_->Size();
  const auto kept  = static_cast<std::size_t>(std::floor(static_cast<double>(size) * self_preservation_->renewal_percent_threshold()));
  const auto limit = size > kept ? size - kept : 0;

  if (expired.size() > limit) {
    DISCOVERY_LOG_WARN("Expired leases exceed eviction limit; evicting a random subset",
                       {IntField("expired", static_cast<int64_t>(expired.size())), IntField("limit", static_cast<int64_t>(limit))});
    std::mt19937 rng{std::random_device{}()};
    std::shuffle(expired.begin(), expired.end(), rng);
    expired.resize(limit);
  }

  std::size_t evicted = 0;
  for (const auto& candidate : expired) {
    auto removed = store_->RemoveIf(candidate.id(), [now](const InstanceInfo& existing) { return lease::IsExpired(existing, now); });
    if (!removed) continue;

    ++evicted;
    self_preservation_->AddExpectedClients(-1);
    DISCOVERY_LOG_INFO("Evicted expired lease", {StringField("app", removed->app_name()), StringField("instance", removed->id())});
    lease::MarkEvicted(&*removed, now);
    ReplicateToPeers(REPLICATION_ACTION_CANCEL, *removed);
  }
  return evicted;
}

store::InstanceStream PeerAwareRegistry::Query(const discovery::model::Interest& interest) {
  return store_->Query(interest);
}

std::vector<InstanceInfo> PeerAwareRegistry::Snapshot() const {
  return store_->Snapshot();
}

bool PeerAwareRegistry::IsServing() const {
  return serving_;
}

InstanceInfo PeerAwareRegistry::SelfInfo() const {
  std::lock_guard lock(lifecycle_mutex_);
  return self_info_;
}

void PeerAwareRegistry::Shutdown() {
  {
    std::lock_guard lock(lifecycle_mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    serving_   = false;
    self_info_.set_status(INSTANCE_STATUS_DOWN);
  }

  eviction_.Stop();
  peers_->Stop();
  health_->MoveHealthTo(INSTANCE_STATUS_DOWN);

  DISCOVERY_LOG_INFO("Registry shut down");
}

void PeerAwareRegistry::ReplicateToPeers(ReplicationAction action, const InstanceInfo& instance) {
  ReplicationRequest request;
  request.set_action(action);
  *request.mutable_instance() = instance;
  request.set_status(instance.status());
  request.set_origin_node_id(options_.node_id);

  const auto peers = peers_->Peers();
  for (const auto& node : *peers) {
    if (node->address() == request.origin_node_id()) continue;
    node->Enqueue(request);
  }
}

InstanceInfo PeerAwareRegistry::RequireOwned(const std::string& app_name, const std::string& instance_id) const {
  auto existing = store_->Get(instance_id);
  if (!existing || existing->app_name() != app_name) {
    throw util::NotFound("instance not registered: " + app_name + "/" + instance_id);
  }
  return *existing;
}

} // namespace discovery::registry
