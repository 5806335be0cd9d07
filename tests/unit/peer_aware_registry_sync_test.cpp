#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/lease/self_preservation.hpp"
#include "internal/peer/peer_node_set.hpp"
#include "internal/registry/peer_aware_registry.hpp"
#include "internal/store/memory_registry_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace discovery::registry::v1;
using discovery::peer::PeerClient;
using discovery::peer::PeerClientFactory;
using discovery::registry::PeerAwareRegistry;

class SnapshotPeer final : public PeerClient {
 public:
  SnapshotPeer(std::string address, std::vector<InstanceInfo> snapshot, bool reachable)
      : address_(std::move(address)), snapshot_(std::move(snapshot)), reachable_(reachable) {
  }

  std::vector<InstanceInfo> FetchSnapshot() override {
    if (!reachable_) throw discovery::util::PeerUnavailable(address_ + " unreachable");
    return snapshot_;
  }

  void Replicate(const ReplicationRequest&) override {
  }

  const std::string& address() const override {
    return address_;
  }

 private:
  const std::string               address_;
  const std::vector<InstanceInfo> snapshot_;
  const bool                      reachable_;
};

class MapPeerFactory final : public PeerClientFactory {
 public:
  void Add(std::shared_ptr<PeerClient> peer) {
    peers_[peer->address()] = std::move(peer);
  }

  std::shared_ptr<PeerClient> Create(const std::string& address) override {
    return peers_.at(address);
  }

  std::vector<std::string> Urls() const {
    std::vector<std::string> urls;
    for (const auto& [url, peer] : peers_) urls.push_back(url);
    return urls;
  }

 private:
  std::map<std::string, std::shared_ptr<PeerClient>> peers_;
};

InstanceInfo MakeInstance(const std::string& id, int64_t renewed_at_seconds, const std::string& hostname) {
  InstanceInfo instance;
  instance.set_id(id);
  instance.set_app_name("APP");
  instance.set_hostname(hostname);
  instance.set_status(INSTANCE_STATUS_UP);
  instance.mutable_lease()->mutable_last_renewal_timestamp()->set_seconds(renewed_at_seconds);
  instance.mutable_lease()->mutable_duration()->set_seconds(90);
  instance.mutable_last_updated_timestamp()->set_seconds(renewed_at_seconds);
  return instance;
}

struct Fixture {
  std::shared_ptr<discovery::lease::SelfPreservation>    policy;
  std::shared_ptr<discovery::store::MemoryRegistryStore> store;
  std::shared_ptr<discovery::peer::PeerNodeSet>          peers;
  std::unique_ptr<PeerAwareRegistry>                     registry;
};

Fixture MakeFixture(const std::shared_ptr<MapPeerFactory>& factory) {
  Fixture fixture;
  fixture.policy = std::make_shared<discovery::lease::SelfPreservation>(discovery::lease::SelfPreservationOptions{});
  fixture.store  = std::make_shared<discovery::store::MemoryRegistryStore>(fixture.policy, 64);

  const auto urls = factory->Urls();
  fixture.peers   = std::make_shared<discovery::peer::PeerNodeSet>(
      factory, [urls] { return urls; }, "self:8761", discovery::peer::ReplicationOptions{}, 1h);
  fixture.peers->Start();

  discovery::registry::RegistryOptions options;
  options.node_id  = "self:8761";
  fixture.registry = std::make_unique<PeerAwareRegistry>(fixture.store, fixture.policy, fixture.peers, options);
  return fixture;
}

InstanceInfo SelfInfo() {
  InstanceInfo self;
  self.set_id("self:8761");
  self.set_app_name("DISCOVERY-REGISTRY");
  self.set_status(INSTANCE_STATUS_STARTING);
  return self;
}

void TestSyncMergesPeersLastWriterWins() {
  std::vector<InstanceInfo> from_a;
  for (int i = 0; i < 10; ++i) from_a.push_back(MakeInstance("i-" + std::to_string(i), 2000, "peer-a"));

  // five entries shared with A but older, three only B knows
  std::vector<InstanceInfo> from_b;
  for (int i = 0; i < 5; ++i) from_b.push_back(MakeInstance("i-" + std::to_string(i), 1000, "peer-b"));
  for (int i = 0; i < 3; ++i) from_b.push_back(MakeInstance("b-" + std::to_string(i), 1000, "peer-b"));

  auto factory = std::make_shared<MapPeerFactory>();
  factory->Add(std::make_shared<SnapshotPeer>("peer-a:8761", from_a, true));
  factory->Add(std::make_shared<SnapshotPeer>("peer-b:8761", from_b, true));
  factory->Add(std::make_shared<SnapshotPeer>("peer-c:8761", std::vector<InstanceInfo>{}, false));

  auto fixture = MakeFixture(factory);
  assert(fixture.peers->Peers()->size() == 3);

  const auto absorbed = fixture.registry->SyncUp();
  assert(absorbed == 13);
  assert(fixture.store->Size() == 13);
  for (int i = 0; i < 5; ++i) {
    assert(fixture.store->Get("i-" + std::to_string(i))->hostname() == "peer-a");
  }
  assert(fixture.store->Get("b-2")->hostname() == "peer-b");

  fixture.registry->OpenForTraffic(SelfInfo(), static_cast<int64_t>(absorbed));
  assert(fixture.registry->IsServing());
  assert(fixture.policy->ExpectedClients() == 13);
  assert(fixture.registry->SelfInfo().status() == INSTANCE_STATUS_UP);
  assert(fixture.registry->health()->Current().status() == INSTANCE_STATUS_UP);

  fixture.registry->Shutdown();
  assert(fixture.registry->health()->Current().status() == INSTANCE_STATUS_DOWN);
}

void TestSyncKeepsNewerLocalEntries() {
  auto factory = std::make_shared<MapPeerFactory>();
  factory->Add(std::make_shared<SnapshotPeer>("peer-a:8761", std::vector<InstanceInfo>{MakeInstance("i-0", 1000, "peer-a")}, true));

  auto fixture = MakeFixture(factory);
  fixture.store->Put(MakeInstance("i-0", 3000, "local"));

  assert(fixture.registry->SyncUp() == 0);
  assert(fixture.store->Get("i-0")->hostname() == "local");
  fixture.registry->Shutdown();
}

void TestSyncWithoutPeersStillServes() {
  auto fixture = MakeFixture(std::make_shared<MapPeerFactory>());
  assert(fixture.peers->Peers()->empty());

  auto subscription = fixture.registry->Query(discovery::model::interests::ForFullRegistry()).Subscribe();

  assert(fixture.registry->SyncUp() == 0);
  fixture.registry->OpenForTraffic(SelfInfo(), 0);
  assert(fixture.registry->IsServing());
  assert(fixture.registry->health()->Current().status() == INSTANCE_STATUS_UP);

  // opening for traffic completes the (empty) initial batch of subscribers
  auto first = subscription.Next();
  assert(first && first->IsBufferSentinel());

  bool threw = false;
  try {
    fixture.registry->OpenForTraffic(SelfInfo(), 0);
  } catch (const discovery::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "opening twice is a state error");

  fixture.registry->Shutdown();
}

void TestAllPeersFailingYieldsEmptyRegistry() {
  auto factory = std::make_shared<MapPeerFactory>();
  factory->Add(std::make_shared<SnapshotPeer>("peer-a:8761", std::vector<InstanceInfo>{}, false));
  factory->Add(std::make_shared<SnapshotPeer>("peer-b:8761", std::vector<InstanceInfo>{}, false));

  auto fixture = MakeFixture(factory);
  assert(fixture.registry->SyncUp() == 0);
  assert(fixture.store->Size() == 0);
  fixture.registry->Shutdown();
}

} // namespace

int main() {
  TestSyncMergesPeersLastWriterWins();
  TestSyncKeepsNewerLocalEntries();
  TestSyncWithoutPeersStillServes();
  TestAllPeersFailingYieldsEmptyRegistry();

  std::cout << "discovery_unit_peer_aware_registry_sync: pass\n";
  return 0;
}
