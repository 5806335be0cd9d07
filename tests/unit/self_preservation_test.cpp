#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/lease/lease.hpp"
#include "internal/lease/measured_rate.hpp"
#include "internal/lease/self_preservation.hpp"
#include "internal/peer/peer_node_set.hpp"
#include "internal/registry/peer_aware_registry.hpp"
#include "internal/store/memory_registry_store.hpp"

namespace {

using namespace std::chrono_literals;
using namespace discovery::registry::v1;
using discovery::lease::MeasuredRate;
using discovery::lease::SelfPreservation;
using discovery::lease::SelfPreservationOptions;

class NoPeerClients final : public discovery::peer::PeerClientFactory {
 public:
  std::shared_ptr<discovery::peer::PeerClient> Create(const std::string&) override {
    return nullptr;
  }
};

void TestMeasuredRateReportsPreviousInterval() {
  const auto   t0 = discovery::util::Now();
  MeasuredRate rate(1min, t0);

  rate.Increment(t0 + 1s);
  rate.Increment(t0 + 2s);
  assert(rate.LastCount(t0 + 30s) == 0);
  assert(rate.LastCount(t0 + 61s) == 2);

  // a silent interval in between resets the count
  assert(rate.LastCount(t0 + 181s) == 0);
}

void TestThresholdFollowsExpectedClients() {
  SelfPreservationOptions options;
  options.renewal_percent_threshold = 0.85;
  options.expected_renewal_interval = 30s;

  SelfPreservation policy(options);
  policy.SetExpectedClients(10);
  // 10 clients * 2 renewals per minute * 0.85
  assert(policy.RenewalThreshold() == 17);

  policy.AddExpectedClients(-20);
  assert(policy.ExpectedClients() == 0);
  assert(policy.RenewalThreshold() == 0);
}

void TestEvictionNeedsRenewalsAboveThreshold() {
  const auto              t0 = discovery::util::Now();
  SelfPreservationOptions options;
  SelfPreservation        policy(options, t0);
  policy.SetExpectedClients(10);

  for (int i = 0; i < 18; ++i) policy.RecordRenewal(t0 + 1s);
  assert(!policy.IsEvictionAllowed(t0 + 61s) && "nothing is evicted before activation");

  policy.Activate();
  assert(policy.IsEvictionAllowed(t0 + 61s));

  for (int i = 0; i < 17; ++i) policy.RecordRenewal(t0 + 62s);
  assert(!policy.IsEvictionAllowed(t0 + 121s));
}

void TestZeroExpectedClientsNeverEvicts() {
  const auto       t0 = discovery::util::Now();
  SelfPreservation policy(SelfPreservationOptions{}, t0);
  policy.Activate();
  policy.RecordRenewal(t0 + 1s);
  assert(!policy.IsEvictionAllowed(t0 + 61s));
}

void TestDisabledPolicyAllowsEvictionOnceActive() {
  SelfPreservationOptions options;
  options.enabled = false;
  SelfPreservation policy(options);
  assert(!policy.IsEvictionAllowed());
  policy.Activate();
  assert(policy.IsEvictionAllowed());
}

void TestEvictionRemovesExpiredLeasesInBoundedBatches() {
  SelfPreservationOptions options;
  options.enabled = false;

  auto policy = std::make_shared<SelfPreservation>(options);
  auto store  = std::make_shared<discovery::store::MemoryRegistryStore>(policy, 64);
  auto peers  = std::make_shared<discovery::peer::PeerNodeSet>(
      std::make_shared<NoPeerClients>(), [] { return std::vector<std::string>{}; }, "self:8761", discovery::peer::ReplicationOptions{}, 1h);
  peers->Start();

  discovery::registry::RegistryOptions registry_options;
  registry_options.node_id = "self:8761";
  discovery::registry::PeerAwareRegistry registry(store, policy, peers, registry_options);

  for (int i = 0; i < 10; ++i) {
    InstanceInfo instance;
    instance.set_id("a-" + std::to_string(i));
    instance.set_app_name("A");
    *instance.mutable_lease()->mutable_duration() = discovery::util::ToProto(1000ms);
    registry.Register(instance);
  }
  InstanceInfo long_lived;
  long_lived.set_id("b-1");
  long_lived.set_app_name("B");
  registry.Register(long_lived);
  assert(policy->ExpectedClients() == 11);

  const auto later = discovery::util::Now() + 5s;
  assert(registry.Evict(later) == 0 && "nothing is evicted before the registry serves");

  registry.OpenForTraffic(InstanceInfo{}, 11);

  // 11 - floor(11 * 0.85) = 2 per run
  assert(registry.Evict(later) == 2);
  assert(store->Size() == 9);
  assert(policy->ExpectedClients() == 9);

  // 9 - floor(9 * 0.85) = 2
  assert(registry.Evict(later) == 2);
  assert(store->Size() == 7);

  while (registry.Evict(later) > 0) {
  }
  assert(store->Size() == 1);
  assert(store->Get("b-1").has_value() && "an unexpired lease is never evicted");

  registry.Shutdown();
}

} // namespace

int main() {
  TestMeasuredRateReportsPreviousInterval();
  TestThresholdFollowsExpectedClients();
  TestEvictionNeedsRenewalsAboveThreshold();
  TestZeroExpectedClientsNeverEvicts();
  TestDisabledPolicyAllowsEvictionOnceActive();
  TestEvictionRemovesExpiredLeasesInBoundedBatches();

  std::cout << "discovery_unit_self_preservation: pass\n";
  return 0;
}
