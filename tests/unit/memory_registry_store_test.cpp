#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/change_notification.hpp"
#include "internal/model/interest.hpp"
#include "internal/store/memory_registry_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace discovery::registry::v1;
using discovery::model::ChangeKind;
using discovery::model::InstanceNotification;
using discovery::store::MemoryRegistryStore;
using discovery::store::PutOutcome;
using discovery::stream::PollStatus;
namespace interests = discovery::model::interests;

using NotificationSubscription = discovery::stream::Subscription<InstanceNotification>;

InstanceInfo MakeInstance(const std::string& id, const std::string& app) {
  InstanceInfo instance;
  instance.set_id(id);
  instance.set_app_name(app);
  instance.set_status(INSTANCE_STATUS_UP);
  return instance;
}

std::shared_ptr<MemoryRegistryStore> MakeStore(std::size_t buffer = 64) {
  return std::make_shared<MemoryRegistryStore>(nullptr, buffer);
}

// Drains what is currently queued, without waiting for more.
std::vector<InstanceNotification> Drain(NotificationSubscription& subscription) {
  std::vector<InstanceNotification> out;
  while (true) {
    std::optional<InstanceNotification> item;
    if (subscription.Poll(&item, 10ms) != PollStatus::kItem) return out;
    out.push_back(std::move(*item));
  }
}

void TestSentinelWaitsUntilPrimed() {
  auto store = MakeStore();
  store->Put(MakeInstance("a-1", "A"));
  store->Put(MakeInstance("a-2", "A"));

  auto subscription = store->Query(interests::ForFullRegistry()).Subscribe();
  auto initial      = Drain(subscription);
  assert(initial.size() == 2);
  assert(initial[0].kind() == ChangeKind::kAdd && initial[1].kind() == ChangeKind::kAdd);

  store->MarkPrimed();
  auto after = Drain(subscription);
  assert(after.size() == 1 && after[0].IsBufferSentinel());

  // exactly once per subscription
  store->MarkPrimed();
  assert(Drain(subscription).empty());
}

void TestPrimedStoreSendsInitialBatchThenSentinelThenLiveChanges() {
  auto store = MakeStore();
  store->MarkPrimed();
  store->Put(MakeInstance("a-1", "A"));
  store->Put(MakeInstance("b-1", "B"));

  auto subscription = store->Query(interests::ForApplication("A")).Subscribe();

  auto modified = MakeInstance("a-1", "A");
  modified.set_status(INSTANCE_STATUS_DOWN);
  store->Put(modified);
  store->Put(MakeInstance("b-2", "B"));
  store->Remove("a-1");

  auto events = Drain(subscription);
  assert(events.size() == 4);
  assert(events[0].kind() == ChangeKind::kAdd && events[0].data().id() == "a-1");
  assert(events[1].IsBufferSentinel());
  assert(events[2].kind() == ChangeKind::kModify && events[2].data().status() == INSTANCE_STATUS_DOWN);
  assert(events[3].kind() == ChangeKind::kDelete);
}

void TestIdenticalPutIsNotRepublished() {
  auto store = MakeStore();
  store->MarkPrimed();
  assert(store->Put(MakeInstance("a-1", "A")) == PutOutcome::kAdded);

  auto subscription = store->Query(interests::ForFullRegistry()).Subscribe();
  assert(Drain(subscription).size() == 2);

  assert(store->Put(MakeInstance("a-1", "A")) == PutOutcome::kUnchanged);
  assert(Drain(subscription).empty());
  assert(store->Size() == 1);
}

void TestConditionalMutations() {
  auto store = MakeStore();
  store->Put(MakeInstance("a-1", "A"));

  const auto rejected = store->PutIf(MakeInstance("a-1", "Z"), [](const InstanceInfo* existing) { return existing == nullptr; });
  assert(rejected == PutOutcome::kRejected);
  assert(store->Get("a-1")->app_name() == "A");

  auto untouched = store->Update("a-1", [](InstanceInfo*) { return false; });
  assert(!untouched.has_value());

  auto updated = store->Update("a-1", [](InstanceInfo* instance) {
    instance->set_status(INSTANCE_STATUS_OUT_OF_SERVICE);
    return true;
  });
  assert(updated && updated->status() == INSTANCE_STATUS_OUT_OF_SERVICE);
  assert(!store->Update("missing", [](InstanceInfo*) { return true; }).has_value());

  assert(!store->RemoveIf("a-1", [](const InstanceInfo& existing) { return existing.app_name() == "B"; }));
  assert(store->RemoveIf("a-1", [](const InstanceInfo& existing) { return existing.app_name() == "A"; }));
  assert(store->Size() == 0);
}

void TestCancelledSubscriptionDetaches() {
  auto store = MakeStore();
  {
    auto first  = store->Query(interests::ForFullRegistry()).Subscribe();
    auto second = store->Query(interests::ForFullRegistry()).Subscribe();
    assert(store->SubscriberCount() == 2);
    first.Cancel();
    assert(store->SubscriberCount() == 1);
  }
  assert(store->SubscriberCount() == 0);
}

void TestSlowSubscriberFailsWithoutBlockingWriters() {
  auto store = MakeStore(2);
  store->MarkPrimed();

  auto subscription = store->Query(interests::ForFullRegistry()).Subscribe();
  for (int i = 0; i < 10; ++i) {
    store->Put(MakeInstance("a-" + std::to_string(i), "A"));
  }
  assert(store->Size() == 10);
  assert(store->SubscriberCount() == 0);

  bool threw = false;
  try {
    while (subscription.Next()) {
    }
  } catch (const discovery::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedInterestFailsOnSubscribe() {
  auto store = MakeStore();
  bool threw = false;
  try {
    auto stream = store->Query(Interest{});
    (void)stream;
  } catch (const discovery::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestStoreDestructionCompletesStreams() {
  auto store        = MakeStore();
  auto subscription = store->Query(interests::ForFullRegistry()).Subscribe();
  store.reset();
  assert(!subscription.Next().has_value());
}

} // namespace

int main() {
  TestSentinelWaitsUntilPrimed();
  TestPrimedStoreSendsInitialBatchThenSentinelThenLiveChanges();
  TestIdenticalPutIsNotRepublished();
  TestConditionalMutations();
  TestCancelledSubscriptionDetaches();
  TestSlowSubscriberFailsWithoutBlockingWriters();
  TestMalformedInterestFailsOnSubscribe();
  TestStoreDestructionCompletesStreams();

  std::cout << "discovery_unit_memory_registry_store: pass\n";
  return 0;
}
