#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/interest/channel_feed.hpp"
#include "internal/store/memory_registry_store.hpp"

namespace {

using namespace discovery::registry::v1;
using discovery::interest::ChannelFeed;
using discovery::model::InstanceNotification;
using discovery::store::MemoryRegistryStore;

InstanceInfo MakeInstance(const std::string& id) {
  InstanceInfo instance;
  instance.set_id(id);
  instance.set_app_name("A");
  return instance;
}

void TestFirstSessionPrimesStore() {
  auto        store = std::make_shared<MemoryRegistryStore>(nullptr, 16);
  ChannelFeed feed(store);

  feed.Apply(InstanceNotification::Add(MakeInstance("a-1")));
  feed.Apply(InstanceNotification::Add(MakeInstance("a-2")));
  assert(!store->IsPrimed());
  assert(!feed.InitialBatchComplete());

  feed.Apply(InstanceNotification::BufferSentinel());
  assert(store->IsPrimed());
  assert(feed.InitialBatchComplete());
  assert(feed.InitialBatchSize() == 2);

  feed.Apply(InstanceNotification::Delete(MakeInstance("a-1")));
  assert(store->Size() == 1);
  assert(feed.InitialBatchSize() == 2);
}

void TestResubscribeDropsEntriesMissingUpstream() {
  auto store = std::make_shared<MemoryRegistryStore>(nullptr, 16);
  {
    ChannelFeed first(store);
    first.Apply(InstanceNotification::Add(MakeInstance("a-1")));
    first.Apply(InstanceNotification::Add(MakeInstance("a-2")));
    first.Apply(InstanceNotification::Add(MakeInstance("a-3")));
    first.Apply(InstanceNotification::BufferSentinel());
  }
  assert(store->Size() == 3);

  // a-2 vanished upstream while the channel was down
  ChannelFeed second(store);
  second.Apply(InstanceNotification::Add(MakeInstance("a-1")));
  second.Apply(InstanceNotification::Add(MakeInstance("a-3")));
  second.Apply(InstanceNotification::Add(MakeInstance("a-4")));
  assert(store->Size() == 4);

  second.Apply(InstanceNotification::BufferSentinel());
  assert(store->Size() == 3);
  assert(!store->Get("a-2").has_value());
  assert(store->Get("a-4").has_value());

  // a repeated sentinel changes nothing
  second.Apply(InstanceNotification::Add(MakeInstance("a-5")));
  second.Apply(InstanceNotification::BufferSentinel());
  assert(store->Size() == 4);
}

} // namespace

int main() {
  TestFirstSessionPrimesStore();
  TestResubscribeDropsEntriesMissingUpstream();

  std::cout << "discovery_unit_channel_feed: pass\n";
  return 0;
}
