#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/lease/self_preservation.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::store {

/*
  In-memory registry store.

  Single writer, many readers: writers serialize on write_mutex_ and publish
  a new immutable snapshot; readers only copy the snapshot pointer.
*/
class MemoryRegistryStore final : public RegistryStore, public std::enable_shared_from_this<MemoryRegistryStore> {
 public:
  MemoryRegistryStore(std::shared_ptr<discovery::lease::SelfPreservation> self_preservation, std::size_t subscription_buffer);
  ~MemoryRegistryStore() override;

  InstanceStream Query(const discovery::model::Interest& interest) override;

  PutOutcome Put(const InstanceInfo& instance) override;
  PutOutcome PutIf(const InstanceInfo& instance, const PutCondition& condition) override;

  std::optional<InstanceInfo> Update(const std::string& id, const Mutator& mutator) override;

  std::optional<InstanceInfo> Remove(const std::string& id) override;
  std::optional<InstanceInfo> RemoveIf(const std::string& id, const RemoveCondition& condition) override;

  std::optional<InstanceInfo> Get(const std::string& id) const override;
  std::vector<InstanceInfo>   Snapshot() const override;
  std::size_t                 Size() const override;

  void MarkPrimed() override;
  bool IsPrimed() const override;

  bool IsEvictionAllowed() override;

  std::size_t SubscriberCount() const;

 private:
  using InstanceMap  = std::unordered_map<std::string, InstanceInfo>;
  using Notification = discovery::model::InstanceNotification;
  using NotifyPipe   = discovery::stream::Pipe<Notification>;

  struct Subscriber {
    uint64_t                                                 id;
    std::shared_ptr<const discovery::model::InterestMatcher> matcher;
    std::shared_ptr<NotifyPipe>                              pipe;
    bool                                                     sentinel_sent;
  };

  std::shared_ptr<NotifyPipe> Subscribe(const std::shared_ptr<const discovery::model::InterestMatcher>& matcher);
  void                        Unsubscribe(uint64_t id);

  std::shared_ptr<const InstanceMap> Current() const;
  void                               Swap(std::shared_ptr<const InstanceMap> next);
  void                               PublishLocked(const Notification& notification);

  const std::shared_ptr<discovery::lease::SelfPreservation> self_preservation_;
  const std::size_t                                         subscription_buffer_;

  // Guards mutations, subscriber registration and publication order.
  mutable std::mutex      write_mutex_;
  std::vector<Subscriber> subscribers_;
  uint64_t                next_subscriber_id_ = 1;
  bool                    primed_             = false;

  mutable std::mutex                 snapshot_mutex_;
  std::shared_ptr<const InstanceMap> snapshot_;
};

} // namespace discovery::store
