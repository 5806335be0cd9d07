#include "memory_registry_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>

namespace discovery::store {

using discovery::model::InstanceNotification;
using discovery::model::InterestMatcher;

MemoryRegistryStore::MemoryRegistryStore(std::shared_ptr<discovery::lease::SelfPreservation> self_preservation,
                                         std::size_t                                         subscription_buffer)
    : self_preservation_(std::move(self_preservation)),
      subscription_buffer_(subscription_buffer),
      snapshot_(std::make_shared<const InstanceMap>()) {
}

MemoryRegistryStore::~MemoryRegistryStore() {
  std::lock_guard lock(write_mutex_);
  for (auto& subscriber : subscribers_) {
    subscriber.pipe->Complete();
  }
  subscribers_.clear();
}

// ------------------------------------------------------------
// Snapshot handling
// ------------------------------------------------------------

std::shared_ptr<const MemoryRegistryStore::InstanceMap> MemoryRegistryStore::Current() const {
  std::lock_guard lock(snapshot_mutex_);
  return snapshot_;
}

void MemoryRegistryStore::Swap(std::shared_ptr<const InstanceMap> next) {
  std::lock_guard lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

void MemoryRegistryStore::PublishLocked(const Notification& notification) {
  const auto& instance = notification.data();
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [&](const Subscriber& subscriber) {
                                      if (!subscriber.matcher->Matches(instance)) return !subscriber.pipe->IsOpen();
                                      return !subscriber.pipe->Push(notification);
                                    }),
                     subscribers_.end());
}

// ------------------------------------------------------------
// Query
// ------------------------------------------------------------

InstanceStream MemoryRegistryStore::Query(const discovery::model::Interest& interest) {
  auto                               matcher = std::make_shared<const InterestMatcher>(interest);
  std::weak_ptr<MemoryRegistryStore> weak    = weak_from_this();

  return InstanceStream([weak, matcher] {
    auto self = weak.lock();
    if (!self) {
      auto pipe = std::make_shared<NotifyPipe>(1);
      pipe->Complete();
      return pipe;
    }
    return self->Subscribe(matcher);
  });
}

std::shared_ptr<MemoryRegistryStore::NotifyPipe> MemoryRegistryStore::Subscribe(const std::shared_ptr<const InterestMatcher>& matcher) {
  std::lock_guard lock(write_mutex_);

  const auto                       snapshot = Current();
  std::vector<const InstanceInfo*> initial;
  for (const auto& [id, instance] : *snapshot) {
    if (matcher->Matches(instance)) initial.push_back(&instance);
  }

  // the initial batch always fits; the buffer bounds what may queue up after it
  auto pipe = std::make_shared<NotifyPipe>(initial.size() + 1 + subscription_buffer_);
  for (const auto* instance : initial) {
    pipe->Push(InstanceNotification::Add(*instance));
  }
  if (primed_) {
    pipe->Push(InstanceNotification::BufferSentinel());
  }

  const auto id = next_subscriber_id_++;
  subscribers_.push_back(Subscriber{id, matcher, pipe, primed_});

  std::weak_ptr<MemoryRegistryStore> weak = weak_from_this();
  pipe->OnCancel([weak, id] {
    if (auto self = weak.lock()) self->Unsubscribe(id);
  });
  return pipe;
}

void MemoryRegistryStore::Unsubscribe(uint64_t id) {
  std::lock_guard lock(write_mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(), [&](const Subscriber& subscriber) { return subscriber.id == id; }),
      subscribers_.end());
}

std::size_t MemoryRegistryStore::SubscriberCount() const {
  std::lock_guard lock(write_mutex_);
  return subscribers_.size();
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

PutOutcome MemoryRegistryStore::Put(const InstanceInfo& instance) {
  return PutIf(instance, [](const InstanceInfo*) { return true; });
}

PutOutcome MemoryRegistryStore::PutIf(const InstanceInfo& instance, const PutCondition& condition) {
  std::lock_guard lock(write_mutex_);

  const auto current  = Current();
  const auto existing = current->find(instance.id());
  const bool present  = existing != current->end();

  if (!condition(present ? &existing->second : nullptr)) {
    return PutOutcome::kRejected;
  }
  if (present && google::protobuf::util::MessageDifferencer::Equals(existing->second, instance)) {
    return PutOutcome::kUnchanged;
  }

  auto next              = std::make_shared<InstanceMap>(*current);
  (*next)[instance.id()] = instance;
  Swap(std::move(next));

  if (present) {
    PublishLocked(InstanceNotification::Modify(instance));
    return PutOutcome::kModified;
  }
  PublishLocked(InstanceNotification::Add(instance));
  return PutOutcome::kAdded;
}

std::optional<MemoryRegistryStore::InstanceInfo> MemoryRegistryStore::Update(const std::string& id, const Mutator& mutator) {
  std::lock_guard lock(write_mutex_);

  const auto current  = Current();
  const auto existing = current->find(id);
  if (existing == current->end()) return std::nullopt;

  InstanceInfo updated = existing->second;
  if (!mutator(&updated)) return std::nullopt;

  if (google::protobuf::util::MessageDifferencer::Equals(existing->second, updated)) {
    return updated;
  }

  auto next   = std::make_shared<InstanceMap>(*current);
  (*next)[id] = updated;
  Swap(std::move(next));

  PublishLocked(InstanceNotification::Modify(updated));
  return updated;
}

std::optional<MemoryRegistryStore::InstanceInfo> MemoryRegistryStore::Remove(const std::string& id) {
  return RemoveIf(id, [](const InstanceInfo&) { return true; });
}

std::optional<MemoryRegistryStore::InstanceInfo> MemoryRegistryStore::RemoveIf(const std::string& id, const RemoveCondition& condition) {
  std::lock_guard lock(write_mutex_);

  const auto current  = Current();
  const auto existing = current->find(id);
  if (existing == current->end() || !condition(existing->second)) return std::nullopt;

  InstanceInfo removed = existing->second;
  auto         next    = std::make_shared<InstanceMap>(*current);
  next->erase(id);
  Swap(std::move(next));

  PublishLocked(InstanceNotification::Delete(removed));
  return removed;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<MemoryRegistryStore::InstanceInfo> MemoryRegistryStore::Get(const std::string& id) const {
  const auto current = Current();
  auto       it      = current->find(id);
  if (it == current->end()) return std::nullopt;
  return it->second;
}

std::vector<MemoryRegistryStore::InstanceInfo> MemoryRegistryStore::Snapshot() const {
  const auto                current = Current();
  std::vector<InstanceInfo> out;
  out.reserve(current->size());
  for (const auto& [id, instance] : *current) {
    out.push_back(instance);
  }
  return out;
}

std::size_t MemoryRegistryStore::Size() const {
  return Current()->size();
}

// ------------------------------------------------------------
// Priming / eviction policy
// ------------------------------------------------------------

void MemoryRegistryStore::MarkPrimed() {
  std::lock_guard lock(write_mutex_);
  primed_ = true;
  for (auto& subscriber : subscribers_) {
    if (subscriber.sentinel_sent) continue;
    subscriber.pipe->Push(InstanceNotification::BufferSentinel());
    subscriber.sentinel_sent = true;
  }
}

bool MemoryRegistryStore::IsPrimed() const {
  std::lock_guard lock(write_mutex_);
  return primed_;
}

bool MemoryRegistryStore::IsEvictionAllowed() {
  return self_preservation_ ? self_preservation_->IsEvictionAllowed() : true;
}

} // namespace discovery::store
