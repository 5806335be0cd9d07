#include "channel_feed.hpp"

#include "internal/observability/logging.hpp"

namespace discovery::interest {

using discovery::model::ChangeKind;

ChannelFeed::ChannelFeed(std::shared_ptr<discovery::store::RegistryStore> store) : store_(std::move(store)) {
}

void ChannelFeed::Apply(const discovery::model::InstanceNotification& notification) {
  switch (notification.kind()) {
    case ChangeKind::kAdd:
    case ChangeKind::kModify:
      if (!sentinel_seen_) initial_ids_.insert(notification.data().id());
      store_->Put(notification.data());
      break;
    case ChangeKind::kDelete:
      if (!sentinel_seen_) initial_ids_.erase(notification.data().id());
      store_->Remove(notification.data().id());
      break;
    case ChangeKind::kBufferSentinel:
      if (sentinel_seen_) break;
      sentinel_seen_ = true;
      ReconcileInitialBatch();
      store_->MarkPrimed();
      break;
  }
}

void ChannelFeed::ReconcileInitialBatch() {
  std::size_t removed = 0;
  for (const auto& instance : store_->Snapshot()) {
    if (initial_ids_.count(instance.id()) != 0) continue;
    if (store_->Remove(instance.id())) ++removed;
  }

  if (removed > 0) {
    DISCOVERY_LOG_INFO("Removed stale registry entries after resubscribe",
                       {discovery::observability::IntField("removed", static_cast<int64_t>(removed)),
                        discovery::observability::IntField("initial_batch", static_cast<int64_t>(initial_ids_.size()))});
  }
}

} // namespace discovery::interest
