#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>

#include "internal/model/change_notification.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::interest {

/*
  Applies the notifications of one channel session to the local store.

  Add/Modify put the entry, Delete removes it. At the session's
  BufferSentinel, local entries that were not part of its initial batch are
  removed (they vanished upstream while disconnected) and the store is
  marked primed. Create one feed per session.
*/
class ChannelFeed {
 public:
  explicit ChannelFeed(std::shared_ptr<discovery::store::RegistryStore> store);

  void Apply(const discovery::model::InstanceNotification& notification);

  bool InitialBatchComplete() const {
    return sentinel_seen_;
  }

  std::size_t InitialBatchSize() const {
    return initial_ids_.size();
  }

 private:
  void ReconcileInitialBatch();

  std::shared_ptr<discovery::store::RegistryStore> store_;
  std::unordered_set<std::string>                  initial_ids_;
  bool                                             sentinel_seen_ = false;
};

} // namespace discovery::interest
