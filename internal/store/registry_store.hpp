#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "discovery/registry/v1/instance.pb.h"
#include "internal/model/change_notification.hpp"
#include "internal/model/interest.hpp"
#include "internal/stream/stream.hpp"

namespace discovery::store {

using InstanceStream = discovery::stream::Stream<discovery::model::InstanceNotification>;

enum class PutOutcome {
  kAdded,
  kModified,
  kUnchanged,
  kRejected,
};

/*
  Registry store abstraction.

  GUARANTEES:

  - Each mutation is applied atomically with respect to readers; a query
    never observes half of a mutation.
  - Query() delivers the current matching entries as Add, then exactly one
    BufferSentinel once the store is primed, then live changes in order.
  - Identical puts are not re-published (replay is idempotent).
*/
class RegistryStore {
 public:
  using InstanceInfo = discovery::registry::v1::InstanceInfo;

  // Called with the current entry (nullptr when absent); return false to reject.
  using PutCondition = std::function<bool(const InstanceInfo* existing)>;
  // Called with a copy of the entry; return false to leave the entry untouched.
  using Mutator = std::function<bool(InstanceInfo* instance)>;
  using RemoveCondition = std::function<bool(const InstanceInfo& existing)>;

  virtual ~RegistryStore() = default;

  // Throws InvalidState for a malformed interest.
  virtual InstanceStream Query(const discovery::model::Interest& interest) = 0;

  virtual PutOutcome Put(const InstanceInfo& instance) = 0;
  virtual PutOutcome PutIf(const InstanceInfo& instance, const PutCondition& condition) = 0;

  // Returns the updated entry, or std::nullopt when absent or left untouched.
  virtual std::optional<InstanceInfo> Update(const std::string& id, const Mutator& mutator) = 0;

  virtual std::optional<InstanceInfo> Remove(const std::string& id) = 0;
  virtual std::optional<InstanceInfo> RemoveIf(const std::string& id, const RemoveCondition& condition) = 0;

  virtual std::optional<InstanceInfo> Get(const std::string& id) const = 0;
  virtual std::vector<InstanceInfo>   Snapshot() const                 = 0;
  virtual std::size_t                 Size() const                     = 0;

  // Initial content is complete: pending subscribers receive their BufferSentinel.
  virtual void MarkPrimed()     = 0;
  virtual bool IsPrimed() const = 0;

  virtual bool IsEvictionAllowed() = 0;
};

} // namespace discovery::store
