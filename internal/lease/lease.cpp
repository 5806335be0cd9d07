#include "lease.hpp"

namespace discovery::lease {

using discovery::registry::v1::InstanceInfo;

std::chrono::milliseconds Duration(const InstanceInfo& instance) {
  return util::FromProto(instance.lease().duration());
}

util::TimePoint LastRenewal(const InstanceInfo& instance) {
  return util::FromProto(instance.lease().last_renewal_timestamp());
}

bool IsExpired(const InstanceInfo& instance, util::TimePoint now) {
  if (instance.lease().has_eviction_timestamp()) return true;
  return now - LastRenewal(instance) > Duration(instance);
}

void Start(InstanceInfo* instance, util::TimePoint now, std::chrono::milliseconds default_duration) {
  auto* lease = instance->mutable_lease();
  if (Duration(*instance) <= std::chrono::milliseconds::zero()) {
    *lease->mutable_duration() = util::ToProto(default_duration);
  }
  *lease->mutable_registration_timestamp() = util::ToProto(now);
  *lease->mutable_last_renewal_timestamp() = util::ToProto(now);
  lease->clear_eviction_timestamp();
}

void Renew(InstanceInfo* instance, util::TimePoint now) {
  *instance->mutable_lease()->mutable_last_renewal_timestamp() = util::ToProto(now);
}

void MarkEvicted(InstanceInfo* instance, util::TimePoint now) {
  *instance->mutable_lease()->mutable_eviction_timestamp() = util::ToProto(now);
}

bool IsNewer(const InstanceInfo& a, const InstanceInfo& b) {
  const auto renewal_a = LastRenewal(a);
  const auto renewal_b = LastRenewal(b);
  if (renewal_a != renewal_b) return renewal_a > renewal_b;
  return util::FromProto(a.last_updated_timestamp()) > util::FromProto(b.last_updated_timestamp());
}

} // namespace discovery::lease
