#pragma once

#include <chrono>

#include "discovery/registry/v1/instance.pb.h"
#include "internal/util/time.hpp"

namespace discovery::lease {

/*
  Lease bookkeeping embedded in InstanceInfo.

  An instance is eligible for eviction only once
  now - last_renewal > lease duration.
*/

std::chrono::milliseconds Duration(const discovery::registry::v1::InstanceInfo& instance);
util::TimePoint           LastRenewal(const discovery::registry::v1::InstanceInfo& instance);

bool IsExpired(const discovery::registry::v1::InstanceInfo& instance, util::TimePoint now);

// Starts a fresh lease; keeps a client-requested duration, otherwise applies `default_duration`.
void Start(discovery::registry::v1::InstanceInfo* instance, util::TimePoint now, std::chrono::milliseconds default_duration);
void Renew(discovery::registry::v1::InstanceInfo* instance, util::TimePoint now);
void MarkEvicted(discovery::registry::v1::InstanceInfo* instance, util::TimePoint now);

// Last-writer-wins order: later renewal first, later update breaks ties.
bool IsNewer(const discovery::registry::v1::InstanceInfo& a, const discovery::registry::v1::InstanceInfo& b);

} // namespace discovery::lease
