#include "self_preservation.hpp"

#include <algorithm>
#include <cmath>

namespace discovery::lease {

using namespace std::chrono_literals;

SelfPreservation::SelfPreservation(SelfPreservationOptions options, util::TimePoint start)
    : options_(options), renewals_last_minute_(1min, start) {
}

void SelfPreservation::Activate() {
  active_ = true;
}

bool SelfPreservation::IsActive() const {
  return active_;
}

void SelfPreservation::SetExpectedClients(int64_t count) {
  std::lock_guard lock(mutex_);
  expected_clients_ = std::max<int64_t>(0, count);
  RecomputeThresholdLocked();
}

void SelfPreservation::AddExpectedClients(int64_t delta) {
  std::lock_guard lock(mutex_);
  expected_clients_ = std::max<int64_t>(0, expected_clients_ + delta);
  RecomputeThresholdLocked();
}

int64_t SelfPreservation::ExpectedClients() const {
  std::lock_guard lock(mutex_);
  return expected_clients_;
}

void SelfPreservation::RecomputeThresholdLocked() {
  const auto interval_ms = std::max<int64_t>(1, options_.expected_renewal_interval.count());
  const double per_client_per_minute = 60000.0 / static_cast<double>(interval_ms);
  renewal_threshold_ =
      static_cast<int64_t>(std::floor(static_cast<double>(expected_clients_) * per_client_per_minute * options_.renewal_percent_threshold));
}

void SelfPreservation::RecordRenewal(util::TimePoint now) {
  renewals_last_minute_.Increment(now);
}

int64_t SelfPreservation::RenewalsLastMinute(util::TimePoint now) {
  return renewals_last_minute_.LastCount(now);
}

int64_t SelfPreservation::RenewalThreshold() const {
  std::lock_guard lock(mutex_);
  return renewal_threshold_;
}

bool SelfPreservation::IsEvictionAllowed(util::TimePoint now) {
  if (!active_) return false;
  if (!options_.enabled) return true;

  const auto threshold = RenewalThreshold();
  return threshold > 0 && RenewalsLastMinute(now) > threshold;
}

} // namespace discovery::lease
