#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

#include "internal/lease/measured_rate.hpp"

namespace discovery::lease {

struct SelfPreservationOptions {
  bool                      enabled                   = true;
  double                    renewal_percent_threshold = 0.85;
  std::chrono::milliseconds expected_renewal_interval = std::chrono::seconds(30);
};

/*
  Suspends lease eviction when renewals drop below the expected baseline.

  expected renewals per minute = expected clients * (60s / renewal interval)
  threshold                    = floor(expected * renewal_percent_threshold)

  Eviction is allowed when self-preservation is disabled, or when the
  renewals seen in the last minute exceed a positive threshold. Nothing is
  evicted before Activate() (the registry is not serving yet).
*/
class SelfPreservation {
 public:
  explicit SelfPreservation(SelfPreservationOptions options, util::TimePoint start = util::Now());

  void Activate();
  bool IsActive() const;

  void    SetExpectedClients(int64_t count);
  void    AddExpectedClients(int64_t delta);
  int64_t ExpectedClients() const;

  void    RecordRenewal(util::TimePoint now = util::Now());
  int64_t RenewalsLastMinute(util::TimePoint now = util::Now());
  int64_t RenewalThreshold() const;

  bool IsEvictionAllowed(util::TimePoint now = util::Now());

  double renewal_percent_threshold() const {
    return options_.renewal_percent_threshold;
  }

 private:
  void RecomputeThresholdLocked();

  const SelfPreservationOptions options_;
  MeasuredRate                  renewals_last_minute_;
  std::atomic<bool>             active_{false};

  mutable std::mutex mutex_;
  int64_t            expected_clients_  = 0;
  int64_t            renewal_threshold_ = 0;
};

} // namespace discovery::lease
