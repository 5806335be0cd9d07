#include "measured_rate.hpp"

namespace discovery::lease {

MeasuredRate::MeasuredRate(std::chrono::milliseconds interval, util::TimePoint start) : interval_(interval), bucket_start_(start) {
}

void MeasuredRate::RollLocked(util::TimePoint now) {
  const auto elapsed = now - bucket_start_;
  if (elapsed < interval_) return;

  const auto buckets = elapsed / interval_;
  // a gap of more than one interval means the previous interval saw nothing
  last_    = buckets == 1 ? current_ : 0;
  current_ = 0;
  bucket_start_ += std::chrono::duration_cast<util::Clock::duration>(interval_ * buckets);
}

void MeasuredRate::Increment(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollLocked(now);
  ++current_;
}

int64_t MeasuredRate::LastCount(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollLocked(now);
  return last_;
}

} // namespace discovery::lease
