#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "internal/util/time.hpp"

namespace discovery::lease {

/*
  Counts events per fixed interval.

  LastCount() reports the previous complete interval, so a fresh instance
  reports zero until one full interval has elapsed.
*/
class MeasuredRate {
 public:
  explicit MeasuredRate(std::chrono::milliseconds interval, util::TimePoint start = util::Now());

  void    Increment(util::TimePoint now = util::Now());
  int64_t LastCount(util::TimePoint now = util::Now());

 private:
  void RollLocked(util::TimePoint now);

  std::mutex                      mutex_;
  const std::chrono::milliseconds interval_;
  util::TimePoint                 bucket_start_;
  int64_t                         current_ = 0;
  int64_t                         last_    = 0;
};

} // namespace discovery::lease
