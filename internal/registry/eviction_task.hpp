#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace discovery::registry {

/*
  Periodically runs the lease evictor until stopped.
*/
class EvictionTask {
 public:
  using Evictor = std::function<std::size_t(util::TimePoint now)>;

  EvictionTask(Evictor evictor, std::chrono::milliseconds interval);
  ~EvictionTask();

  EvictionTask(const EvictionTask&)            = delete;
  EvictionTask& operator=(const EvictionTask&) = delete;

  void Start();
  void Stop();

  uint64_t Runs() const {
    return runs_;
  }

 private:
  void Loop();

  Evictor                         evictor_;
  const std::chrono::milliseconds interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   runs_{0};
};

} // namespace discovery::registry
