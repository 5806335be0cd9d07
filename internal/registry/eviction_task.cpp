#include "eviction_task.hpp"

#include "internal/observability/logging.hpp"

namespace discovery::registry {

using discovery::observability::DurationField;
using discovery::observability::IntField;
using discovery::observability::StringField;

EvictionTask::EvictionTask(Evictor evictor, std::chrono::milliseconds interval) : evictor_(std::move(evictor)), interval_(interval) {
}

EvictionTask::~EvictionTask() {
  Stop();
}

void EvictionTask::Start() {
  if (running_.exchange(true)) return;
  DISCOVERY_LOG_INFO("Eviction task started", {DurationField("interval", interval_)});
  thread_ = std::thread(&EvictionTask::Loop, this);
}

void EvictionTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void EvictionTask::Loop() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return !running_; })) return;
    }

    try {
      const auto evicted = evictor_(util::Now());
      if (evicted > 0) {
        DISCOVERY_LOG_INFO("Eviction run completed", {IntField("evicted", static_cast<int64_t>(evicted))});
      }
    } catch (const std::exception& e) {
      DISCOVERY_LOG_ERROR("Eviction run failed", {StringField("error", e.what())});
    }
    ++runs_;
  }
}

} // namespace discovery::registry
