#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace discovery::stream {

enum class PollStatus {
  kItem,
  kTimeout,
  kCompleted,
};

/*
  Bounded hand-off between one producer and one consumer.

  The producer never blocks: a consumer that falls more than `capacity` items
  behind has its pipe failed with ResourceExhausted. Items buffered before a
  failure are still delivered; the error is raised once they are drained.
*/
template <typename T>
class Pipe {
 public:
  explicit Pipe(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  // Returns false once the pipe stopped accepting items.
  bool Push(T item) {
    bool accepted = false;
    {
      std::lock_guard lock(mutex_);
      if (!AcceptingLocked()) return false;

      if (items_.size() >= capacity_) {
        error_  = std::make_exception_ptr(discovery::util::ResourceExhausted("subscriber fell behind; buffer of " +
                                                                            std::to_string(capacity_) + " notifications exceeded"));
        closed_ = true;
      } else {
        items_.push_back(std::move(item));
        accepted = true;
      }
    }
    cv_.notify_all();
    return accepted;
  }

  void Complete() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void Fail(std::exception_ptr error) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return;
      error_  = std::move(error);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsOpen() const {
    std::lock_guard lock(mutex_);
    return AcceptingLocked();
  }

  bool IsCancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
  }

  // Hook runs once, on the cancelling thread; immediately if already cancelled.
  void OnCancel(std::function<void()> hook) {
    {
      std::lock_guard lock(mutex_);
      if (!cancelled_) {
        cancel_hooks_.push_back(std::move(hook));
        return;
      }
    }
    hook();
  }

  void Cancel() {
    std::vector<std::function<void()>> hooks;
    {
      std::lock_guard lock(mutex_);
      if (cancelled_) return;
      cancelled_ = true;
      items_.clear();
      hooks.swap(cancel_hooks_);
    }
    cv_.notify_all();
    for (auto& hook : hooks) {
      hook();
    }
  }

  PollStatus Poll(std::optional<T>* out, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return ReadyLocked(); });
    return TakeLocked(out);
  }

  PollStatus Wait(std::optional<T>* out) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return ReadyLocked(); });
    return TakeLocked(out);
  }

  std::size_t capacity() const {
    return capacity_;
  }

 private:
  bool AcceptingLocked() const {
    return !closed_ && !cancelled_;
  }

  bool ReadyLocked() const {
    return !items_.empty() || closed_ || cancelled_;
  }

  PollStatus TakeLocked(std::optional<T>* out) {
    if (cancelled_) return PollStatus::kCompleted;

    if (!items_.empty()) {
      out->emplace(std::move(items_.front()));
      items_.pop_front();
      return PollStatus::kItem;
    }

    if (error_) {
      auto error = error_;
      error_     = nullptr;
      std::rethrow_exception(error);
    }

    return closed_ ? PollStatus::kCompleted : PollStatus::kTimeout;
  }

  const std::size_t capacity_;

  mutable std::mutex                  mutex_;
  std::condition_variable             cv_;
  std::deque<T>                       items_;
  bool                                closed_    = false;
  bool                                cancelled_ = false;
  std::exception_ptr                  error_;
  std::vector<std::function<void()>> cancel_hooks_;
};

} // namespace discovery::stream
