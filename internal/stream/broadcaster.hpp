#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/stream/pipe.hpp"

namespace discovery::stream {

/*
  Publishes every item to all attached pipes.

  Pipes that stop accepting items (cancelled, completed, overflowed) are
  dropped on the next publish. After Complete() newly attached pipes are
  completed immediately.
*/
template <typename T>
class Broadcaster {
 public:
  void Attach(std::shared_ptr<Pipe<T>> pipe) {
    std::lock_guard lock(mutex_);
    if (completed_) {
      pipe->Complete();
      return;
    }
    pipes_.push_back(std::move(pipe));
  }

  void Publish(const T& item) {
    std::lock_guard lock(mutex_);
    pipes_.erase(std::remove_if(pipes_.begin(), pipes_.end(), [&](const std::shared_ptr<Pipe<T>>& pipe) { return !pipe->Push(item); }),
                 pipes_.end());
  }

  void Complete() {
    std::lock_guard lock(mutex_);
    completed_ = true;
    for (auto& pipe : pipes_) {
      pipe->Complete();
    }
    pipes_.clear();
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return pipes_.size();
  }

 private:
  mutable std::mutex                    mutex_;
  std::vector<std::shared_ptr<Pipe<T>>> pipes_;
  bool                                  completed_ = false;
};

} // namespace discovery::stream
