#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "internal/stream/pipe.hpp"

namespace discovery::stream {

/*
  Consumer handle of one subscription.

  Owns its pipe: destroying or cancelling the subscription releases the
  producer side (cancel hooks run, upstream detaches).
*/
template <typename T>
class Subscription {
 public:
  explicit Subscription(std::shared_ptr<Pipe<T>> pipe) : pipe_(std::move(pipe)) {
  }

  ~Subscription() {
    Cancel();
  }

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept : pipe_(std::move(other.pipe_)) {
  }

  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      Cancel();
      pipe_ = std::move(other.pipe_);
    }
    return *this;
  }

  // Blocks for the next item. std::nullopt once the stream completed or was
  // cancelled; rethrows the stream error.
  std::optional<T> Next() {
    std::optional<T> item;
    if (pipe_) pipe_->Wait(&item);
    return item;
  }

  PollStatus Poll(std::optional<T>* out, std::chrono::milliseconds timeout) {
    if (!pipe_) return PollStatus::kCompleted;
    return pipe_->Poll(out, timeout);
  }

  void Cancel() {
    if (pipe_) pipe_->Cancel();
  }

  bool IsCancelled() const {
    return !pipe_ || pipe_->IsCancelled();
  }

 private:
  std::shared_ptr<Pipe<T>> pipe_;
};

/*
  Lazy, restartable push stream.

  Nothing happens until Subscribe(); each call runs the producer again and
  yields an independent subscription.
*/
template <typename T>
class Stream {
 public:
  using Producer = std::function<std::shared_ptr<Pipe<T>>()>;

  explicit Stream(Producer producer) : producer_(std::move(producer)) {
  }

  // A stream whose every subscription fails with `error` on first read.
  static Stream Error(std::exception_ptr error) {
    return Stream([error] {
      auto pipe = std::make_shared<Pipe<T>>(1);
      pipe->Fail(error);
      return pipe;
    });
  }

  Subscription<T> Subscribe() const {
    return Subscription<T>(producer_());
  }

 private:
  Producer producer_;
};

} // namespace discovery::stream
