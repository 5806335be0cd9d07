#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "internal/connection/channel.hpp"
#include "internal/observability/logging.hpp"
#include "internal/stream/broadcaster.hpp"
#include "internal/stream/stream.hpp"

namespace discovery::connection {

enum class ConnectionState {
  kIdle,
  kConnecting,
  kActive,
  kFailed,
  kClosed,
};

enum class LifecycleEvent {
  kConnected,
  kDisconnected,
  kClosed,
};

/*
  Keeps an operation running against a live channel.

    Idle -> Connecting -> Active -> (Failed -> Connecting | Closed)

  On every (re)connect a fresh channel is requested from the factory and
  `execute` is invoked on it. A failing factory, a failing `execute` or a
  terminated channel moves to Failed; after `retry_wait` the worker connects
  again. Repeated failures never close the connection, only Shutdown() does.

  Lifecycle() streams Connected / Disconnected / Closed. RetryBegin() emits
  the attempt number at the start of every reconnect, for callers that must
  reset their own downstream state.
*/
template <typename ChannelT>
class RetryableConnection {
 public:
  using Operation = std::function<void(ChannelT&)>;

  RetryableConnection(std::shared_ptr<ChannelFactory<ChannelT>> factory, Operation execute, std::chrono::milliseconds retry_wait,
                      std::string name)
      : factory_(std::move(factory)),
        execute_(std::move(execute)),
        retry_wait_(retry_wait),
        name_(std::move(name)),
        lifecycle_(std::make_shared<discovery::stream::Broadcaster<LifecycleEvent>>()),
        retry_begin_(std::make_shared<discovery::stream::Broadcaster<uint64_t>>()) {
  }

  ~RetryableConnection() {
    Shutdown();
  }

  RetryableConnection(const RetryableConnection&)            = delete;
  RetryableConnection& operator=(const RetryableConnection&) = delete;

  void Start() {
    std::lock_guard lock(mutex_);
    if (state_ != ConnectionState::kIdle) return;
    state_  = ConnectionState::kConnecting;
    thread_ = std::thread(&RetryableConnection::Run, this);
  }

  // Closes the current channel and stops reconnecting. Idempotent.
  void Shutdown() {
    std::lock_guard shutdown_lock(shutdown_mutex_);

    std::shared_ptr<ChannelT> channel;
    {
      std::lock_guard lock(mutex_);
      if (closed_) return;
      closed_ = true;
      state_  = ConnectionState::kClosed;
      channel = channel_;
    }
    cv_.notify_all();

    if (channel) channel->Close();
    if (thread_.joinable()) thread_.join();

    lifecycle_->Publish(LifecycleEvent::kClosed);
    lifecycle_->Complete();
    retry_begin_->Complete();
    DISCOVERY_LOG_INFO("Connection closed", {discovery::observability::StringField("connection", name_)});
  }

  ConnectionState State() const {
    std::lock_guard lock(mutex_);
    return state_;
  }

  discovery::stream::Stream<LifecycleEvent> Lifecycle() const {
    return Attached(lifecycle_);
  }

  discovery::stream::Stream<uint64_t> RetryBegin() const {
    return Attached(retry_begin_);
  }

  uint64_t ReconnectAttempts() const {
    return reconnect_attempts_;
  }

  uint64_t Connects() const {
    return connects_;
  }

 private:
  static constexpr std::size_t kEventBuffer = 1024;

  template <typename E>
  static discovery::stream::Stream<E> Attached(std::shared_ptr<discovery::stream::Broadcaster<E>> broadcaster) {
    return discovery::stream::Stream<E>([broadcaster] {
      auto pipe = std::make_shared<discovery::stream::Pipe<E>>(kEventBuffer);
      broadcaster->Attach(pipe);
      return pipe;
    });
  }

  void Run() {
    bool first = true;

    while (true) {
      {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        state_ = ConnectionState::kConnecting;
      }

      if (!first) {
        const auto attempt = ++reconnect_attempts_;
        retry_begin_->Publish(attempt);
      }
      first = false;

      std::shared_ptr<ChannelT> channel;
      bool                      activated = false;
      try {
        channel = factory_->NewChannel();
        {
          std::lock_guard lock(mutex_);
          if (closed_) {
            channel->Close();
            return;
          }
          channel_ = channel;
        }

        execute_(*channel);

        {
          std::lock_guard lock(mutex_);
          if (closed_) return;
          state_ = ConnectionState::kActive;
        }
        activated = true;
        lifecycle_->Publish(LifecycleEvent::kConnected);
        ++connects_;
        DISCOVERY_LOG_INFO("Connection established", {discovery::observability::StringField("connection", name_),
                                                      discovery::observability::IntField("connects", static_cast<int64_t>(connects_))});

        channel->AwaitTermination();
        DISCOVERY_LOG_WARN("Channel terminated", {discovery::observability::StringField("connection", name_)});
      } catch (const std::exception& e) {
        DISCOVERY_LOG_WARN("Channel failed", {discovery::observability::StringField("connection", name_),
                                              discovery::observability::StringField("error", e.what())});
      }

      {
        std::lock_guard lock(mutex_);
        channel_.reset();
        if (closed_) return;
        state_ = ConnectionState::kFailed;
      }
      if (channel) channel->Close();
      if (activated) lifecycle_->Publish(LifecycleEvent::kDisconnected);

      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, retry_wait_, [&] { return closed_; })) return;
    }
  }

  const std::shared_ptr<ChannelFactory<ChannelT>> factory_;
  const Operation                                 execute_;
  const std::chrono::milliseconds                 retry_wait_;
  const std::string                               name_;

  const std::shared_ptr<discovery::stream::Broadcaster<LifecycleEvent>> lifecycle_;
  const std::shared_ptr<discovery::stream::Broadcaster<uint64_t>>       retry_begin_;

  std::mutex shutdown_mutex_;

  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  ConnectionState           state_  = ConnectionState::kIdle;
  bool                      closed_ = false;
  std::shared_ptr<ChannelT> channel_;
  std::thread               thread_;

  std::atomic<uint64_t> reconnect_attempts_{0};
  std::atomic<uint64_t> connects_{0};
};

template <typename ChannelT>
class RetryableConnectionFactory {
 public:
  RetryableConnectionFactory(std::shared_ptr<ChannelFactory<ChannelT>> channel_factory, std::chrono::milliseconds retry_wait)
      : channel_factory_(std::move(channel_factory)), retry_wait_(retry_wait) {
  }

  // A connection whose only work is re-running `execute_on_channel` on every
  // fresh channel.
  std::unique_ptr<RetryableConnection<ChannelT>> ZeroOpConnection(typename RetryableConnection<ChannelT>::Operation execute_on_channel,
                                                                  std::string                                       name) const {
    return std::make_unique<RetryableConnection<ChannelT>>(channel_factory_, std::move(execute_on_channel), retry_wait_, std::move(name));
  }

 private:
  std::shared_ptr<ChannelFactory<ChannelT>> channel_factory_;
  std::chrono::milliseconds                 retry_wait_;
};

} // namespace discovery::connection
