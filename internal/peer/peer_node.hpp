#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/replication.pb.h"
#include "internal/peer/peer_client.hpp"

namespace discovery::peer {

struct ReplicationOptions {
  uint32_t                  max_retries    = 3;
  std::chrono::milliseconds backoff        = std::chrono::seconds(1);
  std::size_t               queue_capacity = 10000;
};

/*
  Proxy for one remote registry node.

  Replication requests are queued and delivered by a dedicated worker, so
  the mutating caller never waits for the peer and a slow peer only delays
  its own queue. A failed delivery is retried up to max_retries times with
  a fixed backoff, then dropped with a warning.
*/
class PeerNode {
 public:
  PeerNode(std::shared_ptr<PeerClient> client, ReplicationOptions options);
  ~PeerNode();

  PeerNode(const PeerNode&)            = delete;
  PeerNode& operator=(const PeerNode&) = delete;

  void Start();
  void Stop();

  // Never blocks. Returns false when the queue is full or the node stopped.
  bool Enqueue(discovery::registry::v1::ReplicationRequest request);

  std::vector<discovery::registry::v1::InstanceInfo> FetchSnapshot();

  // Blocks until the queue is empty and no delivery is in flight.
  bool WaitIdle(std::chrono::milliseconds timeout);

  const std::string& address() const {
    return client_->address();
  }

  uint64_t Delivered() const {
    return delivered_;
  }

  uint64_t Dropped() const {
    return dropped_;
  }

  uint64_t FailedAttempts() const {
    return failed_attempts_;
  }

 private:
  void Run();
  void Deliver(discovery::registry::v1::ReplicationRequest request);
  bool WaitBackoff();

  std::shared_ptr<PeerClient> client_;
  const ReplicationOptions    options_;

  std::mutex                                              mutex_;
  std::condition_variable                                 cv_;
  std::condition_variable                                 idle_cv_;
  std::deque<discovery::registry::v1::ReplicationRequest> queue_;
  bool                                                    in_flight_ = false;
  bool                                                    stopping_  = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> failed_attempts_{0};
};

} // namespace discovery::peer
