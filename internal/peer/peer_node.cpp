#include "peer_node.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace discovery::peer {

using namespace discovery::registry::v1;
using discovery::observability::DurationField;
using discovery::observability::IntField;
using discovery::observability::StringField;

PeerNode::PeerNode(std::shared_ptr<PeerClient> client, ReplicationOptions options) : client_(std::move(client)), options_(options) {
}

PeerNode::~PeerNode() {
  Stop();
}

void PeerNode::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeerNode::Run, this);
}

void PeerNode::Stop() {
  std::size_t abandoned = 0;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    abandoned = queue_.size();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;

  if (abandoned > 0) {
    DISCOVERY_LOG_WARN("Peer node stopped with pending replication tasks",
                       {StringField("peer", address()), IntField("abandoned", static_cast<int64_t>(abandoned))});
  }
}

bool PeerNode::Enqueue(ReplicationRequest request) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return false;
    if (queue_.size() >= options_.queue_capacity) {
      ++dropped_;
      DISCOVERY_LOG_WARN("Replication queue full; dropping task",
                         {StringField("peer", address()), StringField("instance", request.instance().id()),
                          StringField("action", ReplicationAction_Name(request.action()))});
      return false;
    }
    queue_.push_back(std::move(request));
  }
  cv_.notify_all();
  return true;
}

std::vector<InstanceInfo> PeerNode::FetchSnapshot() {
  return client_->FetchSnapshot();
}

bool PeerNode::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return queue_.empty() && !in_flight_; });
}

void PeerNode::Run() {
  while (true) {
    ReplicationRequest request;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;

      request = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = true;
    }

    Deliver(std::move(request));

    {
      std::lock_guard lock(mutex_);
      in_flight_ = false;
    }
    idle_cv_.notify_all();
  }
}

// Waits out the backoff; false when the node is stopping.
bool PeerNode::WaitBackoff() {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, options_.backoff, [&] { return stopping_; });
}

void PeerNode::Deliver(ReplicationRequest request) {
  uint32_t attempt = 0;

  while (true) {
    try {
      client_->Replicate(request);
      ++delivered_;
      return;
    } catch (const discovery::util::NotFound&) {
      if (request.action() == REPLICATION_ACTION_HEARTBEAT) {
        // the peer lost or has an outdated copy: send the full registration instead
        request.set_action(REPLICATION_ACTION_REGISTER);
        attempt = 0;
        continue;
      }
      DISCOVERY_LOG_WARN("Peer does not know instance; dropping replication",
                         {StringField("peer", address()), StringField("instance", request.instance().id()),
                          StringField("action", ReplicationAction_Name(request.action()))});
      ++dropped_;
      return;
    } catch (const std::exception& e) {
      ++failed_attempts_;
      if (attempt >= options_.max_retries) {
        DISCOVERY_LOG_WARN("Replication failed; giving up",
                           {StringField("peer", address()), StringField("instance", request.instance().id()),
                            StringField("action", ReplicationAction_Name(request.action())),
                            IntField("attempts", static_cast<int64_t>(attempt) + 1), DurationField("backoff", options_.backoff),
                            StringField("error", e.what())});
        ++dropped_;
        return;
      }
    }

    ++attempt;
    if (!WaitBackoff()) {
      ++dropped_;
      return;
    }
  }
}

} // namespace discovery::peer
