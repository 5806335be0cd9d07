#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/peer/peer_client.hpp"
#include "internal/peer/peer_node.hpp"

namespace discovery::peer {

using PeerList    = std::vector<std::shared_ptr<PeerNode>>;
using UrlResolver = std::function<std::vector<std::string>()>;

/*
  The set of remote registry nodes this node replicates to.

  Membership comes from a resolver and is reconciled periodically: new URLs
  get a started PeerNode, vanished URLs have theirs stopped. The node's own
  URL is never a member. Readers take an immutable snapshot via Peers(), so
  a fan-out in progress is not disturbed by a concurrent reconcile.
*/
class PeerNodeSet {
 public:
  PeerNodeSet(std::shared_ptr<PeerClientFactory> factory, UrlResolver resolver, std::string self_address,
              ReplicationOptions options, std::chrono::milliseconds reconcile_interval);
  ~PeerNodeSet();

  PeerNodeSet(const PeerNodeSet&)            = delete;
  PeerNodeSet& operator=(const PeerNodeSet&) = delete;

  // Reconciles once synchronously, then keeps reconciling in the background.
  void Start();
  void Stop();

  // No-op unless started; never spawns peer workers after Stop().
  void Reconcile();

  std::shared_ptr<const PeerList> Peers() const;

 private:
  void Loop();

  std::shared_ptr<PeerClientFactory> factory_;
  UrlResolver                        resolver_;
  const std::string                  self_address_;
  const ReplicationOptions           options_;
  const std::chrono::milliseconds    reconcile_interval_;

  std::mutex                                       reconcile_mutex_;
  std::map<std::string, std::shared_ptr<PeerNode>> nodes_;

  mutable std::mutex              peers_mutex_;
  std::shared_ptr<const PeerList> peers_;

  std::mutex              loop_mutex_;
  std::condition_variable loop_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace discovery::peer
