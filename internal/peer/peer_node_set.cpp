#include "peer_node_set.hpp"

#include <set>

#include "internal/observability/logging.hpp"

namespace discovery::peer {

using discovery::observability::DurationField;
using discovery::observability::IntField;
using discovery::observability::StringField;

PeerNodeSet::PeerNodeSet(std::shared_ptr<PeerClientFactory> factory, UrlResolver resolver, std::string self_address,
                         ReplicationOptions options, std::chrono::milliseconds reconcile_interval)
    : factory_(std::move(factory)),
      resolver_(std::move(resolver)),
      self_address_(std::move(self_address)),
      options_(options),
      reconcile_interval_(reconcile_interval),
      peers_(std::make_shared<const PeerList>()) {
}

PeerNodeSet::~PeerNodeSet() {
  Stop();
}

void PeerNodeSet::Start() {
  if (running_.exchange(true)) return;
  Reconcile();
  DISCOVERY_LOG_INFO("Peer node set started",
                     {IntField("peers", static_cast<int64_t>(Peers()->size())), DurationField("reconcile_interval", reconcile_interval_)});
  thread_ = std::thread(&PeerNodeSet::Loop, this);
}

void PeerNodeSet::Stop() {
  {
    std::lock_guard lock(loop_mutex_);
    running_ = false;
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(reconcile_mutex_);
  for (auto& [url, node] : nodes_) node->Stop();
  nodes_.clear();

  std::lock_guard peers_lock(peers_mutex_);
  peers_ = std::make_shared<const PeerList>();
}

void PeerNodeSet::Reconcile() {
  if (!running_) return;

  std::vector<std::string> urls;
  try {
    urls = resolver_();
  } catch (const std::exception& e) {
    DISCOVERY_LOG_WARN("Peer URL resolution failed; keeping current peers", {StringField("error", e.what())});
    return;
  }

  std::set<std::string> wanted;
  for (const auto& url : urls) {
    if (!url.empty() && url != self_address_) wanted.insert(url);
  }

  std::lock_guard lock(reconcile_mutex_);
  // Stop() clears running_ before taking reconcile_mutex_
  if (!running_) return;

  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (wanted.count(it->first) == 0) {
      DISCOVERY_LOG_INFO("Removing peer node", {StringField("peer", it->first)});
      it->second->Stop();
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }

  for (const auto& url : wanted) {
    if (nodes_.count(url) != 0) continue;
    auto node = std::make_shared<PeerNode>(factory_->Create(url), options_);
    node->Start();
    nodes_.emplace(url, std::move(node));
    DISCOVERY_LOG_INFO("Added peer node", {StringField("peer", url)});
  }

  auto next = std::make_shared<PeerList>();
  next->reserve(nodes_.size());
  for (const auto& [url, node] : nodes_) next->push_back(node);

  std::lock_guard peers_lock(peers_mutex_);
  peers_ = std::move(next);
}

std::shared_ptr<const PeerList> PeerNodeSet::Peers() const {
  std::lock_guard lock(peers_mutex_);
  return peers_;
}

void PeerNodeSet::Loop() {
  while (true) {
    {
      std::unique_lock lock(loop_mutex_);
      if (loop_cv_.wait_for(lock, reconcile_interval_, [&] { return !running_; })) return;
    }
    Reconcile();
  }
}

} // namespace discovery::peer
