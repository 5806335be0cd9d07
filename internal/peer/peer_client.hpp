#pragma once

#include <memory>
#include <string>
#include <vector>

#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/replication.pb.h"

namespace discovery::peer {

/*
  Transport to one remote registry node.

  Calls are bounded by a deadline. Failures surface as exceptions:
  NotFound when the remote does not know the instance, PeerUnavailable for
  anything transport-related (including timeouts).
*/
class PeerClient {
 public:
  virtual ~PeerClient() = default;

  virtual std::vector<discovery::registry::v1::InstanceInfo> FetchSnapshot() = 0;

  virtual void Replicate(const discovery::registry::v1::ReplicationRequest& request) = 0;

  virtual const std::string& address() const = 0;
};

class PeerClientFactory {
 public:
  virtual ~PeerClientFactory() = default;

  virtual std::shared_ptr<PeerClient> Create(const std::string& address) = 0;
};

} // namespace discovery::peer
