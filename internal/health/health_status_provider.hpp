#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "discovery/registry/v1/health.pb.h"
#include "internal/stream/broadcaster.hpp"
#include "internal/stream/stream.hpp"

namespace discovery::health {

using HealthStream = discovery::stream::Stream<discovery::registry::v1::HealthStatusUpdate>;

/*
  Readiness signal of one subsystem.

  Moves only forward along STARTING -> UP -> DOWN; DOWN is terminal.
  HealthStatus() replays the current update to each new subscriber and
  completes once DOWN has been delivered.

  Must be owned by a shared_ptr.
*/
class HealthStatusProvider : public std::enable_shared_from_this<HealthStatusProvider> {
 public:
  HealthStatusProvider(discovery::registry::v1::InstanceStatus     initial,
                       discovery::registry::v1::SubsystemDescriptor descriptor);

  // Returns false when the move is not a forward transition.
  bool MoveHealthTo(discovery::registry::v1::InstanceStatus status);

  discovery::registry::v1::HealthStatusUpdate Current() const;
  HealthStream                                HealthStatus();

  const discovery::registry::v1::SubsystemDescriptor& descriptor() const {
    return descriptor_;
  }

 private:
  using UpdatePipe = discovery::stream::Pipe<discovery::registry::v1::HealthStatusUpdate>;

  std::shared_ptr<UpdatePipe> Subscribe();

  const discovery::registry::v1::SubsystemDescriptor descriptor_;

  mutable std::mutex                                                          mutex_;
  discovery::registry::v1::HealthStatusUpdate                                 current_;
  discovery::stream::Broadcaster<discovery::registry::v1::HealthStatusUpdate> updates_;
};

discovery::registry::v1::SubsystemDescriptor MakeDescriptor(const std::string& name, const std::string& title,
                                                            const std::string& description);

} // namespace discovery::health
