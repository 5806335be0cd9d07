#include "interest_client.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace discovery::interest {

using discovery::registry::v1::INSTANCE_STATUS_DOWN;
using discovery::registry::v1::INSTANCE_STATUS_STARTING;
using discovery::registry::v1::INSTANCE_STATUS_UP;

namespace {

discovery::registry::v1::SubsystemDescriptor Descriptor() {
  return discovery::health::MakeDescriptor("InterestClient", "Read server full fetch InterestClient",
                                           "Source of registry data for read server clients.");
}

} // namespace

InterestClient::InterestClient(std::shared_ptr<discovery::store::RegistryStore>               registry,
                               std::shared_ptr<discovery::connection::InterestChannelFactory> channel_factory,
                               std::chrono::milliseconds                                      retry_wait)
    : registry_(std::move(registry)),
      health_(std::make_shared<discovery::health::HealthStatusProvider>(INSTANCE_STATUS_STARTING, Descriptor())) {
  discovery::connection::RetryableConnectionFactory<discovery::connection::InterestChannel> factory(std::move(channel_factory), retry_wait);

  const auto full_registry = discovery::model::interests::ForFullRegistry();
  retryable_connection_    = factory.ZeroOpConnection(
      [full_registry](discovery::connection::InterestChannel& channel) { channel.ChangeInterest(full_registry); }, "interest-client");

  retryable_connection_->Start();
  BootstrapUploadSubscribe();
}

InterestClient::~InterestClient() {
  Shutdown();
}

discovery::store::InstanceStream InterestClient::ForInterest(const discovery::model::Interest& interest) {
  std::shared_lock lock(shutdown_mutex_);
  if (is_shutdown_) {
    throw discovery::util::InvalidState("InterestClient has shut down");
  }
  return registry_->Query(interest);
}

void InterestClient::Shutdown() {
  {
    std::unique_lock lock(shutdown_mutex_);
    if (is_shutdown_) return;
    is_shutdown_ = true;
  }

  health_->MoveHealthTo(INSTANCE_STATUS_DOWN);

  {
    std::lock_guard lock(probe_mutex_);
    if (probe_) probe_->Cancel();
  }
  if (probe_thread_.joinable()) probe_thread_.join();

  retryable_connection_->Shutdown();
  DISCOVERY_LOG_INFO("InterestClient shut down");
}

bool InterestClient::IsShutdown() const {
  return is_shutdown_;
}

discovery::health::HealthStream InterestClient::HealthStatus() {
  return health_->HealthStatus();
}

bool InterestClient::IsBootstrapped() const {
  return bootstrapped_;
}

int64_t InterestClient::BootstrapCount() const {
  return bootstrap_count_;
}

// ------------------------------------------------------------
// Bootstrap probe
// ------------------------------------------------------------

// The read server is ready once the initial batch of data has been uploaded
// from the remote registry.
void InterestClient::BootstrapUploadSubscribe() {
  {
    std::lock_guard lock(probe_mutex_);
    probe_ = std::make_shared<ProbeSubscription>(ForInterest(discovery::model::interests::ForFullRegistry()).Subscribe());
  }
  probe_thread_ = std::thread(&InterestClient::RunBootstrapProbe, this);
}

void InterestClient::RunBootstrapProbe() {
  while (!is_shutdown_) {
    std::shared_ptr<ProbeSubscription> probe;
    {
      std::lock_guard lock(probe_mutex_);
      probe = probe_;
    }

    int64_t count = 0;
    try {
      while (auto notification = probe->Next()) {
        if (notification->IsBufferSentinel()) {
          probe->Cancel();
          bootstrap_count_ = count;
          bootstrapped_    = true;
          if (health_->MoveHealthTo(INSTANCE_STATUS_UP)) {
            DISCOVERY_LOG_INFO("Initial bootstrap completed", {discovery::observability::IntField("instances", count)});
          }
          return;
        }
        ++count;
      }
      // cancelled by Shutdown()
      return;
    } catch (const std::exception& e) {
      DISCOVERY_LOG_WARN("Bootstrap probe subscription failed; resubscribing", {discovery::observability::StringField("error", e.what())});
    }

    std::lock_guard lock(probe_mutex_);
    if (is_shutdown_) return;
    probe_ = std::make_shared<ProbeSubscription>(registry_->Query(discovery::model::interests::ForFullRegistry()).Subscribe());
  }
}

} // namespace discovery::interest
