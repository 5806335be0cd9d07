#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>

#include "internal/connection/channel.hpp"
#include "internal/connection/retryable_connection.hpp"
#include "internal/health/health_status_provider.hpp"
#include "internal/model/interest.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::interest {

/*
  Interest client with a single full-registry subscription.

  The channel is always subscribed to the whole registry, which the channel
  writes into the local store. ForInterest() therefore filters the local
  store; client interests are never sent over the channel.

  Health is STARTING until the first BufferSentinel of the local full
  registry stream has been seen (the initial upload is complete), then UP,
  and DOWN after Shutdown().
*/
class InterestClient {
 public:
  using Connection = discovery::connection::RetryableConnection<discovery::connection::InterestChannel>;

  static constexpr std::chrono::milliseconds kDefaultRetryWait{500};

  InterestClient(std::shared_ptr<discovery::store::RegistryStore>               registry,
                 std::shared_ptr<discovery::connection::InterestChannelFactory> channel_factory,
                 std::chrono::milliseconds                                      retry_wait = kDefaultRetryWait);
  ~InterestClient();

  InterestClient(const InterestClient&)            = delete;
  InterestClient& operator=(const InterestClient&) = delete;

  // Throws InvalidState once the client has shut down.
  discovery::store::InstanceStream ForInterest(const discovery::model::Interest& interest);

  void Shutdown();
  bool IsShutdown() const;

  discovery::health::HealthStream                          HealthStatus();
  std::shared_ptr<discovery::health::HealthStatusProvider> health() const {
    return health_;
  }

  bool    IsBootstrapped() const;
  int64_t BootstrapCount() const;

  const Connection& connection() const {
    return *retryable_connection_;
  }

 private:
  using ProbeSubscription = discovery::stream::Subscription<discovery::model::InstanceNotification>;

  void BootstrapUploadSubscribe();
  void RunBootstrapProbe();

  std::shared_ptr<discovery::store::RegistryStore>         registry_;
  std::shared_ptr<discovery::health::HealthStatusProvider> health_;
  std::unique_ptr<Connection>                              retryable_connection_;

  // Shared by ForInterest, exclusive by Shutdown: no stream is handed out
  // once the shutdown flag is visible.
  mutable std::shared_mutex shutdown_mutex_;
  std::atomic<bool>         is_shutdown_{false};

  std::mutex                         probe_mutex_;
  std::shared_ptr<ProbeSubscription> probe_;
  std::thread                        probe_thread_;
  std::atomic<int64_t>               bootstrap_count_{0};
  std::atomic<bool>                  bootstrapped_{false};
};

} // namespace discovery::interest
