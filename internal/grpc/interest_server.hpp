#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <functional>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/model/interest.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::grpc {

/*
  Streams the change notifications matching a client interest.

  Serves either a write node's registry or a read node's local replica,
  depending on the query function it is given. The stream stays open until
  the client cancels, the source completes, or the server shuts down.
*/
class InterestServer final : public discovery::registry::v1::InterestService::Service {
 public:
  using QueryFn = std::function<discovery::store::InstanceStream(const discovery::model::Interest&)>;

  explicit InterestServer(QueryFn query, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

  ::grpc::Status Subscribe(::grpc::ServerContext*, const discovery::registry::v1::Interest*,
                           ::grpc::ServerWriter<discovery::registry::v1::ChangeNotification>*) override;

 private:
  QueryFn                         query_;
  const std::chrono::milliseconds poll_interval_;
};

} // namespace discovery::grpc
