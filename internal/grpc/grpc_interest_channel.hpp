#pragma once

#include <grpcpp/grpcpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "discovery/registry/v1/services.grpc.pb.h"
#include "internal/connection/channel.hpp"
#include "internal/store/registry_store.hpp"

namespace discovery::grpc {

/*
  Interest channel over one InterestService.Subscribe call.

  A reader thread applies every received notification to the local store
  through a ChannelFeed. The session ends when the server closes the stream,
  the transport fails, or Close() cancels the call.
*/
class GrpcInterestChannel final : public discovery::connection::InterestChannel {
 public:
  GrpcInterestChannel(std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<discovery::store::RegistryStore> store);
  ~GrpcInterestChannel() override;

  void ChangeInterest(const discovery::model::Interest& interest) override;
  void AwaitTermination() override;
  void Close() override;

  discovery::connection::ChannelState State() const override;

 private:
  using Reader = ::grpc::ClientReader<discovery::registry::v1::ChangeNotification>;

  void ReadLoop();
  void Terminate(::grpc::Status status);

  std::unique_ptr<discovery::registry::v1::InterestService::Stub> stub_;
  std::shared_ptr<discovery::store::RegistryStore>                store_;

  mutable std::mutex                     mutex_;
  std::condition_variable                terminated_cv_;
  discovery::connection::ChannelState    state_ = discovery::connection::ChannelState::kIdle;
  std::unique_ptr<::grpc::ClientContext> ctx_;
  std::unique_ptr<Reader>                reader_;
  std::optional<::grpc::Status>          final_status_;
  bool                                   closed_ = false;
  std::thread                            reader_thread_;
};

class GrpcInterestChannelFactory final : public discovery::connection::InterestChannelFactory {
 public:
  GrpcInterestChannelFactory(std::string address, std::shared_ptr<discovery::store::RegistryStore> store);

  std::shared_ptr<discovery::connection::InterestChannel> NewChannel() override;

 private:
  std::shared_ptr<::grpc::Channel>                 channel_;
  std::shared_ptr<discovery::store::RegistryStore> store_;
};

} // namespace discovery::grpc
