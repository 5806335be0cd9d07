#include "grpc_interest_channel.hpp"

#include "grpc_error.hpp"
#include "internal/interest/channel_feed.hpp"
#include "internal/model/change_notification.hpp"
#include "internal/observability/logging.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;
using discovery::connection::ChannelState;
using discovery::observability::IntField;
using discovery::observability::StringField;

GrpcInterestChannel::GrpcInterestChannel(std::shared_ptr<::grpc::Channel> channel, std::shared_ptr<discovery::store::RegistryStore> store)
    : stub_(InterestService::NewStub(std::move(channel))), store_(std::move(store)) {
}

GrpcInterestChannel::~GrpcInterestChannel() {
  Close();
  if (reader_thread_.joinable()) reader_thread_.join();
}

void GrpcInterestChannel::ChangeInterest(const discovery::model::Interest& interest) {
  Reader* reader = nullptr;
  {
    std::lock_guard lock(mutex_);
    if (closed_) throw discovery::util::ConnectionClosed("interest channel is closed");
    if (reader_) throw discovery::util::InvalidState("interest channel already subscribed");

    ctx_    = std::make_unique<::grpc::ClientContext>();
    reader_ = stub_->Subscribe(ctx_.get(), interest);
    reader  = reader_.get();
  }

  // returns once the server accepted the subscription, or the call ended
  reader->WaitForInitialMetadata();

  std::lock_guard lock(mutex_);
  if (closed_) throw discovery::util::ConnectionClosed("interest channel closed while subscribing");
  state_         = ChannelState::kConnected;
  reader_thread_ = std::thread(&GrpcInterestChannel::ReadLoop, this);
}

void GrpcInterestChannel::ReadLoop() {
  discovery::interest::ChannelFeed feed(store_);
  ChangeNotification               message;
  int64_t                          received = 0;

  try {
    while (reader_->Read(&message)) {
      feed.Apply(discovery::model::FromProto(message));
      ++received;
    }
  } catch (const std::exception& e) {
    DISCOVERY_LOG_ERROR("Dropping interest session after a bad notification", {StringField("error", e.what())});
    ctx_->TryCancel();
    while (reader_->Read(&message)) {
    }
  }

  auto status = reader_->Finish();
  DISCOVERY_LOG_INFO("Interest session ended",
                     {IntField("notifications", received), IntField("code", static_cast<int64_t>(status.error_code())),
                      StringField("message", status.error_message())});
  Terminate(std::move(status));
}

void GrpcInterestChannel::Terminate(::grpc::Status status) {
  {
    std::lock_guard lock(mutex_);
    final_status_ = std::move(status);
    state_        = ChannelState::kClosed;
  }
  terminated_cv_.notify_all();
}

void GrpcInterestChannel::AwaitTermination() {
  std::unique_lock lock(mutex_);
  terminated_cv_.wait(lock, [&] { return closed_ || final_status_.has_value(); });

  if (closed_ || !final_status_ || final_status_->ok()) return;
  ThrowIfError(*final_status_, "interest subscription");
}

void GrpcInterestChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    state_  = ChannelState::kClosed;
    if (ctx_) ctx_->TryCancel();
  }
  terminated_cv_.notify_all();
}

ChannelState GrpcInterestChannel::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

GrpcInterestChannelFactory::GrpcInterestChannelFactory(std::string address, std::shared_ptr<discovery::store::RegistryStore> store)
    : channel_(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials())), store_(std::move(store)) {
}

std::shared_ptr<discovery::connection::InterestChannel> GrpcInterestChannelFactory::NewChannel() {
  return std::make_shared<GrpcInterestChannel>(channel_, store_);
}

} // namespace discovery::grpc
