#include "interest_server.hpp"

#include <optional>

#include "grpc_error.hpp"
#include "internal/model/change_notification.hpp"
#include "internal/observability/logging.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;
using discovery::model::InstanceNotification;
using discovery::observability::StringField;
using discovery::stream::PollStatus;

InterestServer::InterestServer(QueryFn query, std::chrono::milliseconds poll_interval)
    : query_(std::move(query)), poll_interval_(poll_interval) {
}

::grpc::Status InterestServer::Subscribe(::grpc::ServerContext* ctx, const Interest* req, ::grpc::ServerWriter<ChangeNotification>* writer) {
  try {
    auto subscription = query_(*req).Subscribe();

    // lets the client's ChangeInterest() return before the first notification
    writer->SendInitialMetadata();
    DISCOVERY_LOG_INFO("Interest subscription opened", {StringField("peer", ctx->peer()), StringField("interest", discovery::model::Describe(*req))});

    std::optional<InstanceNotification> notification;
    while (!ctx->IsCancelled()) {
      notification.reset();
      const auto status = subscription.Poll(&notification, poll_interval_);
      if (status == PollStatus::kTimeout) continue;
      if (status == PollStatus::kCompleted) return ::grpc::Status::OK;

      if (!writer->Write(discovery::model::ToProto(*notification))) {
        // client went away
        return ::grpc::Status::OK;
      }
    }
    return {::grpc::StatusCode::CANCELLED, "subscription cancelled by client"};
  } catch (const std::exception& e) {
    DISCOVERY_LOG_WARN("Interest subscription failed", {StringField("peer", ctx->peer()), StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace discovery::grpc
