#include "registration_server.hpp"

#include "grpc_error.hpp"

namespace discovery::grpc {

using namespace discovery::registry::v1;

RegistrationServer::RegistrationServer(std::shared_ptr<discovery::registry::PeerAwareRegistry> registry) : registry_(std::move(registry)) {
}

::grpc::Status RegistrationServer::Register(::grpc::ServerContext*, const RegisterRequest* req, google::protobuf::Empty*) {
  try {
    registry_->Register(req->instance());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistrationServer::Renew(::grpc::ServerContext*, const RenewRequest* req, google::protobuf::Empty*) {
  try {
    registry_->Renew(req->app_name(), req->instance_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistrationServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, google::protobuf::Empty*) {
  try {
    registry_->Cancel(req->app_name(), req->instance_id());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistrationServer::UpdateStatus(::grpc::ServerContext*, const UpdateStatusRequest* req, google::protobuf::Empty*) {
  try {
    registry_->UpdateStatus(req->app_name(), req->instance_id(), req->status());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace discovery::grpc
