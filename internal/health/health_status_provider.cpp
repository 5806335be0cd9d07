#include "health_status_provider.hpp"

#include "internal/util/time.hpp"

namespace discovery::health {

using namespace discovery::registry::v1;

namespace {

constexpr std::size_t kUpdateBuffer = 8;

int Rank(InstanceStatus status) {
  switch (status) {
    case INSTANCE_STATUS_STARTING:
      return 0;
    case INSTANCE_STATUS_UP:
      return 1;
    case INSTANCE_STATUS_DOWN:
      return 2;
    default:
      return -1;
  }
}

HealthStatusUpdate MakeUpdate(InstanceStatus status, const SubsystemDescriptor& descriptor) {
  HealthStatusUpdate update;
  update.set_status(status);
  *update.mutable_subsystem() = descriptor;
  *update.mutable_timestamp()  = discovery::util::ToProto(discovery::util::Now());
  return update;
}

} // namespace

SubsystemDescriptor MakeDescriptor(const std::string& name, const std::string& title, const std::string& description) {
  SubsystemDescriptor descriptor;
  descriptor.set_name(name);
  descriptor.set_title(title);
  descriptor.set_description(description);
  return descriptor;
}

HealthStatusProvider::HealthStatusProvider(InstanceStatus initial, SubsystemDescriptor descriptor)
    : descriptor_(std::move(descriptor)), current_(MakeUpdate(initial, descriptor_)) {
}

bool HealthStatusProvider::MoveHealthTo(InstanceStatus status) {
  std::lock_guard lock(mutex_);

  const int from = Rank(current_.status());
  const int to   = Rank(status);
  if (to < 0 || to <= from) return false;

  current_ = MakeUpdate(status, descriptor_);
  updates_.Publish(current_);
  if (status == INSTANCE_STATUS_DOWN) {
    updates_.Complete();
  }
  return true;
}

HealthStatusUpdate HealthStatusProvider::Current() const {
  std::lock_guard lock(mutex_);
  return current_;
}

std::shared_ptr<HealthStatusProvider::UpdatePipe> HealthStatusProvider::Subscribe() {
  std::lock_guard lock(mutex_);
  auto            pipe = std::make_shared<UpdatePipe>(kUpdateBuffer);
  pipe->Push(current_);
  updates_.Attach(pipe);
  return pipe;
}

HealthStream HealthStatusProvider::HealthStatus() {
  std::weak_ptr<HealthStatusProvider> weak = weak_from_this();
  return HealthStream([weak] {
    if (auto self = weak.lock()) return self->Subscribe();
    auto pipe = std::make_shared<UpdatePipe>(1);
    pipe->Complete();
    return pipe;
  });
}

} // namespace discovery::health
