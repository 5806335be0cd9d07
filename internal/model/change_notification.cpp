#include "change_notification.hpp"

#include "internal/util/errors.hpp"

namespace discovery::model {

using namespace discovery::registry::v1;

discovery::registry::v1::ChangeNotification ToProto(const InstanceNotification& notification) {
  discovery::registry::v1::ChangeNotification out;
  switch (notification.kind()) {
    case ChangeKind::kAdd:
      out.set_kind(CHANGE_KIND_ADD);
      break;
    case ChangeKind::kModify:
      out.set_kind(CHANGE_KIND_MODIFY);
      break;
    case ChangeKind::kDelete:
      out.set_kind(CHANGE_KIND_DELETE);
      break;
    case ChangeKind::kBufferSentinel:
      out.set_kind(CHANGE_KIND_BUFFER_SENTINEL);
      return out;
  }
  *out.mutable_instance() = notification.data();
  return out;
}

InstanceNotification FromProto(const discovery::registry::v1::ChangeNotification& notification) {
  switch (notification.kind()) {
    case CHANGE_KIND_ADD:
      return InstanceNotification::Add(notification.instance());
    case CHANGE_KIND_MODIFY:
      return InstanceNotification::Modify(notification.instance());
    case CHANGE_KIND_DELETE:
      return InstanceNotification::Delete(notification.instance());
    case CHANGE_KIND_BUFFER_SENTINEL:
      return InstanceNotification::BufferSentinel();
    default:
      throw discovery::util::InvalidState("change notification: unspecified kind");
  }
}

} // namespace discovery::model
