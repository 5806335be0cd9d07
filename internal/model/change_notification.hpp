#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/notification.pb.h"

namespace discovery::model {

enum class ChangeKind : std::uint8_t {
  kAdd            = 1,
  kModify         = 2,
  kDelete         = 3,
  kBufferSentinel = 4,
};

constexpr std::string_view ToString(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kAdd:
      return "add";
    case ChangeKind::kModify:
      return "modify";
    case ChangeKind::kDelete:
      return "delete";
    case ChangeKind::kBufferSentinel:
    default:
      return "buffer_sentinel";
  }
}

/*
  A single change of a registry entry.

  BufferSentinel carries no data; it marks the end of the initial batch of a
  subscription and is delivered once per subscription.
*/
template <typename T>
class ChangeNotification {
 public:
  static ChangeNotification Add(T data) {
    return ChangeNotification(ChangeKind::kAdd, std::move(data));
  }

  static ChangeNotification Modify(T data) {
    return ChangeNotification(ChangeKind::kModify, std::move(data));
  }

  static ChangeNotification Delete(T data) {
    return ChangeNotification(ChangeKind::kDelete, std::move(data));
  }

  static ChangeNotification BufferSentinel() {
    return ChangeNotification(ChangeKind::kBufferSentinel, std::nullopt);
  }

  ChangeKind kind() const {
    return kind_;
  }

  bool IsBufferSentinel() const {
    return kind_ == ChangeKind::kBufferSentinel;
  }

  bool HasData() const {
    return data_.has_value();
  }

  const T& data() const {
    if (!data_) {
      throw std::logic_error("buffer sentinel carries no data");
    }
    return *data_;
  }

 private:
  ChangeNotification(ChangeKind kind, std::optional<T> data) : kind_(kind), data_(std::move(data)) {
  }

  ChangeKind       kind_;
  std::optional<T> data_;
};

using InstanceNotification = ChangeNotification<discovery::registry::v1::InstanceInfo>;

discovery::registry::v1::ChangeNotification ToProto(const InstanceNotification& notification);
InstanceNotification                        FromProto(const discovery::registry::v1::ChangeNotification& notification);

} // namespace discovery::model
