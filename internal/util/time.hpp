#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace discovery::util {

/*
  Wall clock helpers and protobuf Timestamp/Duration conversions.
  Lease arithmetic and last-updated stamps all go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(std::chrono::milliseconds d);
std::chrono::milliseconds  FromProto(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace discovery::util
