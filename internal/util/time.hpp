#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace tierbridge::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
uint64_t  ToUnixMillis(const google::protobuf::Timestamp& ts);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

} // namespace tierbridge::util
