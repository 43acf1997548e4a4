#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace healthstore::util {

/*
  Time utilities. Single place to control the clock source.

  Stored times are epoch milliseconds. Conversions to and from
  google.protobuf.Timestamp are limited to the range that type allows
  (0001-01-01 to 9999-12-31) and throw ValidationError outside it.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

int64_t                     TimestampToMillis(const google::protobuf::Timestamp& ts);
google::protobuf::Timestamp MillisToTimestamp(int64_t ms);

} // namespace healthstore::util
