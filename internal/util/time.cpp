#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <string>

#include "errors.hpp"

namespace healthstore::util {

namespace {

using google::protobuf::util::TimeUtil;

constexpr int64_t kMinMillis = TimeUtil::kTimestampMinSeconds * 1000;
constexpr int64_t kMaxMillis = TimeUtil::kTimestampMaxSeconds * 1000 + 999;

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t NowMillis() {
  return ToUnixMillis(Now());
}

int64_t TimestampToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < TimeUtil::kTimestampMinSeconds || ts.seconds() > TimeUtil::kTimestampMaxSeconds || ts.nanos() < 0 ||
      ts.nanos() > 999'999'999) {
    throw ValidationError("timestamp out of range: seconds=" + std::to_string(ts.seconds()) + " nanos=" + std::to_string(ts.nanos()));
  }
  return TimeUtil::TimestampToMilliseconds(ts);
}

google::protobuf::Timestamp MillisToTimestamp(int64_t ms) {
  if (ms < kMinMillis || ms > kMaxMillis) {
    throw ValidationError("epoch millis out of timestamp range: " + std::to_string(ms));
  }
  return TimeUtil::MillisecondsToTimestamp(ms);
}

} // namespace healthstore::util
