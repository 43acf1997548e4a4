#include "record.hpp"

#include <type_traits>

#include "internal/util/errors.hpp"

namespace healthstore::model {

IntervalTime IntervalTime::Create(std::int64_t start_ms, std::int32_t start_zone_offset_seconds, std::int64_t end_ms,
                                  std::int32_t end_zone_offset_seconds) {
  if (end_ms <= start_ms) {
    throw util::ValidationError("end time needs to be after start time. start=" + std::to_string(start_ms) +
                                " end=" + std::to_string(end_ms));
  }
  return IntervalTime(start_ms, start_zone_offset_seconds, end_ms, end_zone_offset_seconds);
}

RecordType TypeOf(const Record& record) {
  return std::visit([](const auto& r) { return std::decay_t<decltype(r)>::kRecordType; }, record);
}

RecordMetadata& MetadataOf(Record& record) {
  return std::visit([](auto& r) -> RecordMetadata& { return r.metadata; }, record);
}

const RecordMetadata& MetadataOf(const Record& record) {
  return std::visit([](const auto& r) -> const RecordMetadata& { return r.metadata; }, record);
}

std::int64_t StartTimeOf(const Record& record) {
  return std::visit(
      [](const auto& r) -> std::int64_t {
        if constexpr (requires { r.time.time_ms; }) {
          return r.time.time_ms;
        } else {
          return r.interval.StartTimeMs();
        }
      },
      record);
}

} // namespace healthstore::model
