#pragma once

#include <cstdint>
#include <string_view>

namespace healthstore::model {

// Persisted as its numeric value.
enum class MigrationPhase : std::uint8_t {
  kIdle       = 0,
  kInProgress = 1,
  kComplete   = 2,
  kError      = 3,  // module upgrade required before migrating
};

constexpr bool CanTransition(MigrationPhase from, MigrationPhase to) {
  switch (from) {
    case MigrationPhase::kIdle:
      return to == MigrationPhase::kInProgress || to == MigrationPhase::kError;
    case MigrationPhase::kInProgress:
      return to == MigrationPhase::kComplete || to == MigrationPhase::kIdle;
    case MigrationPhase::kComplete:
      return to == MigrationPhase::kIdle;
    case MigrationPhase::kError:
      return to == MigrationPhase::kIdle;
  }
  return false;
}

constexpr std::string_view PhaseName(MigrationPhase phase) {
  switch (phase) {
    case MigrationPhase::kIdle:
      return "IDLE";
    case MigrationPhase::kInProgress:
      return "IN_PROGRESS";
    case MigrationPhase::kComplete:
      return "COMPLETE";
    case MigrationPhase::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

struct MigrationState {
  MigrationPhase phase                     = MigrationPhase::kIdle;
  std::int32_t   min_sdk_extension_version = 0;
};

} // namespace healthstore::model
