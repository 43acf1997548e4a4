#include "migration_state_manager.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::migration {

using model::MigrationPhase;
using storage::PreferenceHelper;

namespace {

std::int32_t ParseStoredInt(const std::string& value, std::string_view key) {
  try {
    std::size_t consumed = 0;
    const int   parsed   = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw util::InternalError("stored preference " + std::string(key) + " is not an integer: '" + value + "'");
  }
}

MigrationPhase ParseStoredPhase(const std::string& value) {
  const auto raw = ParseStoredInt(value, PreferenceHelper::kMigrationPhaseKey);
  if (raw < 0 || raw > static_cast<int>(MigrationPhase::kError)) {
    throw util::InternalError("stored migration phase " + value + " is unknown");
  }
  return static_cast<MigrationPhase>(raw);
}

} // namespace

MigrationStateManager::MigrationStateManager(std::shared_ptr<storage::DatabaseHelpers> helpers, std::int32_t module_sdk_extension_version)
    : helpers_(std::move(helpers)), module_sdk_extension_version_(module_sdk_extension_version) {
}

void MigrationStateManager::LoadState() {
  std::lock_guard lock(mutex_);
  helpers_->transactions->RunAsReadTransaction([&](db::Transaction& tx) {
    if (auto phase = helpers_->preferences->GetPreference(tx, PreferenceHelper::kMigrationPhaseKey)) {
      phase_.store(ParseStoredPhase(*phase), std::memory_order_release);
    }
    if (auto version = helpers_->preferences->GetPreference(tx, PreferenceHelper::kMinSdkExtensionVersionKey)) {
      min_sdk_extension_version_.store(ParseStoredInt(*version, PreferenceHelper::kMinSdkExtensionVersionKey));
    }
  });

  HEALTHSTORE_LOG_INFO("Migration state loaded", {observability::StringField("phase", model::PhaseName(GetPhase())),
                                                  observability::IntField("min_sdk_extension_version", min_sdk_extension_version_.load())});
}

model::MigrationState MigrationStateManager::GetState() const {
  return {GetPhase(), min_sdk_extension_version_.load()};
}

void MigrationStateManager::EnsureNotInProgress() const {
  if (GetPhase() == MigrationPhase::kInProgress) {
    throw util::MigrationInProgress("data migration is in progress; api calls are blocked until it finishes");
  }
}

void MigrationStateManager::EnsureInProgress() const {
  const auto phase = GetPhase();
  if (phase != MigrationPhase::kInProgress) {
    throw util::InvalidState("migration is not in progress (phase " + std::string(model::PhaseName(phase)) + ")");
  }
}

void MigrationStateManager::Transition(MigrationPhase to, const std::function<void(db::Transaction&)>& in_transaction) {
  const auto from = GetPhase();
  if (!model::CanTransition(from, to)) {
    throw util::InvalidState("cannot move migration from " + std::string(model::PhaseName(from)) + " to " + std::string(model::PhaseName(to)));
  }

  try {
    helpers_->transactions->RunAsTransaction([&](db::Transaction& tx) {
      if (in_transaction) {
        in_transaction(tx);
      }
      helpers_->preferences->InsertOrReplacePreference(tx, PreferenceHelper::kMigrationPhaseKey, std::to_string(static_cast<int>(to)));
      phase_.store(to, std::memory_order_release);
    });
  } catch (...) {
    phase_.store(from, std::memory_order_release);
    throw;
  }

  HEALTHSTORE_LOG_INFO("Migration phase changed",
                       {observability::StringField("from", model::PhaseName(from)), observability::StringField("to", model::PhaseName(to))});
}

void MigrationStateManager::StartMigration() {
  std::lock_guard lock(mutex_);
  if (GetPhase() != MigrationPhase::kIdle) {
    throw util::InvalidState("cannot start migration in phase " + std::string(model::PhaseName(GetPhase())));
  }
  Transition(MigrationPhase::kInProgress, {});
}

void MigrationStateManager::FinishMigration(const std::function<void(db::Transaction&)>& finalize) {
  std::lock_guard lock(mutex_);
  if (GetPhase() == MigrationPhase::kComplete) {
    return;
  }
  if (GetPhase() != MigrationPhase::kInProgress) {
    throw util::InvalidState("cannot finish migration in phase " + std::string(model::PhaseName(GetPhase())));
  }
  Transition(MigrationPhase::kComplete, finalize);
}

void MigrationStateManager::AbortMigration() {
  std::lock_guard lock(mutex_);
  if (GetPhase() != MigrationPhase::kInProgress) {
    throw util::InvalidState("cannot abort migration in phase " + std::string(model::PhaseName(GetPhase())));
  }
  Transition(MigrationPhase::kIdle, {});
}

void MigrationStateManager::ResetMigrationState() {
  std::lock_guard lock(mutex_);
  const auto phase = GetPhase();
  if (phase == MigrationPhase::kIdle) {
    return;
  }
  if (phase == MigrationPhase::kInProgress) {
    throw util::InvalidState("cannot reset a migration in progress; abort it instead");
  }
  Transition(MigrationPhase::kIdle, {});
}

void MigrationStateManager::InsertMinDataMigrationSdkExtensionVersion(std::int32_t version) {
  std::lock_guard lock(mutex_);
  const auto phase = GetPhase();
  if (phase != MigrationPhase::kIdle && phase != MigrationPhase::kError) {
    throw util::InvalidState("cannot set min sdk extension version in phase " + std::string(model::PhaseName(phase)));
  }
  if (version < 0) {
    throw util::ValidationError("min sdk extension version must not be negative");
  }

  auto store_version = [&](db::Transaction& tx) {
    helpers_->preferences->InsertOrReplacePreference(tx, PreferenceHelper::kMinSdkExtensionVersionKey, std::to_string(version));
  };

  const bool upgrade_required = version > module_sdk_extension_version_;
  if (upgrade_required && phase == MigrationPhase::kIdle) {
    Transition(MigrationPhase::kError, store_version);
  } else if (!upgrade_required && phase == MigrationPhase::kError) {
    Transition(MigrationPhase::kIdle, store_version);
  } else {
    helpers_->transactions->RunAsTransaction(store_version);
  }
  min_sdk_extension_version_.store(version);

  if (upgrade_required) {
    HEALTHSTORE_LOG_WARN("Module upgrade required before migration",
                         {observability::IntField("required", version), observability::IntField("module", module_sdk_extension_version_)});
  }
}

} // namespace healthstore::migration
