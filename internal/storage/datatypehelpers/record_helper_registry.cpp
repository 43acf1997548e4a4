#include "record_helper_registry.hpp"

#include <string>
#include <variant>

#include "internal/storage/datatypehelpers/active_calories_burned_record_helper.hpp"
#include "internal/storage/datatypehelpers/basal_metabolic_rate_record_helper.hpp"
#include "internal/storage/datatypehelpers/body_fat_record_helper.hpp"
#include "internal/storage/datatypehelpers/distance_record_helper.hpp"
#include "internal/storage/datatypehelpers/heart_rate_record_helper.hpp"
#include "internal/storage/datatypehelpers/height_record_helper.hpp"
#include "internal/storage/datatypehelpers/lean_body_mass_record_helper.hpp"
#include "internal/storage/datatypehelpers/power_record_helper.hpp"
#include "internal/storage/datatypehelpers/resting_heart_rate_record_helper.hpp"
#include "internal/storage/datatypehelpers/speed_record_helper.hpp"
#include "internal/storage/datatypehelpers/steps_cadence_record_helper.hpp"
#include "internal/storage/datatypehelpers/steps_record_helper.hpp"
#include "internal/storage/datatypehelpers/weight_record_helper.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {
namespace {

template <typename T>
struct HelperFor;

template <> struct HelperFor<model::StepsRecord> { using type = StepsRecordHelper; };
template <> struct HelperFor<model::HeartRateRecord> { using type = HeartRateRecordHelper; };
template <> struct HelperFor<model::BasalMetabolicRateRecord> { using type = BasalMetabolicRateRecordHelper; };
template <> struct HelperFor<model::PowerRecord> { using type = PowerRecordHelper; };
template <> struct HelperFor<model::SpeedRecord> { using type = SpeedRecordHelper; };
template <> struct HelperFor<model::StepsCadenceRecord> { using type = StepsCadenceRecordHelper; };
template <> struct HelperFor<model::DistanceRecord> { using type = DistanceRecordHelper; };
template <> struct HelperFor<model::ActiveCaloriesBurnedRecord> { using type = ActiveCaloriesBurnedRecordHelper; };
template <> struct HelperFor<model::BodyFatRecord> { using type = BodyFatRecordHelper; };
template <> struct HelperFor<model::HeightRecord> { using type = HeightRecordHelper; };
template <> struct HelperFor<model::LeanBodyMassRecord> { using type = LeanBodyMassRecordHelper; };
template <> struct HelperFor<model::RestingHeartRateRecord> { using type = RestingHeartRateRecordHelper; };
template <> struct HelperFor<model::WeightRecord> { using type = WeightRecordHelper; };

template <typename... Ts>
std::vector<std::unique_ptr<RecordHelper>> BuildHelpers(std::variant<Ts...>*) {
  std::vector<std::unique_ptr<RecordHelper>> helpers;
  (helpers.push_back(std::make_unique<typename HelperFor<Ts>::type>()), ...);
  return helpers;
}

} // namespace

RecordHelperRegistry::RecordHelperRegistry() : helpers_(BuildHelpers(static_cast<model::Record*>(nullptr))) {
}

const RecordHelper& RecordHelperRegistry::Get(model::RecordType type) const {
  for (const auto& helper : helpers_) {
    if (helper->GetRecordType() == type) {
      return *helper;
    }
  }
  throw util::ValidationError("no record helper for record type " + std::to_string(model::ToId(type)));
}

} // namespace healthstore::storage
