#pragma once

#include "config/config.pb.h"
#include "healthstore/migration/v1/migration.pb.h"

namespace healthstore::v1 {
using namespace ::healthstore::migration::v1;
using ::healthstore::runtime::config::RuntimeConfig;
}
