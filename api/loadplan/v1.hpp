#pragma once

#include "loadplan/core/v1/types.pb.h"

#include "loadplan/services/v1/load_plan_service.pb.h"

#include "loadplan/services/v1/load_plan_service.grpc.pb.h"

namespace loadplan::v1 {
using namespace ::loadplan::core::v1;
using namespace ::loadplan::services::v1;
}
