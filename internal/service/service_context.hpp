#pragma once

#include <memory>
#include <optional>

#include "loadplan/core/v1/types.pb.h"

namespace loadplan::core { class Optimizer; }
namespace loadplan::cache { class ResultCache; }

namespace loadplan::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<loadplan::core::Optimizer>    optimizer;
  std::shared_ptr<loadplan::cache::ResultCache> cache;
  // Used when an Optimize call carries no pallet template.
  std::optional<loadplan::core::v1::PalletTemplate> default_pallet;
};

}
