#pragma once

#include "loadplan/v1.hpp"
#include "service_context.hpp"

namespace loadplan::service {

class LoadPlanService {
public:
  explicit LoadPlanService(ServiceContext ctx);

  loadplan::services::v1::ValidateProductsResponse
  ValidateProducts(const loadplan::services::v1::ValidateProductsRequest& req);

  loadplan::services::v1::OptimizeResponse
  Optimize(const loadplan::services::v1::OptimizeRequest& req);

  loadplan::services::v1::PrepareSummaryResponse
  PrepareSummary(const loadplan::services::v1::PrepareSummaryRequest& req);

  loadplan::services::v1::GetStatsResponse
  GetStats(const loadplan::services::v1::GetStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
