#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "loadplan/services/v1/load_plan_service.grpc.pb.h"
#include "internal/service/load_plan_service.hpp"
#include "loadplan/v1.hpp"

namespace loadplan::grpc {

class LoadPlanServer final : public loadplan::services::v1::LoadPlanService::Service {
public:
  explicit LoadPlanServer(std::shared_ptr<loadplan::service::LoadPlanService> svc);

  ::grpc::Status ValidateProducts(::grpc::ServerContext*,
                                  const loadplan::services::v1::ValidateProductsRequest*,
                                  loadplan::services::v1::ValidateProductsResponse*) override;

  ::grpc::Status Optimize(::grpc::ServerContext*,
                          const loadplan::services::v1::OptimizeRequest*,
                          loadplan::services::v1::OptimizeResponse*) override;

  ::grpc::Status PrepareSummary(::grpc::ServerContext*,
                                const loadplan::services::v1::PrepareSummaryRequest*,
                                loadplan::services::v1::PrepareSummaryResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*,
                          const loadplan::services::v1::GetStatsRequest*,
                          loadplan::services::v1::GetStatsResponse*) override;

private:
  std::shared_ptr<loadplan::service::LoadPlanService> service_;
};

}
