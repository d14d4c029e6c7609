#include "load_plan_server.hpp"
#include "grpc_error.hpp"
#include "loadplan/v1.hpp"

namespace loadplan::grpc {

LoadPlanServer::LoadPlanServer(std::shared_ptr<loadplan::service::LoadPlanService> svc)
    : service_(std::move(svc)) {}

::grpc::Status LoadPlanServer::ValidateProducts(::grpc::ServerContext*,
                                                const loadplan::services::v1::ValidateProductsRequest* req,
                                                loadplan::services::v1::ValidateProductsResponse* resp) {
  try {
    *resp = service_->ValidateProducts(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LoadPlanServer::Optimize(::grpc::ServerContext*,
                                        const loadplan::services::v1::OptimizeRequest* req,
                                        loadplan::services::v1::OptimizeResponse* resp) {
  try {
    *resp = service_->Optimize(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LoadPlanServer::PrepareSummary(::grpc::ServerContext*,
                                              const loadplan::services::v1::PrepareSummaryRequest* req,
                                              loadplan::services::v1::PrepareSummaryResponse* resp) {
  try {
    *resp = service_->PrepareSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LoadPlanServer::GetStats(::grpc::ServerContext*,
                                        const loadplan::services::v1::GetStatsRequest* req,
                                        loadplan::services::v1::GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
