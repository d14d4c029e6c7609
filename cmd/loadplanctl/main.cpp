#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "loadplan/services/v1/load_plan_service.grpc.pb.h"
#include "loadplan/v1.hpp"

using namespace loadplan::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  loadplanctl <addr> validate <products.yaml>\n"
            << "  loadplanctl <addr> optimize <request.yaml>\n"
            << "  loadplanctl <addr> summary <request.yaml>\n"
            << "  loadplanctl <addr> stats\n"
            << "\n"
            << "products.yaml holds a ValidateProductsRequest, request.yaml an OptimizeRequest.\n";
}

static bool PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    return false;
  }
  std::cout << json;
  return true;
}

static void PrintSummary(const OptimizationSummary& summary) {
  std::cout << "success=" << (summary.success() ? "true" : "false") << "\n";
  if (summary.has_message()) {
    std::cout << "message=" << summary.message() << "\n";
  }
  std::cout << "utilization=" << summary.utilization() << "\n"
            << "total_pallets=" << summary.total_pallets() << "\n"
            << "total_products=" << summary.total_products() << "\n"
            << "remaining_products=" << summary.remaining_products() << "\n";
  if (summary.has_weight_utilization()) {
    std::cout << "weight_utilization=" << summary.weight_utilization() << "\n";
  }
}

template <typename Request>
static bool LoadRequest(const std::string& path, Request* req) {
  try {
    loadplan::config::ConfigLoader::LoadMessageFromYaml(path, req);
    return true;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return false;
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = LoadPlanService::NewStub(channel);

  // ------------------------------------------------------------
  if (cmd == "validate") {
    if (argc < 4) return 1;

    ValidateProductsRequest req;
    if (!LoadRequest(argv[3], &req)) return 1;

    grpc::ClientContext      ctx;
    ValidateProductsResponse resp;
    auto status = stub->ValidateProducts(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "valid=" << (resp.validation().valid() ? "true" : "false") << "\n";
    for (const auto& name : resp.validation().invalid_products()) {
      std::cout << "invalid=" << name << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "optimize" || cmd == "summary") {
    if (argc < 4) return 1;

    OptimizeRequest req;
    if (!LoadRequest(argv[3], &req)) return 1;

    grpc::ClientContext ctx;
    OptimizeResponse    resp;
    auto status = stub->Optimize(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    if (cmd == "optimize") {
      return PrintJson(resp) ? 0 : 2;
    }

    PrepareSummaryRequest summary_req;
    *summary_req.mutable_result() = resp.result();

    grpc::ClientContext    summary_ctx;
    PrepareSummaryResponse summary_resp;
    status = stub->PrepareSummary(&summary_ctx, summary_req, &summary_resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintSummary(summary_resp.summary());
    std::cout << "cache_hit=" << (resp.cache_hit() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "stats") {
    grpc::ClientContext ctx;
    GetStatsRequest     req;
    GetStatsResponse    resp;
    auto status = stub->GetStats(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "optimizations=" << resp.optimizations() << "\n"
              << "cache_hits=" << resp.cache_hits() << "\n"
              << "cache_misses=" << resp.cache_misses() << "\n"
              << "cache_entries=" << resp.cache_entries() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
