#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace loadplan::service { class LoadPlanService; }

namespace loadplan::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  loadplan::service::ServiceContext                   context;
  std::shared_ptr<loadplan::service::LoadPlanService> load_plan_service;
  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;
};

/*
  Build

  Constructs the whole dependency graph from runtime config. This is the
  composition root of the application; config values are turned into
  engine and cache options here and nowhere else.
*/
Application Build(const loadplan::runtime::config::RuntimeConfig& config);

} // namespace loadplan::factory
