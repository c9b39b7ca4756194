#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace tierbridge::factory {

/*
  Application

  Owns every long-lived component. Build wires them but starts nothing;
  the process entry point decides when engines run.
*/
struct Application {
  service::ServiceContext                       context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the only place that knows concrete database types,
  filesystem drivers and the native clipboard backend.
*/
Application Build(const tierbridge::runtime::config::RuntimeConfig& config);

} // namespace tierbridge::factory
