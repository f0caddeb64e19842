#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/runtime/exchange_runtime.hpp"
#include "internal/service/service_context.hpp"

namespace freight::factory {

/*
  Application

  The exchange core plus the gRPC services exposing it. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  freight::runtime::ExchangeRuntime core;

  std::vector<std::unique_ptr<grpc::Service>> grpc_services;
};

freight::service::ServiceContext ContextFor(const freight::runtime::ExchangeRuntime& core);

/*
  Build

  Composition root: the only place that knows concrete repository types
  and transport adapters.
*/
Application Build(const freight::runtime::config::RuntimeConfig& config);

} // namespace freight::factory
