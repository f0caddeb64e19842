#include "factory.hpp"

#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/shipper_server.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/shipper_service.hpp"

namespace freight::factory {

freight::service::ServiceContext ContextFor(const freight::runtime::ExchangeRuntime& core) {
  freight::service::ServiceContext ctx;
  ctx.repository  = core.repository;
  ctx.ledger      = core.ledger;
  ctx.coordinator = core.coordinator;
  ctx.intake      = core.intake;
  ctx.dispatch    = core.dispatch;
  ctx.scorer      = core.scorer;
  ctx.backhaul    = core.backhaul;
  return ctx;
}

Application Build(const freight::runtime::config::RuntimeConfig& config) {
  Application app;
  app.core = freight::runtime::BuildRuntime(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  const auto ctx = ContextFor(app.core);

  auto shipper_service = std::make_shared<freight::service::ShipperService>(ctx);
  auto driver_service  = std::make_shared<freight::service::DriverService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<freight::grpc::ShipperServer>(shipper_service));
  app.grpc_services.push_back(std::make_unique<freight::grpc::DriverServer>(driver_service));

  return app;
}

} // namespace freight::factory
