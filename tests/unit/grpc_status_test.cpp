#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/shipper_server.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/shipper_service.hpp"
#include "internal/util/errors.hpp"
#include "service_fixture.hpp"

namespace {

using freight::testing::ContextFor;
using freight::testing::Exchange;
using freight::testing::MakeDraft;

void TestExceptionMapping() {
  assert(freight::grpc::ToStatus(freight::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(freight::grpc::ToStatus(freight::util::NotFound("missing")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(freight::grpc::ToStatus(freight::util::AlreadyExists("dup")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(freight::grpc::ToStatus(freight::util::InvalidState("state")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(freight::grpc::ToStatus(freight::util::AuctionClosed("closed")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(freight::grpc::ToStatus(freight::util::Conflict("stale")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(freight::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = freight::grpc::ToStatus(freight::util::NotFound("shipment not found"));
  assert(status.error_message().find("shipment not found") != std::string::npos);
}

void TestGetMissingShipmentReturnsNotFound() {
  Exchange                      ex;
  freight::grpc::ShipperServer server(std::make_shared<freight::service::ShipperService>(ContextFor(ex)));

  freight::exchange::v1::GetShipmentRequest req;
  req.set_shipment_id("shp-missing");
  freight::exchange::v1::GetShipmentResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  const auto status = server.GetShipment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStalePublishReturnsAborted() {
  Exchange                      ex;
  freight::grpc::ShipperServer server(std::make_shared<freight::service::ShipperService>(ContextFor(ex)));
  const auto                    shipment = ex.Post(MakeDraft());

  freight::exchange::v1::PublishShipmentRequest req;
  req.set_shipment_id(shipment.id);
  freight::exchange::v1::PublishShipmentResponse resp;
  ::grpc::ServerContext                          grpc_ctx;

  const auto status = server.PublishShipment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
}

void TestBidErrorsMapToStatusCodes() {
  Exchange                     ex;
  freight::grpc::DriverServer server(std::make_shared<freight::service::DriverService>(ContextFor(ex)));
  const auto                   shipment = ex.PostAndOpen(MakeDraft());

  freight::exchange::v1::SubmitBidRequest req;
  req.set_shipment_id(shipment.id);
  req.set_driver_id("driver-a");
  req.set_price(0.0);
  req.mutable_location()->set_latitude(41.85);
  req.mutable_location()->set_longitude(-87.65);

  freight::exchange::v1::SubmitBidResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  assert(server.SubmitBid(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_price(480.0);
  assert(server.SubmitBid(&grpc_ctx, &req, &resp).ok());
  assert(resp.bid().status() == freight::exchange::v1::BID_STATUS_ACTIVE);
  assert(server.SubmitBid(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  ex.coordinator->Close(shipment.id, freight::model::CloseTrigger::kShipper);
  req.set_driver_id("driver-b");
  assert(server.SubmitBid(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingShipmentReturnsNotFound();
  TestStalePublishReturnsAborted();
  TestBidErrorsMapToStatusCodes();

  std::cout << "freight_exchange_unit_grpc_status: pass\n";
  return 0;
}
