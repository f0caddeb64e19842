#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "freight/exchange/v1/driver_service.grpc.pb.h"
#include "internal/service/driver_service.hpp"

namespace freight::grpc {

class DriverServer final : public freight::exchange::v1::DriverService::Service {
 public:
  explicit DriverServer(std::shared_ptr<freight::service::DriverService> svc);

  ::grpc::Status SubmitBid(::grpc::ServerContext*, const freight::exchange::v1::SubmitBidRequest*, freight::exchange::v1::SubmitBidResponse*) override;

  ::grpc::Status WithdrawBid(::grpc::ServerContext*, const freight::exchange::v1::WithdrawBidRequest*, freight::exchange::v1::WithdrawBidResponse*) override;

  ::grpc::Status ReportPickup(::grpc::ServerContext*, const freight::exchange::v1::ReportPickupRequest*, freight::exchange::v1::ExecutionResponse*) override;

  ::grpc::Status ReportDeparture(::grpc::ServerContext*, const freight::exchange::v1::ReportDepartureRequest*, freight::exchange::v1::ExecutionResponse*) override;

  ::grpc::Status ReportDelivery(::grpc::ServerContext*, const freight::exchange::v1::ReportDeliveryRequest*, freight::exchange::v1::ExecutionResponse*) override;

  ::grpc::Status ReportUnableToFulfill(::grpc::ServerContext*, const freight::exchange::v1::ReportUnableToFulfillRequest*, freight::exchange::v1::ExecutionResponse*) override;

  ::grpc::Status UpdateLocation(::grpc::ServerContext*, const freight::exchange::v1::UpdateLocationRequest*, freight::exchange::v1::UpdateLocationResponse*) override;

  ::grpc::Status GetProfile(::grpc::ServerContext*, const freight::exchange::v1::GetProfileRequest*, freight::exchange::v1::GetProfileResponse*) override;

  ::grpc::Status ListMyBids(::grpc::ServerContext*, const freight::exchange::v1::ListMyBidsRequest*, freight::exchange::v1::ListMyBidsResponse*) override;

  ::grpc::Status RecommendBackhauls(::grpc::ServerContext*, const freight::exchange::v1::RecommendBackhaulsRequest*, freight::exchange::v1::RecommendBackhaulsResponse*) override;

 private:
  std::shared_ptr<freight::service::DriverService> service_;
};

} // namespace freight::grpc
