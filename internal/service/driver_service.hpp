#pragma once

#include "freight/exchange/v1.hpp"
#include "service_context.hpp"

namespace freight::service {

class DriverService {
 public:
  explicit DriverService(ServiceContext ctx);

  freight::exchange::v1::SubmitBidResponse SubmitBid(const freight::exchange::v1::SubmitBidRequest& req);

  freight::exchange::v1::WithdrawBidResponse WithdrawBid(const freight::exchange::v1::WithdrawBidRequest& req);

  freight::exchange::v1::ExecutionResponse ReportPickup(const freight::exchange::v1::ReportPickupRequest& req);

  freight::exchange::v1::ExecutionResponse ReportDeparture(const freight::exchange::v1::ReportDepartureRequest& req);

  freight::exchange::v1::ExecutionResponse ReportDelivery(const freight::exchange::v1::ReportDeliveryRequest& req);

  freight::exchange::v1::ExecutionResponse ReportUnableToFulfill(const freight::exchange::v1::ReportUnableToFulfillRequest& req);

  freight::exchange::v1::UpdateLocationResponse UpdateLocation(const freight::exchange::v1::UpdateLocationRequest& req);

  freight::exchange::v1::GetProfileResponse GetProfile(const freight::exchange::v1::GetProfileRequest& req);

  freight::exchange::v1::ListMyBidsResponse ListMyBids(const freight::exchange::v1::ListMyBidsRequest& req);

  freight::exchange::v1::RecommendBackhaulsResponse RecommendBackhauls(const freight::exchange::v1::RecommendBackhaulsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace freight::service
