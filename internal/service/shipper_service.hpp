#pragma once

#include "freight/exchange/v1.hpp"
#include "service_context.hpp"

namespace freight::service {

class ShipperService {
 public:
  explicit ShipperService(ServiceContext ctx);

  freight::exchange::v1::PostShipmentResponse PostShipment(const freight::exchange::v1::PostShipmentRequest& req);

  freight::exchange::v1::PublishShipmentResponse PublishShipment(const freight::exchange::v1::PublishShipmentRequest& req);

  freight::exchange::v1::OpenAuctionResponse OpenAuction(const freight::exchange::v1::OpenAuctionRequest& req);

  freight::exchange::v1::ScheduleAuctionResponse ScheduleAuction(const freight::exchange::v1::ScheduleAuctionRequest& req);

  freight::exchange::v1::CloseAuctionResponse CloseAuction(const freight::exchange::v1::CloseAuctionRequest& req);

  freight::exchange::v1::CancelShipmentResponse CancelShipment(const freight::exchange::v1::CancelShipmentRequest& req);

  freight::exchange::v1::GetShipmentResponse GetShipment(const freight::exchange::v1::GetShipmentRequest& req);

  freight::exchange::v1::ListShipmentsResponse ListShipments(const freight::exchange::v1::ListShipmentsRequest& req);

  freight::exchange::v1::ReportNoShowResponse ReportNoShow(const freight::exchange::v1::ReportNoShowRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace freight::service
