#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "freight/exchange/v1/shipper_service.grpc.pb.h"
#include "internal/service/shipper_service.hpp"

namespace freight::grpc {

class ShipperServer final : public freight::exchange::v1::ShipperService::Service {
 public:
  explicit ShipperServer(std::shared_ptr<freight::service::ShipperService> svc);

  ::grpc::Status PostShipment(::grpc::ServerContext*, const freight::exchange::v1::PostShipmentRequest*, freight::exchange::v1::PostShipmentResponse*) override;

  ::grpc::Status PublishShipment(::grpc::ServerContext*, const freight::exchange::v1::PublishShipmentRequest*, freight::exchange::v1::PublishShipmentResponse*) override;

  ::grpc::Status OpenAuction(::grpc::ServerContext*, const freight::exchange::v1::OpenAuctionRequest*, freight::exchange::v1::OpenAuctionResponse*) override;

  ::grpc::Status ScheduleAuction(::grpc::ServerContext*, const freight::exchange::v1::ScheduleAuctionRequest*, freight::exchange::v1::ScheduleAuctionResponse*) override;

  ::grpc::Status CloseAuction(::grpc::ServerContext*, const freight::exchange::v1::CloseAuctionRequest*, freight::exchange::v1::CloseAuctionResponse*) override;

  ::grpc::Status CancelShipment(::grpc::ServerContext*, const freight::exchange::v1::CancelShipmentRequest*, freight::exchange::v1::CancelShipmentResponse*) override;

  ::grpc::Status GetShipment(::grpc::ServerContext*, const freight::exchange::v1::GetShipmentRequest*, freight::exchange::v1::GetShipmentResponse*) override;

  ::grpc::Status ListShipments(::grpc::ServerContext*, const freight::exchange::v1::ListShipmentsRequest*, freight::exchange::v1::ListShipmentsResponse*) override;

  ::grpc::Status ReportNoShow(::grpc::ServerContext*, const freight::exchange::v1::ReportNoShowRequest*, freight::exchange::v1::ReportNoShowResponse*) override;

 private:
  std::shared_ptr<freight::service::ShipperService> service_;
};

} // namespace freight::grpc
