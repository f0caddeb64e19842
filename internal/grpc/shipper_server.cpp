#include "shipper_server.hpp"

#include "grpc_error.hpp"

namespace freight::grpc {

using namespace freight::exchange::v1;

ShipperServer::ShipperServer(std::shared_ptr<freight::service::ShipperService> svc) : service_(std::move(svc)) {
}

::grpc::Status ShipperServer::PostShipment(::grpc::ServerContext*, const PostShipmentRequest* req, PostShipmentResponse* resp) {
  try {
    *resp = service_->PostShipment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::PublishShipment(::grpc::ServerContext*, const PublishShipmentRequest* req, PublishShipmentResponse* resp) {
  try {
    *resp = service_->PublishShipment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::OpenAuction(::grpc::ServerContext*, const OpenAuctionRequest* req, OpenAuctionResponse* resp) {
  try {
    *resp = service_->OpenAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::ScheduleAuction(::grpc::ServerContext*, const ScheduleAuctionRequest* req, ScheduleAuctionResponse* resp) {
  try {
    *resp = service_->ScheduleAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::CloseAuction(::grpc::ServerContext*, const CloseAuctionRequest* req, CloseAuctionResponse* resp) {
  try {
    *resp = service_->CloseAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::CancelShipment(::grpc::ServerContext*, const CancelShipmentRequest* req, CancelShipmentResponse* resp) {
  try {
    *resp = service_->CancelShipment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::GetShipment(::grpc::ServerContext*, const GetShipmentRequest* req, GetShipmentResponse* resp) {
  try {
    *resp = service_->GetShipment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::ListShipments(::grpc::ServerContext*, const ListShipmentsRequest* req, ListShipmentsResponse* resp) {
  try {
    *resp = service_->ListShipments(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ShipperServer::ReportNoShow(::grpc::ServerContext*, const ReportNoShowRequest* req, ReportNoShowResponse* resp) {
  try {
    *resp = service_->ReportNoShow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace freight::grpc
