#include "driver_server.hpp"

#include "grpc_error.hpp"

namespace freight::grpc {

using namespace freight::exchange::v1;

DriverServer::DriverServer(std::shared_ptr<freight::service::DriverService> svc) : service_(std::move(svc)) {
}

::grpc::Status DriverServer::SubmitBid(::grpc::ServerContext*, const SubmitBidRequest* req, SubmitBidResponse* resp) {
  try {
    *resp = service_->SubmitBid(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::WithdrawBid(::grpc::ServerContext*, const WithdrawBidRequest* req, WithdrawBidResponse* resp) {
  try {
    *resp = service_->WithdrawBid(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ReportPickup(::grpc::ServerContext*, const ReportPickupRequest* req, ExecutionResponse* resp) {
  try {
    *resp = service_->ReportPickup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ReportDeparture(::grpc::ServerContext*, const ReportDepartureRequest* req, ExecutionResponse* resp) {
  try {
    *resp = service_->ReportDeparture(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ReportDelivery(::grpc::ServerContext*, const ReportDeliveryRequest* req, ExecutionResponse* resp) {
  try {
    *resp = service_->ReportDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ReportUnableToFulfill(::grpc::ServerContext*, const ReportUnableToFulfillRequest* req, ExecutionResponse* resp) {
  try {
    *resp = service_->ReportUnableToFulfill(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::UpdateLocation(::grpc::ServerContext*, const UpdateLocationRequest* req, UpdateLocationResponse* resp) {
  try {
    *resp = service_->UpdateLocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::GetProfile(::grpc::ServerContext*, const GetProfileRequest* req, GetProfileResponse* resp) {
  try {
    *resp = service_->GetProfile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::ListMyBids(::grpc::ServerContext*, const ListMyBidsRequest* req, ListMyBidsResponse* resp) {
  try {
    *resp = service_->ListMyBids(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::RecommendBackhauls(::grpc::ServerContext*, const RecommendBackhaulsRequest* req, RecommendBackhaulsResponse* resp) {
  try {
    *resp = service_->RecommendBackhauls(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace freight::grpc
