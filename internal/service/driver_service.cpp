#include "driver_service.hpp"

#include <cmath>

#include "internal/auction/bid_intake.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/ranking/backhaul_matcher.hpp"
#include "internal/reputation/reputation_scorer.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/errors.hpp"

namespace freight::service {

using namespace freight::exchange::v1;

namespace {

ExecutionResponse ToResponse(const freight::dispatch::ExecutionResult& result) {
  ExecutionResponse resp;
  *resp.mutable_match()    = ToProto(result.match);
  *resp.mutable_shipment() = ToProto(result.shipment);
  return resp;
}

} // namespace

DriverService::DriverService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitBidResponse DriverService::SubmitBid(const SubmitBidRequest& req) {
  return ObserveRpc("DriverService.SubmitBid", req.shipment_id(), [&] {
    freight::auction::BidSubmission submission;
    submission.shipment_id = req.shipment_id();
    submission.driver_id   = req.driver_id();
    submission.price       = req.price();
    submission.eta_minutes = req.eta_minutes();
    submission.location    = FromProto(req.location());
    submission.message     = req.message();

    SubmitBidResponse resp;
    *resp.mutable_bid() = ToProto(ctx_.intake->Submit(submission));
    return resp;
  });
}

WithdrawBidResponse DriverService::WithdrawBid(const WithdrawBidRequest& req) {
  return ObserveRpc("DriverService.WithdrawBid", req.bid_id(), [&] {
    WithdrawBidResponse resp;
    *resp.mutable_bid() = ToProto(ctx_.intake->Withdraw(req.bid_id(), req.driver_id()));
    return resp;
  });
}

ExecutionResponse DriverService::ReportPickup(const ReportPickupRequest& req) {
  return ObserveRpc("DriverService.ReportPickup", req.match_id(), [&] { return ToResponse(ctx_.dispatch->ReportPickup(req.match_id(), req.driver_id())); });
}

ExecutionResponse DriverService::ReportDeparture(const ReportDepartureRequest& req) {
  return ObserveRpc("DriverService.ReportDeparture", req.match_id(),
                    [&] { return ToResponse(ctx_.dispatch->ReportDeparture(req.match_id(), req.driver_id())); });
}

ExecutionResponse DriverService::ReportDelivery(const ReportDeliveryRequest& req) {
  return ObserveRpc("DriverService.ReportDelivery", req.match_id(),
                    [&] { return ToResponse(ctx_.dispatch->ReportDelivery(req.match_id(), req.driver_id())); });
}

ExecutionResponse DriverService::ReportUnableToFulfill(const ReportUnableToFulfillRequest& req) {
  return ObserveRpc("DriverService.ReportUnableToFulfill", req.match_id(),
                    [&] { return ToResponse(ctx_.dispatch->ReportUnableToFulfill(req.match_id(), req.driver_id(), req.reason())); });
}

UpdateLocationResponse DriverService::UpdateLocation(const UpdateLocationRequest& req) {
  return ObserveRpc("DriverService.UpdateLocation", req.driver_id(), [&] {
    const auto location = FromProto(req.location());
    if (!freight::model::IsValid(location)) {
      throw freight::util::ValidationError("update location: location is not a valid coordinate");
    }
    if (!(req.capacity_kg() >= 0.0) || !std::isfinite(req.capacity_kg())) {
      throw freight::util::ValidationError("update location: capacity_kg must be a non-negative number");
    }

    const auto profile = ctx_.scorer->MutateDriver(req.driver_id(), [&](freight::db::model::DriverRecord& driver) {
      driver.location = location;
      if (req.has_available()) driver.available = req.available();
      if (req.capacity_kg() > 0.0) driver.capacity_kg = req.capacity_kg();
    });

    UpdateLocationResponse resp;
    *resp.mutable_profile() = ToProto(profile);
    return resp;
  });
}

GetProfileResponse DriverService::GetProfile(const GetProfileRequest& req) {
  return ObserveRpc("DriverService.GetProfile", req.driver_id(), [&] {
    const auto profile = ctx_.scorer->FindDriver(req.driver_id());
    if (!profile) {
      throw freight::util::NotFound("driver profile not found; verify driver id");
    }

    GetProfileResponse resp;
    *resp.mutable_profile() = ToProto(*profile);
    for (const auto& match : ctx_.dispatch->MatchesForDriver(req.driver_id())) {
      *resp.add_matches() = ToProto(match);
    }
    return resp;
  });
}

ListMyBidsResponse DriverService::ListMyBids(const ListMyBidsRequest& req) {
  return ObserveRpc("DriverService.ListMyBids", req.driver_id(), [&] {
    std::vector<freight::model::BidStatus> statuses;
    for (const auto status : req.statuses()) {
      statuses.push_back(FromProto(static_cast<freight::exchange::v1::BidStatus>(status)));
    }

    ListMyBidsResponse resp;
    for (const auto& bid : ctx_.intake->ListForDriver(req.driver_id(), statuses)) {
      *resp.add_bids() = ToProto(bid);
    }
    return resp;
  });
}

RecommendBackhaulsResponse DriverService::RecommendBackhauls(const RecommendBackhaulsRequest& req) {
  return ObserveRpc("DriverService.RecommendBackhauls", req.driver_id(), [&] {
    const auto profile  = ctx_.scorer->FindDriver(req.driver_id());
    const auto capacity = profile ? profile->capacity_kg : 0.0;

    std::vector<freight::ranking::NearbyShipment> nearby;
    if (!req.shipment_id().empty()) {
      nearby = ctx_.backhaul->Candidates(ctx_.ledger->Get(req.shipment_id()), capacity);
    } else if (profile) {
      nearby = ctx_.backhaul->NearPoint(profile->location, capacity);
    } else {
      throw freight::util::NotFound("recommend backhauls: driver has no recorded location; update location or pass a shipment id");
    }

    RecommendBackhaulsResponse resp;
    for (const auto& candidate : nearby) {
      const auto shipment = ctx_.ledger->Find(candidate.shipment.id);
      if (!shipment) continue;

      auto* out                = resp.add_candidates();
      *out->mutable_shipment() = ToProto(*shipment);
      out->set_distance_km(candidate.distance_km);
    }
    return resp;
  });
}

} // namespace freight::service
