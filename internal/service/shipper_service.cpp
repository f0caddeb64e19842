#include "shipper_service.hpp"

#include <algorithm>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/errors.hpp"

namespace freight::service {

using namespace freight::exchange::v1;

using freight::model::ShipmentStatus;

ShipperService::ShipperService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PostShipmentResponse ShipperService::PostShipment(const PostShipmentRequest& req) {
  return ObserveRpc("ShipperService.PostShipment", req.shipper_id(), [&] {
    freight::ledger::ShipmentDraft draft;
    draft.shipper_id        = req.shipper_id();
    draft.origin            = FromProto(req.origin());
    draft.destination       = FromProto(req.destination());
    draft.weight_kg         = req.cargo().weight_kg();
    draft.cargo_type        = req.cargo().cargo_type();
    draft.description       = req.cargo().description();
    draft.pickup_start_ms   = MillisOf(req.pickup_window().start());
    draft.pickup_end_ms     = MillisOf(req.pickup_window().end());
    draft.delivery_start_ms = MillisOf(req.delivery_window().start());
    draft.delivery_end_ms   = MillisOf(req.delivery_window().end());
    if (req.has_reserve_price()) {
      draft.reserve_price = req.reserve_price();
    }
    draft.relist_on_no_bids = !req.has_relist_on_no_bids() || req.relist_on_no_bids();

    auto record = ctx_.ledger->Create(draft);
    if (req.publish()) {
      record = ctx_.ledger->Transition(record.id, ShipmentStatus::kDraft, ShipmentStatus::kOpen, "published");
    }

    PostShipmentResponse resp;
    *resp.mutable_shipment() = ToProto(record);
    return resp;
  });
}

PublishShipmentResponse ShipperService::PublishShipment(const PublishShipmentRequest& req) {
  return ObserveRpc("ShipperService.PublishShipment", req.shipment_id(), [&] {
    PublishShipmentResponse resp;
    *resp.mutable_shipment() = ToProto(ctx_.ledger->Transition(req.shipment_id(), ShipmentStatus::kDraft, ShipmentStatus::kOpen, "published"));
    return resp;
  });
}

OpenAuctionResponse ShipperService::OpenAuction(const OpenAuctionRequest& req) {
  return ObserveRpc("ShipperService.OpenAuction", req.shipment_id(), [&] {
    std::optional<uint64_t> duration_ms;
    if (req.has_duration_ms()) {
      duration_ms = req.duration_ms();
    }

    OpenAuctionResponse resp;
    *resp.mutable_window() = ToProto(ctx_.coordinator->Open(req.shipment_id(), duration_ms, req.bid_limit()));
    return resp;
  });
}

ScheduleAuctionResponse ShipperService::ScheduleAuction(const ScheduleAuctionRequest& req) {
  return ObserveRpc("ShipperService.ScheduleAuction", req.shipment_id(), [&] {
    if (!req.has_opens_at()) {
      throw freight::util::ValidationError("schedule auction: opens_at is required");
    }
    std::optional<uint64_t> duration_ms;
    if (req.has_duration_ms()) {
      duration_ms = req.duration_ms();
    }

    ScheduleAuctionResponse resp;
    *resp.mutable_window() = ToProto(ctx_.coordinator->Schedule(req.shipment_id(), MillisOf(req.opens_at()), duration_ms, req.bid_limit()));
    return resp;
  });
}

CloseAuctionResponse ShipperService::CloseAuction(const CloseAuctionRequest& req) {
  return ObserveRpc("ShipperService.CloseAuction", req.shipment_id(), [&] {
    const auto result = ctx_.coordinator->Close(req.shipment_id(), freight::model::CloseTrigger::kShipper);

    CloseAuctionResponse resp;
    if (result.match) {
      *resp.mutable_match() = ToProto(*result.match);
    }
    *resp.mutable_shipment() = ToProto(result.shipment);
    return resp;
  });
}

CancelShipmentResponse ShipperService::CancelShipment(const CancelShipmentRequest& req) {
  return ObserveRpc("ShipperService.CancelShipment", req.shipment_id(), [&] {
    CancelShipmentResponse resp;
    *resp.mutable_shipment() = ToProto(ctx_.coordinator->CancelShipment(req.shipment_id(), req.reason()));
    return resp;
  });
}

GetShipmentResponse ShipperService::GetShipment(const GetShipmentRequest& req) {
  return ObserveRpc("ShipperService.GetShipment", req.shipment_id(), [&] {
    const auto shipment = ctx_.ledger->Get(req.shipment_id());

    GetShipmentResponse resp;
    *resp.mutable_shipment() = ToProto(shipment);

    if (shipment.auction_round > 0) {
      freight::db::BidFilter filter;
      filter.shipment_id = shipment.id;
      filter.round       = shipment.auction_round;

      std::vector<freight::db::model::BidRecord> bids;
      {
        auto tx = ctx_.repository->Begin();
        bids    = ctx_.repository->ListBids(*tx, filter);
        tx->Commit();
      }
      std::stable_sort(bids.begin(), bids.end(), [](const auto& a, const auto& b) { return a.price < b.price; });
      for (const auto& bid : bids) {
        *resp.add_bids() = ToProto(bid);
      }
    }

    const auto window = ctx_.coordinator->CurrentWindow(shipment.id);
    if (window) {
      *resp.mutable_window() = ToProto(*window);
    }

    auto match = ctx_.dispatch->ActiveMatch(shipment.id);
    if (!match && window && !window->match_id.empty()) {
      match = ctx_.dispatch->GetMatch(window->match_id);
    }
    if (match) {
      *resp.mutable_match() = ToProto(*match);
    }

    for (const auto& event : ctx_.ledger->Events(shipment.id)) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

ListShipmentsResponse ShipperService::ListShipments(const ListShipmentsRequest& req) {
  return ObserveRpc("ShipperService.ListShipments", req.shipper_id(), [&] {
    freight::db::ShipmentFilter filter;
    if (!req.shipper_id().empty()) {
      filter.shipper_id = req.shipper_id();
    }
    for (const auto status : req.statuses()) {
      filter.statuses.push_back(FromProto(static_cast<freight::exchange::v1::ShipmentStatus>(status)));
    }

    ListShipmentsResponse resp;
    for (const auto& record : ctx_.ledger->List(filter)) {
      *resp.add_shipments() = ToProto(record);
    }
    return resp;
  });
}

ReportNoShowResponse ShipperService::ReportNoShow(const ReportNoShowRequest& req) {
  return ObserveRpc("ShipperService.ReportNoShow", req.shipment_id(), [&] {
    ReportNoShowResponse resp;
    *resp.mutable_shipment() = ToProto(ctx_.dispatch->ReportNoShow(req.shipment_id()));
    return resp;
  });
}

} // namespace freight::service
