#include "proto_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace freight::service {

namespace v1 = freight::exchange::v1;

namespace {

void SetTimestamp(google::protobuf::Timestamp* out, uint64_t ms) {
  if (ms > 0) {
    *out = freight::util::ToProto(freight::util::FromUnixMillis(ms));
  }
}

} // namespace

uint64_t MillisOf(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < 0 || (ts.seconds() == 0 && ts.nanos() == 0)) {
    return 0;
  }
  return freight::util::ToUnixMillis(freight::util::FromProto(ts));
}

v1::Location ToProto(const freight::model::GeoPoint& point) {
  v1::Location out;
  out.set_latitude(point.latitude);
  out.set_longitude(point.longitude);
  out.set_label(point.label);
  return out;
}

freight::model::GeoPoint FromProto(const v1::Location& location) {
  freight::model::GeoPoint point;
  point.latitude  = location.latitude();
  point.longitude = location.longitude();
  point.label     = location.label();
  return point;
}

v1::ShipmentStatus ToProto(freight::model::ShipmentStatus status) {
  return static_cast<v1::ShipmentStatus>(status);
}

freight::model::ShipmentStatus FromProto(v1::ShipmentStatus status) {
  if (status <= v1::SHIPMENT_STATUS_UNSPECIFIED || status > v1::SHIPMENT_STATUS_FAILED) {
    throw freight::util::ValidationError("unknown shipment status " + std::to_string(status));
  }
  return static_cast<freight::model::ShipmentStatus>(status);
}

freight::model::BidStatus FromProto(v1::BidStatus status) {
  if (status <= v1::BID_STATUS_UNSPECIFIED || status > v1::BID_STATUS_WON) {
    throw freight::util::ValidationError("unknown bid status " + std::to_string(status));
  }
  return static_cast<freight::model::BidStatus>(status);
}

v1::Shipment ToProto(const freight::db::model::ShipmentRecord& record) {
  v1::Shipment out;
  out.set_id(record.id);
  out.set_shipper_id(record.shipper_id);
  *out.mutable_origin()      = ToProto(record.origin);
  *out.mutable_destination() = ToProto(record.destination);

  auto* cargo = out.mutable_cargo();
  cargo->set_weight_kg(record.weight_kg);
  cargo->set_cargo_type(record.cargo_type);
  cargo->set_description(record.description);

  SetTimestamp(out.mutable_pickup_window()->mutable_start(), record.pickup_start_ms);
  SetTimestamp(out.mutable_pickup_window()->mutable_end(), record.pickup_end_ms);
  SetTimestamp(out.mutable_delivery_window()->mutable_start(), record.delivery_start_ms);
  SetTimestamp(out.mutable_delivery_window()->mutable_end(), record.delivery_end_ms);

  if (record.reserve_price) {
    out.set_reserve_price(*record.reserve_price);
  }
  out.set_relist_on_no_bids(record.relist_on_no_bids);
  out.set_status(ToProto(record.status));
  out.set_auction_round(record.auction_round);
  SetTimestamp(out.mutable_created_at(), record.created_at_ms);
  out.set_version(record.version);
  return out;
}

v1::ShipmentEvent ToProto(const freight::db::model::ShipmentEventRecord& record) {
  v1::ShipmentEvent out;
  out.set_sequence(record.sequence);
  out.set_from(ToProto(record.from));
  out.set_to(ToProto(record.to));
  out.set_reason(record.reason);
  SetTimestamp(out.mutable_at(), record.at_ms);
  return out;
}

v1::Bid ToProto(const freight::db::model::BidRecord& record) {
  v1::Bid out;
  out.set_id(record.id);
  out.set_shipment_id(record.shipment_id);
  out.set_round(record.round);
  out.set_driver_id(record.driver_id);
  out.set_price(record.price);
  SetTimestamp(out.mutable_submitted_at(), record.submitted_at_ms);
  *out.mutable_driver_location() = ToProto(record.driver_location);
  out.set_eta_minutes(record.eta_minutes);
  out.set_message(record.message);
  out.set_status(static_cast<v1::BidStatus>(record.status));
  return out;
}

v1::Match ToProto(const freight::db::model::MatchRecord& record) {
  v1::Match out;
  out.set_id(record.id);
  out.set_shipment_id(record.shipment_id);
  out.set_bid_id(record.bid_id);
  out.set_driver_id(record.driver_id);
  out.set_price(record.price);
  out.set_round(record.round);
  SetTimestamp(out.mutable_committed_at(), record.committed_at_ms);
  out.set_execution_status(static_cast<v1::ExecutionStatus>(record.execution_status));
  return out;
}

v1::AuctionWindow ToProto(const freight::db::model::AuctionWindowRecord& record) {
  v1::AuctionWindow out;
  out.set_shipment_id(record.shipment_id);
  out.set_round(record.round);
  out.set_state(static_cast<v1::AuctionState>(record.state));
  SetTimestamp(out.mutable_opens_at(), record.opens_at_ms);
  if (record.closes_at_ms > 0) {
    SetTimestamp(out.mutable_closes_at(), record.closes_at_ms);
  }
  out.set_bid_limit(record.bid_limit);
  out.set_match_id(record.match_id);
  return out;
}

v1::DriverProfile ToProto(const freight::db::model::DriverRecord& record) {
  v1::DriverProfile out;
  out.set_id(record.id);
  out.set_reputation(record.reputation);
  out.set_completed_jobs(record.completed_jobs);
  out.set_on_time_jobs(record.on_time_jobs);
  out.set_cancellations(record.cancellations);
  out.set_failures(record.failures);
  *out.mutable_location() = ToProto(record.location);
  out.set_available(record.available);
  out.set_capacity_kg(record.capacity_kg);
  SetTimestamp(out.mutable_updated_at(), record.updated_at_ms);
  return out;
}

} // namespace freight::service
