#pragma once

#include <cstdint>

#include "freight/exchange/v1.hpp"

#include "internal/db/model/auction_window_record.hpp"
#include "internal/db/model/bid_record.hpp"
#include "internal/db/model/driver_record.hpp"
#include "internal/db/model/match_record.hpp"
#include "internal/db/model/shipment_event_record.hpp"
#include "internal/db/model/shipment_record.hpp"
#include "internal/model/geo.hpp"
#include "internal/model/state_machine.hpp"

namespace freight::service {

// Record -> wire. Zero timestamps are left unset.
freight::exchange::v1::Location      ToProto(const freight::model::GeoPoint& point);
freight::exchange::v1::Shipment      ToProto(const freight::db::model::ShipmentRecord& record);
freight::exchange::v1::ShipmentEvent ToProto(const freight::db::model::ShipmentEventRecord& record);
freight::exchange::v1::Bid           ToProto(const freight::db::model::BidRecord& record);
freight::exchange::v1::Match         ToProto(const freight::db::model::MatchRecord& record);
freight::exchange::v1::AuctionWindow ToProto(const freight::db::model::AuctionWindowRecord& record);
freight::exchange::v1::DriverProfile ToProto(const freight::db::model::DriverRecord& record);

freight::model::GeoPoint FromProto(const freight::exchange::v1::Location& location);

freight::exchange::v1::ShipmentStatus ToProto(freight::model::ShipmentStatus status);
freight::model::ShipmentStatus        FromProto(freight::exchange::v1::ShipmentStatus status);
freight::model::BidStatus             FromProto(freight::exchange::v1::BidStatus status);

// Unset timestamp -> 0.
uint64_t MillisOf(const google::protobuf::Timestamp& ts);

} // namespace freight::service
