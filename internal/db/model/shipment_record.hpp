#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/geo.hpp"
#include "internal/model/state_machine.hpp"

namespace freight::db::model {

/*
  Persistent shipment row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Version is bumped on every write and used for compare-and-swap.
*/

struct ShipmentRecord {
  std::string id;
  std::string shipper_id;

  freight::model::GeoPoint origin;
  freight::model::GeoPoint destination;

  double      weight_kg = 0.0;
  std::string cargo_type;
  std::string description;

  uint64_t pickup_start_ms   = 0;
  uint64_t pickup_end_ms     = 0;
  uint64_t delivery_start_ms = 0;
  uint64_t delivery_end_ms   = 0;

  std::optional<double> reserve_price;

  // Zero-bid close: true re-lists as Open, false cancels.
  bool relist_on_no_bids = true;

  freight::model::ShipmentStatus status = freight::model::ShipmentStatus::kUnspecified;

  // Incremented every time an auction window is created for this shipment.
  uint32_t auction_round = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  uint64_t version = 0;
};

} // namespace freight::db::model
