#pragma once

#include <cstdint>
#include <string>

#include "internal/model/geo.hpp"
#include "internal/model/state_machine.hpp"

namespace freight::db::model {

struct BidRecord {
  std::string id;
  std::string shipment_id;
  uint32_t    round = 0;
  std::string driver_id;

  double   price           = 0.0;
  uint64_t submitted_at_ms = 0;

  // Driver position and ETA to the shipment origin at submission time.
  freight::model::GeoPoint driver_location;
  double                   eta_minutes = 0.0;

  std::string message;

  freight::model::BidStatus status = freight::model::BidStatus::kUnspecified;

  uint64_t version = 0;
};

} // namespace freight::db::model
