#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace freight::db::model {

// Append-only audit entry written for every successful ledger transition.
struct ShipmentEventRecord {
  std::string shipment_id;
  uint64_t    sequence = 0;

  freight::model::ShipmentStatus from = freight::model::ShipmentStatus::kUnspecified;
  freight::model::ShipmentStatus to   = freight::model::ShipmentStatus::kUnspecified;

  std::string reason;
  uint64_t    at_ms = 0;
};

} // namespace freight::db::model
