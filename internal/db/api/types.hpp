#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace freight::db {

struct ShipmentFilter {
  std::vector<freight::model::ShipmentStatus> statuses; // empty = any
  std::optional<std::string>                  shipper_id;
};

struct BidFilter {
  std::optional<std::string>               shipment_id;
  std::optional<std::string>               driver_id;
  std::optional<uint32_t>                  round;
  std::optional<freight::model::BidStatus> status;
};

struct MatchFilter {
  std::optional<std::string>                     shipment_id;
  std::optional<std::string>                     driver_id;
  std::optional<freight::model::ExecutionStatus> execution_status;
};

} // namespace freight::db
