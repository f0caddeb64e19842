#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace freight::db::model {

/*
  One bidding round for a shipment. Keyed by (shipment_id, round).
*/

struct AuctionWindowRecord {
  std::string shipment_id;
  uint32_t    round = 0;

  freight::model::AuctionState state = freight::model::AuctionState::kUnspecified;

  uint64_t opens_at_ms  = 0;
  uint64_t closes_at_ms = 0; // 0 = explicit close only

  uint32_t bid_limit = 0; // 0 = unlimited
  bool     closed    = false;

  // Set when the round commits.
  std::string match_id;

  uint64_t version = 0;
};

} // namespace freight::db::model
