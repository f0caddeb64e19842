#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace freight::db::model {

/*
  Committed pairing of a shipment with its winning bid.

  Created once per auction round; afterwards only execution_status moves.
*/

struct MatchRecord {
  std::string id;
  std::string shipment_id;
  std::string bid_id;
  std::string driver_id;

  double   price = 0.0;
  uint32_t round = 0;

  uint64_t committed_at_ms = 0;
  uint64_t updated_at_ms   = 0;

  freight::model::ExecutionStatus execution_status = freight::model::ExecutionStatus::kUnspecified;

  uint64_t version = 0;
};

} // namespace freight::db::model
