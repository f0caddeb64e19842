#pragma once

#include <cstdint>
#include <string>

#include "internal/model/geo.hpp"

namespace freight::db::model {

struct DriverRecord {
  std::string id;

  // Normalized trust score in [0,1].
  double reputation = 0.0;

  uint64_t completed_jobs = 0;
  uint64_t on_time_jobs   = 0;
  uint64_t cancellations  = 0;
  uint64_t failures       = 0;

  freight::model::GeoPoint location;
  bool                     available = true;

  // 0 = unknown, treated as unlimited for backhaul filtering.
  double capacity_kg = 0.0;

  uint64_t updated_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace freight::db::model
