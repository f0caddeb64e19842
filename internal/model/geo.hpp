#pragma once

#include <string>

namespace freight::model {

struct GeoPoint {
  double      latitude  = 0.0;
  double      longitude = 0.0;
  std::string label; // city or facility name, informational only
};

// Great-circle distance in kilometres.
double DistanceKm(const GeoPoint& a, const GeoPoint& b);

bool IsValid(const GeoPoint& point);

} // namespace freight::model
