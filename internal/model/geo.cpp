#include "internal/model/geo.hpp"

#include <algorithm>
#include <cmath>

namespace freight::model {

namespace {

constexpr double kEarthRadiusKm = 6371.0088;
constexpr double kPi            = 3.14159265358979323846;

double ToRadians(double degrees) {
  return degrees * kPi / 180.0;
}

} // namespace

double DistanceKm(const GeoPoint& a, const GeoPoint& b) {
  const double dlat = ToRadians(b.latitude - a.latitude);
  const double dlon = ToRadians(b.longitude - a.longitude);
  const double h    = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(ToRadians(a.latitude)) * std::cos(ToRadians(b.latitude)) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

bool IsValid(const GeoPoint& point) {
  return std::isfinite(point.latitude) && std::isfinite(point.longitude) && point.latitude >= -90.0 && point.latitude <= 90.0 &&
         point.longitude >= -180.0 && point.longitude <= 180.0;
}

} // namespace freight::model
