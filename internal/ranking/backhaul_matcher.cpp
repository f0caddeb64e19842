#include "backhaul_matcher.hpp"

#include <algorithm>

namespace freight::ranking {

namespace {

bool Fits(const IndexedShipment& candidate, double capacity_kg) {
  return capacity_kg <= 0.0 || candidate.weight_kg <= capacity_kg;
}

} // namespace

BackhaulMatcher::BackhaulMatcher(std::shared_ptr<const OpenShipmentIndex> index, BackhaulOptions options)
    : index_(std::move(index)), options_(options) {
}

std::vector<NearbyShipment> BackhaulMatcher::Candidates(const freight::db::model::ShipmentRecord& shipment, double capacity_kg) const {
  const uint64_t delivery_start = shipment.delivery_start_ms;
  return index_->Nearby(shipment.destination, options_.radius_km, options_.max_results, shipment.id,
                        [&](const IndexedShipment& candidate) { return candidate.pickup_end_ms > delivery_start && Fits(candidate, capacity_kg); });
}

double BackhaulMatcher::Bonus(const freight::db::model::ShipmentRecord& shipment, double capacity_kg) const {
  const auto candidates = Candidates(shipment, capacity_kg);
  if (candidates.empty() || options_.radius_km <= 0.0) {
    return 0.0;
  }
  return std::clamp(1.0 - candidates.front().distance_km / options_.radius_km, 0.0, 1.0);
}

std::vector<NearbyShipment> BackhaulMatcher::NearPoint(const freight::model::GeoPoint& point, double capacity_kg) const {
  return index_->Nearby(point, options_.radius_km, options_.max_results, {},
                        [&](const IndexedShipment& candidate) { return Fits(candidate, capacity_kg); });
}

} // namespace freight::ranking
