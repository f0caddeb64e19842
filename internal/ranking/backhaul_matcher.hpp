#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/shipment_record.hpp"
#include "internal/ranking/open_shipment_index.hpp"

namespace freight::ranking {

struct BackhaulOptions {
  double      radius_km         = 150.0;
  std::size_t max_results       = 10;
  double      grid_cell_degrees = 0.5;
};

/*
  Chained-load search.

  A backhaul for shipment s is another listed shipment whose origin lies
  within radius_km of s's destination, whose pickup window is still open
  when s's delivery window starts, and whose weight fits the vehicle.
*/
class BackhaulMatcher {
 public:
  BackhaulMatcher(std::shared_ptr<const OpenShipmentIndex> index, BackhaulOptions options);

  // capacity_kg <= 0 means unknown and is not filtered on.
  std::vector<NearbyShipment> Candidates(const freight::db::model::ShipmentRecord& shipment, double capacity_kg) const;

  // 1 - d/radius for the nearest candidate, 0 when there is none.
  double Bonus(const freight::db::model::ShipmentRecord& shipment, double capacity_kg) const;

  // Listed shipments picking up near an arbitrary point (a driver's position).
  std::vector<NearbyShipment> NearPoint(const freight::model::GeoPoint& point, double capacity_kg) const;

  const BackhaulOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<const OpenShipmentIndex> index_;
  BackhaulOptions                          options_;
};

} // namespace freight::ranking
