#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/shipment_record.hpp"
#include "internal/model/geo.hpp"

namespace freight::ranking {

// Snapshot of the fields backhaul search needs from a listed shipment.
struct IndexedShipment {
  std::string              id;
  freight::model::GeoPoint origin;
  freight::model::GeoPoint destination;
  double                   weight_kg         = 0.0;
  uint64_t                 pickup_end_ms     = 0;
  uint64_t                 delivery_start_ms = 0;
};

struct NearbyShipment {
  IndexedShipment shipment;
  double          distance_km = 0.0;
};

/*
  In-memory grid of Open/Bidding shipments keyed by origin.

  Cells are grid_cell_degrees square in lat/lon. The index is a read model
  fed by the ledger after commits; readers never touch the repository or
  any shipment lock, so results may briefly lag the store. Announcements
  can arrive out of order after the shipment lock is released, so the last
  applied version is kept per id, including for ids no longer listed.
*/
class OpenShipmentIndex {
 public:
  using Filter = std::function<bool(const IndexedShipment&)>;

  explicit OpenShipmentIndex(double grid_cell_degrees);

  // Inserts or refreshes a listed shipment; removes it once it leaves Open/Bidding.
  // Records older than the last applied version of the same id are ignored.
  void Apply(const freight::db::model::ShipmentRecord& record);
  void Remove(const std::string& shipment_id);

  // Nearest origins within radius_km of point, closest first (ties by id).
  std::vector<NearbyShipment> Nearby(const freight::model::GeoPoint& point, double radius_km, std::size_t limit,
                                     const std::string& exclude_id = {}, const Filter& filter = {}) const;

  std::size_t Size() const;

 private:
  struct Cell {
    int64_t lat = 0;
    int64_t lon = 0;
  };

  Cell    CellOf(const freight::model::GeoPoint& point) const;
  int64_t CellKey(int64_t lat, int64_t lon) const;
  void    RemoveUnlocked(const std::string& shipment_id);

  double  cell_degrees_;
  int64_t lat_cells_;
  int64_t lon_cells_;

  mutable std::shared_mutex                                  mutex_;
  std::unordered_map<std::string, IndexedShipment>           entries_;
  std::unordered_map<std::string, int64_t>                   entry_cell_;
  std::unordered_map<int64_t, std::vector<std::string>>      cells_;
  std::unordered_map<std::string, uint64_t>                  versions_;
};

} // namespace freight::ranking
