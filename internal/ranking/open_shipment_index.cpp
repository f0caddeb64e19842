#include "open_shipment_index.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

#include "internal/model/state_machine.hpp"

namespace freight::ranking {

namespace {

constexpr double kKmPerDegreeLat = 111.32;
constexpr double kPi             = 3.14159265358979323846;

} // namespace

OpenShipmentIndex::OpenShipmentIndex(double grid_cell_degrees) : cell_degrees_(grid_cell_degrees) {
  if (!(cell_degrees_ > 0.0) || cell_degrees_ > 90.0) {
    throw std::invalid_argument("open shipment index: grid_cell_degrees must be in (0, 90]");
  }
  lat_cells_ = static_cast<int64_t>(std::ceil(180.0 / cell_degrees_));
  lon_cells_ = static_cast<int64_t>(std::ceil(360.0 / cell_degrees_));
}

OpenShipmentIndex::Cell OpenShipmentIndex::CellOf(const freight::model::GeoPoint& point) const {
  Cell cell;
  cell.lat = std::clamp<int64_t>(static_cast<int64_t>(std::floor((point.latitude + 90.0) / cell_degrees_)), 0, lat_cells_ - 1);
  cell.lon = static_cast<int64_t>(std::floor((point.longitude + 180.0) / cell_degrees_)) % lon_cells_;
  if (cell.lon < 0) cell.lon += lon_cells_;
  return cell;
}

int64_t OpenShipmentIndex::CellKey(int64_t lat, int64_t lon) const {
  return lat * lon_cells_ + lon;
}

void OpenShipmentIndex::Apply(const freight::db::model::ShipmentRecord& record) {
  std::unique_lock lock(mutex_);
  auto [seen, inserted] = versions_.try_emplace(record.id, record.version);
  if (!inserted) {
    if (record.version < seen->second) return;
    seen->second = record.version;
  }

  RemoveUnlocked(record.id);
  if (!freight::model::IsListed(record.status)) {
    return;
  }

  IndexedShipment entry;
  entry.id                = record.id;
  entry.origin            = record.origin;
  entry.destination       = record.destination;
  entry.weight_kg         = record.weight_kg;
  entry.pickup_end_ms     = record.pickup_end_ms;
  entry.delivery_start_ms = record.delivery_start_ms;

  const auto cell = CellOf(record.origin);
  const auto key  = CellKey(cell.lat, cell.lon);
  cells_[key].push_back(record.id);
  entry_cell_[record.id] = key;
  entries_[record.id]    = std::move(entry);
}

void OpenShipmentIndex::Remove(const std::string& shipment_id) {
  std::unique_lock lock(mutex_);
  RemoveUnlocked(shipment_id);
}

void OpenShipmentIndex::RemoveUnlocked(const std::string& shipment_id) {
  auto it = entry_cell_.find(shipment_id);
  if (it == entry_cell_.end()) return;

  auto cell = cells_.find(it->second);
  if (cell != cells_.end()) {
    auto& ids = cell->second;
    ids.erase(std::remove(ids.begin(), ids.end(), shipment_id), ids.end());
    if (ids.empty()) cells_.erase(cell);
  }
  entries_.erase(shipment_id);
  entry_cell_.erase(it);
}

std::vector<NearbyShipment> OpenShipmentIndex::Nearby(const freight::model::GeoPoint& point, double radius_km, std::size_t limit,
                                                      const std::string& exclude_id, const Filter& filter) const {
  std::vector<NearbyShipment> hits;
  if (!(radius_km > 0.0) || limit == 0) return hits;

  const double dlat    = radius_km / kKmPerDegreeLat;
  const double min_lat = std::max(-90.0, point.latitude - dlat);
  const double max_lat = std::min(90.0, point.latitude + dlat);

  const int64_t lat_lo = CellOf({min_lat, point.longitude, {}}).lat;
  const int64_t lat_hi = CellOf({max_lat, point.longitude, {}}).lat;

  // Longitude span widens with latitude; near the poles scan the whole ring.
  const double widest_lat = std::max(std::abs(min_lat), std::abs(max_lat));
  const double cos_lat    = std::cos(widest_lat * kPi / 180.0);
  int64_t      lon_span   = lon_cells_;
  if (cos_lat > 1e-6) {
    const double dlon = radius_km / (kKmPerDegreeLat * cos_lat);
    if (dlon < 180.0) {
      lon_span = static_cast<int64_t>(std::ceil(dlon / cell_degrees_)) * 2 + 1;
    }
  }
  lon_span = std::min(lon_span, lon_cells_);

  const int64_t lon_center = CellOf(point).lon;
  const int64_t lon_first  = lon_span == lon_cells_ ? 0 : lon_center - lon_span / 2;

  std::shared_lock lock(mutex_);
  for (int64_t lat = lat_lo; lat <= lat_hi; ++lat) {
    for (int64_t step = 0; step < lon_span; ++step) {
      int64_t lon = (lon_first + step) % lon_cells_;
      if (lon < 0) lon += lon_cells_;

      auto cell = cells_.find(CellKey(lat, lon));
      if (cell == cells_.end()) continue;

      for (const auto& id : cell->second) {
        if (id == exclude_id) continue;
        const auto& entry    = entries_.at(id);
        const double distance = freight::model::DistanceKm(point, entry.origin);
        if (distance > radius_km) continue;
        if (filter && !filter(entry)) continue;
        hits.push_back({entry, distance});
      }
    }
  }
  lock.unlock();

  std::sort(hits.begin(), hits.end(), [](const NearbyShipment& a, const NearbyShipment& b) {
    if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
    return a.shipment.id < b.shipment.id;
  });
  if (hits.size() > limit) hits.resize(limit);
  return hits;
}

std::size_t OpenShipmentIndex::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace freight::ranking
