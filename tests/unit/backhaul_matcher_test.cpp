#include "internal/ranking/backhaul_matcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "exchange_fixture.hpp"

namespace {

using freight::db::model::ShipmentRecord;
using freight::model::ShipmentStatus;
using freight::ranking::BackhaulMatcher;
using freight::ranking::BackhaulOptions;
using freight::ranking::OpenShipmentIndex;
using freight::testing::kHourMs;
using freight::testing::kStartMs;
using freight::testing::Point;

ShipmentRecord Listed(const std::string& id, double lat, double lon, double weight_kg, uint64_t pickup_end_ms) {
  ShipmentRecord record;
  record.id                = id;
  record.shipper_id        = "shipper-" + id;
  record.origin            = Point(lat, lon);
  record.destination       = Point(lat + 1.0, lon + 1.0);
  record.weight_kg         = weight_kg;
  record.pickup_start_ms   = kStartMs;
  record.pickup_end_ms     = pickup_end_ms;
  record.delivery_start_ms = pickup_end_ms + kHourMs;
  record.delivery_end_ms   = pickup_end_ms + 4 * kHourMs;
  record.status            = ShipmentStatus::kOpen;
  return record;
}

// Chicago -> Indianapolis, delivery from +8h.
ShipmentRecord Outbound() {
  ShipmentRecord record;
  record.id                = "outbound";
  record.origin            = Point(41.8781, -87.6298);
  record.destination       = Point(39.7684, -86.1581);
  record.weight_kg         = 8000.0;
  record.delivery_start_ms = kStartMs + 8 * kHourMs;
  record.delivery_end_ms   = kStartMs + 12 * kHourMs;
  record.status            = ShipmentStatus::kMatched;
  return record;
}

void TestIndexTracksListedShipmentsOnly() {
  OpenShipmentIndex index(0.5);

  auto a = Listed("a", 39.79, -86.15, 1000.0, kStartMs + 10 * kHourMs);
  index.Apply(a);
  assert(index.Size() == 1);

  a.status = ShipmentStatus::kBidding;
  index.Apply(a);
  assert(index.Size() == 1);

  a.status = ShipmentStatus::kMatched;
  index.Apply(a);
  assert(index.Size() == 0);

  auto b = Listed("b", 39.79, -86.15, 1000.0, kStartMs + 10 * kHourMs);
  index.Apply(b);
  index.Remove("b");
  index.Remove("missing");
  assert(index.Size() == 0);
}

void TestIndexIgnoresOutOfOrderRecords() {
  OpenShipmentIndex index(0.5);

  // Matched (v4) then a re-auction back to Bidding (v5) announced first.
  auto rebid    = Listed("s", 39.79, -86.15, 1000.0, kStartMs + 10 * kHourMs);
  rebid.status  = ShipmentStatus::kBidding;
  rebid.version = 5;
  index.Apply(rebid);

  auto matched    = rebid;
  matched.status  = ShipmentStatus::kMatched;
  matched.version = 4;
  index.Apply(matched);
  assert(index.Size() == 1);

  // A late listed record must not resurrect a shipment that has since left the market.
  auto cancelled    = rebid;
  cancelled.status  = ShipmentStatus::kCancelled;
  cancelled.version = 6;
  index.Apply(cancelled);
  assert(index.Size() == 0);

  index.Apply(rebid);
  assert(index.Size() == 0);
}

void TestNearbyIsSortedAndBounded() {
  OpenShipmentIndex index(0.5);
  index.Apply(Listed("far", 39.95, -86.40, 1000.0, kStartMs));
  index.Apply(Listed("near", 39.77, -86.16, 1000.0, kStartMs));
  index.Apply(Listed("mid", 39.85, -86.25, 1000.0, kStartMs));
  index.Apply(Listed("detroit", 42.33, -83.05, 1000.0, kStartMs));

  const auto hits = index.Nearby(Point(39.7684, -86.1581), 100.0, 10);
  assert(hits.size() == 3);
  assert(hits[0].shipment.id == "near");
  assert(hits[1].shipment.id == "mid");
  assert(hits[2].shipment.id == "far");
  assert(hits[0].distance_km <= hits[1].distance_km);

  const auto limited = index.Nearby(Point(39.7684, -86.1581), 100.0, 1, "near");
  assert(limited.size() == 1);
  assert(limited[0].shipment.id == "mid");

  assert(index.Nearby(Point(39.7684, -86.1581), 0.0, 10).empty());
}

void TestCandidatesRespectTimingAndWeight() {
  auto index = std::make_shared<OpenShipmentIndex>(0.5);
  index->Apply(Listed("fits", 39.80, -86.10, 5000.0, kStartMs + 10 * kHourMs));
  index->Apply(Listed("too-early", 39.78, -86.16, 5000.0, kStartMs + 7 * kHourMs));
  index->Apply(Listed("too-heavy", 39.77, -86.15, 30000.0, kStartMs + 10 * kHourMs));
  index->Apply(Listed("too-far", 42.33, -83.05, 5000.0, kStartMs + 10 * kHourMs));

  BackhaulMatcher matcher(index, BackhaulOptions{});
  const auto      shipment = Outbound();

  const auto capped = matcher.Candidates(shipment, 20000.0);
  assert(capped.size() == 1);
  assert(capped[0].shipment.id == "fits");

  // Unknown capacity does not filter on weight.
  const auto uncapped = matcher.Candidates(shipment, 0.0);
  assert(uncapped.size() == 2);
  assert(uncapped[0].shipment.id == "too-heavy");
}

void TestBonusFallsWithDistance() {
  auto index = std::make_shared<OpenShipmentIndex>(0.5);
  BackhaulMatcher matcher(index, BackhaulOptions{});
  const auto      shipment = Outbound();

  assert(matcher.Bonus(shipment, 20000.0) == 0.0);

  index->Apply(Listed("distant", 40.60, -86.16, 5000.0, kStartMs + 10 * kHourMs));
  const double distant = matcher.Bonus(shipment, 20000.0);
  assert(distant > 0.0 && distant < 0.5);

  index->Apply(Listed("close", 39.77, -86.16, 5000.0, kStartMs + 10 * kHourMs));
  const double close = matcher.Bonus(shipment, 20000.0);
  assert(close > 0.95 && close <= 1.0);
}

void TestNearPointIgnoresTiming() {
  auto index = std::make_shared<OpenShipmentIndex>(0.5);
  index->Apply(Listed("x", 41.85, -87.65, 5000.0, kStartMs));
  BackhaulMatcher matcher(index, BackhaulOptions{});

  const auto hits = matcher.NearPoint(Point(41.8781, -87.6298), 10000.0);
  assert(hits.size() == 1);
  assert(matcher.NearPoint(Point(41.8781, -87.6298), 1000.0).empty());
}

} // namespace

int main() {
  TestIndexTracksListedShipmentsOnly();
  TestIndexIgnoresOutOfOrderRecords();
  TestNearbyIsSortedAndBounded();
  TestCandidatesRespectTimingAndWeight();
  TestBonusFallsWithDistance();
  TestNearPointIgnoresTiming();

  std::cout << "freight_exchange_unit_backhaul_matcher: pass\n";
  return 0;
}
