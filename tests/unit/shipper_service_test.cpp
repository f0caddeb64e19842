#include "internal/service/shipper_service.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "service_fixture.hpp"

namespace {

using namespace freight::exchange::v1;

using freight::service::ShipperService;
using freight::testing::ContextFor;
using freight::testing::Exchange;
using freight::testing::kHourMs;
using freight::testing::kStartMs;
using freight::testing::Throws;
using freight::testing::TimestampAt;

PostShipmentRequest PostRequest(const std::string& shipper_id, bool publish) {
  PostShipmentRequest req;
  req.set_shipper_id(shipper_id);
  req.mutable_origin()->set_latitude(41.8781);
  req.mutable_origin()->set_longitude(-87.6298);
  req.mutable_origin()->set_label("Chicago");
  req.mutable_destination()->set_latitude(39.7684);
  req.mutable_destination()->set_longitude(-86.1581);
  req.mutable_cargo()->set_weight_kg(9000.0);
  req.mutable_cargo()->set_cargo_type("reefer");
  *req.mutable_pickup_window()->mutable_start()   = TimestampAt(kStartMs + 2 * kHourMs);
  *req.mutable_pickup_window()->mutable_end()     = TimestampAt(kStartMs + 6 * kHourMs);
  *req.mutable_delivery_window()->mutable_start() = TimestampAt(kStartMs + 8 * kHourMs);
  *req.mutable_delivery_window()->mutable_end()   = TimestampAt(kStartMs + 12 * kHourMs);
  req.set_publish(publish);
  return req;
}

void TestPostAndPublish() {
  Exchange       ex;
  ShipperService service(ContextFor(ex));

  const auto draft = service.PostShipment(PostRequest("shipper-1", false)).shipment();
  assert(draft.status() == SHIPMENT_STATUS_DRAFT);
  assert(draft.relist_on_no_bids());
  assert(!draft.has_reserve_price());
  assert(draft.pickup_window().start().seconds() == static_cast<int64_t>((kStartMs + 2 * kHourMs) / 1000));

  PublishShipmentRequest publish;
  publish.set_shipment_id(draft.id());
  assert(service.PublishShipment(publish).shipment().status() == SHIPMENT_STATUS_OPEN);
  assert(Throws<freight::util::Conflict>([&] { service.PublishShipment(publish); }));

  auto with_reserve = PostRequest("shipper-1", true);
  with_reserve.set_reserve_price(650.0);
  with_reserve.set_relist_on_no_bids(false);
  const auto listed = service.PostShipment(with_reserve).shipment();
  assert(listed.status() == SHIPMENT_STATUS_OPEN);
  assert(listed.reserve_price() == 650.0);
  assert(!listed.relist_on_no_bids());

  auto bad = PostRequest("shipper-1", true);
  bad.mutable_cargo()->set_weight_kg(-1.0);
  assert(Throws<freight::util::ValidationError>([&] { service.PostShipment(bad); }));
}

void TestAuctionThroughService() {
  Exchange       ex;
  ShipperService service(ContextFor(ex));

  const auto shipment = service.PostShipment(PostRequest("shipper-1", true)).shipment();

  OpenAuctionRequest open;
  open.set_shipment_id(shipment.id());
  open.set_duration_ms(0);
  const auto window = service.OpenAuction(open).window();
  assert(window.state() == AUCTION_STATE_OPEN);
  assert(window.round() == 1);
  assert(!window.has_closes_at());

  ex.Bid(shipment.id(), "driver-a", 700.0);
  ex.Bid(shipment.id(), "driver-b", 610.0);
  ex.Bid(shipment.id(), "driver-c", 655.0);

  GetShipmentRequest get;
  get.set_shipment_id(shipment.id());
  auto view = service.GetShipment(get);
  assert(view.shipment().status() == SHIPMENT_STATUS_BIDDING);
  assert(view.bids_size() == 3);
  assert(view.bids(0).driver_id() == "driver-b");
  assert(view.bids(1).driver_id() == "driver-c");
  assert(view.bids(2).driver_id() == "driver-a");
  assert(!view.has_match());

  CloseAuctionRequest close;
  close.set_shipment_id(shipment.id());
  const auto closed = service.CloseAuction(close);
  assert(closed.has_match());
  assert(closed.match().driver_id() == "driver-b");
  assert(closed.match().execution_status() == EXECUTION_STATUS_ASSIGNED);
  assert(closed.shipment().status() == SHIPMENT_STATUS_MATCHED);

  view = service.GetShipment(get);
  assert(view.match().id() == closed.match().id());
  assert(view.window().state() == AUCTION_STATE_COMMITTED);
  assert(view.window().match_id() == closed.match().id());
  assert(view.events_size() == 4);
  assert(view.events(3).to() == SHIPMENT_STATUS_MATCHED);
  assert(view.bids(0).status() == BID_STATUS_WON);

  CancelShipmentRequest cancel;
  cancel.set_shipment_id(shipment.id());
  assert(Throws<freight::util::InvalidState>([&] { service.CancelShipment(cancel); }));
}

void TestScheduleNeedsOpensAt() {
  Exchange       ex;
  ShipperService service(ContextFor(ex));
  const auto     shipment = service.PostShipment(PostRequest("shipper-1", true)).shipment();

  ScheduleAuctionRequest schedule;
  schedule.set_shipment_id(shipment.id());
  assert(Throws<freight::util::ValidationError>([&] { service.ScheduleAuction(schedule); }));

  *schedule.mutable_opens_at() = TimestampAt(kStartMs + kHourMs);
  const auto window            = service.ScheduleAuction(schedule).window();
  assert(window.state() == AUCTION_STATE_PENDING);
  assert(window.opens_at().seconds() == static_cast<int64_t>((kStartMs + kHourMs) / 1000));

  CloseAuctionRequest close;
  close.set_shipment_id(shipment.id());
  assert(Throws<freight::util::InvalidState>([&] { service.CloseAuction(close); }));

  CancelShipmentRequest cancel;
  cancel.set_shipment_id(shipment.id());
  cancel.set_reason("customer postponed");
  const auto cancelled = service.CancelShipment(cancel).shipment();
  assert(cancelled.status() == SHIPMENT_STATUS_CANCELLED);
}

void TestListShipmentsFilters() {
  Exchange       ex;
  ShipperService service(ContextFor(ex));
  service.PostShipment(PostRequest("shipper-1", false));
  service.PostShipment(PostRequest("shipper-1", true));
  service.PostShipment(PostRequest("shipper-2", true));

  ListShipmentsRequest mine;
  mine.set_shipper_id("shipper-1");
  assert(service.ListShipments(mine).shipments_size() == 2);

  ListShipmentsRequest open;
  open.add_statuses(SHIPMENT_STATUS_OPEN);
  assert(service.ListShipments(open).shipments_size() == 2);

  mine.add_statuses(SHIPMENT_STATUS_OPEN);
  assert(service.ListShipments(mine).shipments_size() == 1);

  ListShipmentsRequest all;
  assert(service.ListShipments(all).shipments_size() == 3);

  ListShipmentsRequest bad;
  bad.add_statuses(SHIPMENT_STATUS_UNSPECIFIED);
  assert(Throws<freight::util::ValidationError>([&] { service.ListShipments(bad); }));
}

void TestNoShowAndMissingShipment() {
  Exchange       ex;
  ShipperService service(ContextFor(ex));

  GetShipmentRequest missing;
  missing.set_shipment_id("shp-missing");
  assert(Throws<freight::util::NotFound>([&] { service.GetShipment(missing); }));

  const auto shipment = service.PostShipment(PostRequest("shipper-1", true)).shipment();
  OpenAuctionRequest open;
  open.set_shipment_id(shipment.id());
  service.OpenAuction(open);
  ex.Bid(shipment.id(), "driver-a", 600.0);
  CloseAuctionRequest close;
  close.set_shipment_id(shipment.id());
  service.CloseAuction(close);

  ReportNoShowRequest no_show;
  no_show.set_shipment_id(shipment.id());
  assert(Throws<freight::util::InvalidState>([&] { service.ReportNoShow(no_show); }));

  ex.clock.Advance(3 * kHourMs);
  const auto reopened = service.ReportNoShow(no_show).shipment();
  assert(reopened.status() == SHIPMENT_STATUS_BIDDING);
  assert(reopened.auction_round() == 2);
}

} // namespace

int main() {
  TestPostAndPublish();
  TestAuctionThroughService();
  TestScheduleNeedsOpensAt();
  TestListShipmentsFilters();
  TestNoShowAndMissingShipment();

  std::cout << "freight_exchange_unit_shipper_service: pass\n";
  return 0;
}
