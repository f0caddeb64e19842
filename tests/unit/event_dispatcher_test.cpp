#include "internal/outbound/event_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "exchange_fixture.hpp"

namespace {

using freight::outbound::Escalation;
using freight::outbound::EventDispatcher;
using freight::outbound::Notification;
using freight::outbound::NotificationKind;
using freight::outbound::SettlementInstruction;
using freight::testing::RecordingSinks;

class ThrowingNotifications final : public freight::outbound::NotificationSink {
 public:
  void Notify(const Notification& event) override {
    ++calls;
    if (event.recipient_id == "broken") {
      throw std::runtime_error("push gateway unavailable");
    }
  }

  int calls = 0;
};

Notification Note(NotificationKind kind, const std::string& recipient) {
  Notification n;
  n.kind         = kind;
  n.recipient_id = recipient;
  n.shipment_id  = "shp-1";
  return n;
}

void TestFlushDeliversInlineWithoutWorker() {
  auto            sinks = std::make_shared<RecordingSinks>();
  EventDispatcher dispatcher(sinks, sinks, sinks);

  dispatcher.Publish(Note(NotificationKind::kAuctionOpened, "shipper-1"));
  SettlementInstruction settlement;
  settlement.match_id = "mch-1";
  settlement.price    = 480.0;
  dispatcher.Publish(settlement);
  Escalation escalation;
  escalation.match_id = "mch-1";
  dispatcher.Publish(escalation);

  // Publish never delivers on its own.
  assert(sinks->Notifications(NotificationKind::kAuctionOpened).empty());

  dispatcher.Flush();
  assert(sinks->Notifications(NotificationKind::kAuctionOpened).size() == 1);
  assert(sinks->Settlements().size() == 1);
  assert(sinks->Settlements()[0].price == 480.0);
  assert(sinks->Escalations().size() == 1);
  assert(dispatcher.Delivered() == 3);
}

void TestWorkerDeliversInPublishOrder() {
  auto            sinks = std::make_shared<RecordingSinks>();
  EventDispatcher dispatcher(sinks, sinks, sinks);
  dispatcher.Start();

  for (int i = 0; i < 50; ++i) {
    dispatcher.Publish(Note(NotificationKind::kBidOutbid, "driver-" + std::to_string(i)));
  }
  dispatcher.Flush();

  const auto delivered = sinks->Notifications(NotificationKind::kBidOutbid);
  assert(delivered.size() == 50);
  for (int i = 0; i < 50; ++i) {
    assert(delivered[i].recipient_id == "driver-" + std::to_string(i));
  }
  dispatcher.Stop();
}

void TestStopDrainsQueue() {
  auto sinks = std::make_shared<RecordingSinks>();
  {
    EventDispatcher dispatcher(sinks, sinks, sinks);
    dispatcher.Start();
    for (int i = 0; i < 20; ++i) {
      dispatcher.Publish(Note(NotificationKind::kAuctionLost, "driver"));
    }
    dispatcher.Stop();
    assert(dispatcher.Delivered() == 20);
    dispatcher.Stop();
  }
  assert(sinks->Notifications(NotificationKind::kAuctionLost).size() == 20);
}

void TestFailingSinkIsSkipped() {
  auto            notifications = std::make_shared<ThrowingNotifications>();
  EventDispatcher dispatcher(notifications, nullptr, nullptr);

  dispatcher.Publish(Note(NotificationKind::kAuctionWon, "broken"));
  dispatcher.Publish(Note(NotificationKind::kAuctionWon, "driver-ok"));
  dispatcher.Publish(SettlementInstruction{});

  dispatcher.Flush();
  assert(notifications->calls == 2);
  assert(dispatcher.Delivered() == 3);
}

} // namespace

int main() {
  TestFlushDeliversInlineWithoutWorker();
  TestWorkerDeliversInPublishOrder();
  TestStopDrainsQueue();
  TestFailingSinkIsSkipped();

  std::cout << "freight_exchange_unit_event_dispatcher: pass\n";
  return 0;
}
