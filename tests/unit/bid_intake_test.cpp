#include "internal/auction/bid_intake.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "exchange_fixture.hpp"
#include "internal/util/errors.hpp"

namespace {

using freight::auction::AuctionOptions;
using freight::auction::BidSubmission;
using freight::model::BidStatus;
using freight::model::CloseTrigger;
using freight::model::ShipmentStatus;
using freight::outbound::NotificationKind;
using freight::testing::Exchange;
using freight::testing::kMinuteMs;
using freight::testing::MakeDraft;
using freight::testing::Throws;

void TestSubmitRecordsActiveBid() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());
  assert(shipment.status == ShipmentStatus::kBidding);

  const auto bid = ex.Bid(shipment.id, "driver-a", 500.0, 25.0);
  assert(bid.status == BidStatus::kActive);
  assert(bid.round == 1);
  assert(bid.price == 500.0);
  assert(bid.eta_minutes == 25.0);
  assert(bid.submitted_at_ms == freight::testing::kStartMs);

  // First bid creates the driver profile at the neutral score.
  const auto profile = ex.scorer->FindDriver("driver-a");
  assert(profile.has_value());
  assert(std::fabs(profile->reputation - 0.5) < 1e-12);
}

void TestInvalidBidsAreRejected() {
  AuctionOptions options;
  options.min_price_floor = 100.0;
  Exchange   ex(options);
  const auto shipment = ex.PostAndOpen(MakeDraft());

  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "driver-a", 0.0); }));
  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "driver-a", -5.0); }));
  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "driver-a", std::nan("")); }));
  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "driver-a", 99.0); }));
  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "driver-a", 150.0, -1.0); }));
  assert(Throws<freight::util::ValidationError>([&] { ex.Bid(shipment.id, "", 150.0); }));

  BidSubmission off_map;
  off_map.shipment_id        = shipment.id;
  off_map.driver_id          = "driver-a";
  off_map.price              = 150.0;
  off_map.location.latitude  = 95.0;
  off_map.location.longitude = 0.0;
  assert(Throws<freight::util::ValidationError>([&] { ex.intake->Submit(off_map); }));

  assert(Throws<freight::util::NotFound>([&] { ex.Bid("shp-missing", "driver-a", 150.0); }));
  assert(ex.intake->ListForDriver("driver-a", {}).empty());
}

void TestBidsNeedAnOpenAuction() {
  Exchange ex;

  const auto listed = ex.Post(MakeDraft());
  assert(Throws<freight::util::InvalidState>([&] { ex.Bid(listed.id, "driver-a", 500.0); }));

  ex.coordinator->Schedule(listed.id, freight::testing::kStartMs + 10 * kMinuteMs);
  assert(Throws<freight::util::InvalidState>([&] { ex.Bid(listed.id, "driver-a", 500.0); }));

  const auto shipment = ex.PostAndOpen(MakeDraft());
  ex.Bid(shipment.id, "driver-a", 500.0);
  ex.coordinator->Close(shipment.id, CloseTrigger::kShipper);
  assert(Throws<freight::util::AuctionClosed>([&] { ex.Bid(shipment.id, "driver-b", 450.0); }));
}

void TestBidsAfterDeadlineAreRejected() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());

  ex.clock.Advance(15 * kMinuteMs);
  assert(Throws<freight::util::AuctionClosed>([&] { ex.Bid(shipment.id, "driver-a", 500.0); }));
  // The timer has not fired yet; the shipment is still in Bidding.
  assert(ex.ledger->Get(shipment.id).status == ShipmentStatus::kBidding);
}

void TestOneActiveBidPerDriver() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());

  ex.Bid(shipment.id, "driver-a", 500.0);
  assert(Throws<freight::util::AlreadyExists>([&] { ex.Bid(shipment.id, "driver-a", 450.0); }));
}

void TestConcurrentDuplicateSubmitsAdmitExactlyOne() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());

  std::atomic<int>         accepted{0};
  std::atomic<int>         duplicates{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        ex.Bid(shipment.id, "driver-a", 400.0 + i);
        ++accepted;
      } catch (const freight::util::AlreadyExists&) {
        ++duplicates;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(accepted == 1);
  assert(duplicates == 7);
  assert(ex.intake->ListForDriver("driver-a", {BidStatus::kActive}).size() == 1);
}

void TestSubmitsRacingCloseLeaveNoActiveBids() {
  for (int iteration = 0; iteration < 20; ++iteration) {
    Exchange   ex;
    const auto shipment = ex.PostAndOpen(MakeDraft());

    std::atomic<bool>        go{false};
    std::atomic<int>         accepted{0};
    std::atomic<int>         too_late{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&, i] {
        while (!go) std::this_thread::yield();
        try {
          ex.Bid(shipment.id, "driver-" + std::to_string(i), 400.0 + i);
          ++accepted;
        } catch (const freight::util::AuctionClosed&) {
          ++too_late;
        }
      });
    }

    std::optional<freight::db::model::MatchRecord> match;
    std::thread closer([&] {
      while (!go) std::this_thread::yield();
      match = ex.coordinator->Close(shipment.id, CloseTrigger::kShipper).match;
    });

    go = true;
    for (auto& t : threads) t.join();
    closer.join();

    assert(accepted + too_late == 8);

    auto                   tx = ex.repository->Begin();
    freight::db::BidFilter filter;
    filter.shipment_id = shipment.id;
    filter.round       = 1;
    const auto bids    = ex.repository->ListBids(*tx, filter);
    tx->Commit();

    assert(static_cast<int>(bids.size()) == accepted);
    for (const auto& bid : bids) {
      assert(bid.status != BidStatus::kActive);
    }
    assert(match.has_value() == (accepted > 0));
    if (match) {
      assert(ex.ledger->Get(shipment.id).status == ShipmentStatus::kMatched);
    } else {
      assert(ex.ledger->Get(shipment.id).status == ShipmentStatus::kOpen);
    }
    assert(ex.shipment_locks->Size() == 0);
  }
}

void TestLowerBidNotifiesOutbidDrivers() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());

  const auto a = ex.Bid(shipment.id, "driver-a", 500.0);
  ex.Bid(shipment.id, "driver-b", 520.0);
  ex.dispatcher->Flush();
  assert(ex.sinks->Notifications(NotificationKind::kBidOutbid).empty());

  ex.Bid(shipment.id, "driver-c", 480.0);
  ex.dispatcher->Flush();
  auto outbid = ex.sinks->Notifications(NotificationKind::kBidOutbid);
  assert(outbid.size() == 1);
  assert(outbid[0].recipient_id == "driver-a");
  assert(outbid[0].bid_id == a.id);

  // Matching the best price is not an outbid.
  ex.Bid(shipment.id, "driver-d", 480.0);
  ex.dispatcher->Flush();
  assert(ex.sinks->Notifications(NotificationKind::kBidOutbid).size() == 1);
}

void TestWithdrawActiveBid() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());
  const auto bid      = ex.Bid(shipment.id, "driver-a", 500.0);

  assert(Throws<freight::util::ValidationError>([&] { ex.intake->Withdraw(bid.id, "driver-b"); }));
  assert(Throws<freight::util::NotFound>([&] { ex.intake->Withdraw("bid-missing", "driver-a"); }));

  const auto withdrawn = ex.intake->Withdraw(bid.id, "driver-a");
  assert(withdrawn.status == BidStatus::kWithdrawn);
  assert(withdrawn.version == bid.version + 1);
  assert(std::fabs(ex.scorer->Score("driver-a") - 0.49) < 1e-12);

  assert(Throws<freight::util::AuctionClosed>([&] { ex.intake->Withdraw(bid.id, "driver-a"); }));

  // A withdrawn bid frees the driver to bid again.
  const auto again = ex.Bid(shipment.id, "driver-a", 480.0);
  assert(again.status == BidStatus::kActive);
  assert(ex.intake->ListForDriver("driver-a", {}).size() == 2);
  assert(ex.intake->ListForDriver("driver-a", {BidStatus::kWithdrawn}).size() == 1);
  assert(Throws<freight::util::ValidationError>([&] { ex.intake->ListForDriver("", {}); }));
}

void TestLosingBidCannotBeWithdrawn() {
  Exchange   ex;
  const auto shipment = ex.PostAndOpen(MakeDraft());
  ex.Bid(shipment.id, "driver-a", 450.0);
  const auto loser = ex.Bid(shipment.id, "driver-b", 600.0);
  ex.coordinator->Close(shipment.id, CloseTrigger::kShipper);

  assert(Throws<freight::util::AuctionClosed>([&] { ex.intake->Withdraw(loser.id, "driver-b"); }));
  assert(std::fabs(ex.scorer->Score("driver-b") - 0.5) < 1e-12);
}

void TestBidLimitClosesAuction() {
  Exchange   ex;
  const auto shipment = ex.Post(MakeDraft());
  const auto window   = ex.coordinator->Open(shipment.id, std::nullopt, 2);
  assert(window.bid_limit == 2);

  ex.Bid(shipment.id, "driver-a", 500.0);
  assert(ex.ledger->Get(shipment.id).status == ShipmentStatus::kBidding);

  ex.Bid(shipment.id, "driver-b", 470.0);
  assert(ex.ledger->Get(shipment.id).status == ShipmentStatus::kMatched);

  const auto bids = ex.intake->ListForDriver("driver-b", {BidStatus::kWon});
  assert(bids.size() == 1);
  assert(Throws<freight::util::AuctionClosed>([&] { ex.Bid(shipment.id, "driver-c", 400.0); }));
}

} // namespace

int main() {
  TestSubmitRecordsActiveBid();
  TestInvalidBidsAreRejected();
  TestBidsNeedAnOpenAuction();
  TestBidsAfterDeadlineAreRejected();
  TestOneActiveBidPerDriver();
  TestConcurrentDuplicateSubmitsAdmitExactlyOne();
  TestSubmitsRacingCloseLeaveNoActiveBids();
  TestLowerBidNotifiesOutbidDrivers();
  TestWithdrawActiveBid();
  TestLosingBidCannotBeWithdrawn();
  TestBidLimitClosesAuction();

  std::cout << "freight_exchange_unit_bid_intake: pass\n";
  return 0;
}
