#include "bid_intake.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/reputation/reputation_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/uuid.hpp"

namespace freight::auction {

using freight::db::model::BidRecord;
using freight::model::AuctionState;
using freight::model::BidStatus;
using freight::observability::DoubleField;
using freight::observability::StringField;

namespace {

void Validate(const BidSubmission& submission, double price_floor) {
  if (submission.shipment_id.empty() || submission.driver_id.empty()) {
    throw freight::util::ValidationError("submit bid: shipment_id and driver_id are required");
  }
  if (!std::isfinite(submission.price) || submission.price <= 0.0) {
    throw freight::util::ValidationError("submit bid: price must be a positive amount");
  }
  if (submission.price < price_floor) {
    throw freight::util::ValidationError("submit bid: price is below the marketplace floor");
  }
  if (!std::isfinite(submission.eta_minutes) || submission.eta_minutes < 0.0) {
    throw freight::util::ValidationError("submit bid: eta_minutes must be zero or more");
  }
  if (!freight::model::IsValid(submission.location)) {
    throw freight::util::ValidationError("submit bid: driver location is not a valid coordinate");
  }
}

} // namespace

BidIntake::BidIntake(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<AuctionCoordinator> coordinator,
                     std::shared_ptr<freight::dispatch::DispatchTracker> dispatch, std::shared_ptr<freight::reputation::ReputationScorer> scorer,
                     std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, freight::util::ClockFn clock)
    : repository_(std::move(repository)),
      coordinator_(std::move(coordinator)),
      dispatch_(std::move(dispatch)),
      scorer_(std::move(scorer)),
      dispatcher_(std::move(dispatcher)),
      clock_(std::move(clock)) {
}

uint64_t BidIntake::NowMs() const {
  return freight::util::ToUnixMillis(clock_());
}

BidRecord BidIntake::Submit(const BidSubmission& submission) {
  try {
    Validate(submission, coordinator_->Options().min_price_floor);
  } catch (const freight::util::ValidationError&) {
    freight::observability::Metrics::Instance().RecordBid(false);
    throw;
  }

  scorer_->EnsureDriver(submission.driver_id);

  BidRecord              bid;
  uint32_t               bid_limit = 0;
  std::size_t            active    = 0;
  std::vector<BidRecord> outbid;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), submission.shipment_id);

    const auto now = NowMs();

    auto tx       = repository_->Begin();
    auto shipment = repository_->GetShipment(*tx, submission.shipment_id);
    if (!shipment) {
      throw freight::util::NotFound("submit bid: shipment not found; verify shipment id");
    }

    std::optional<freight::db::model::AuctionWindowRecord> window;
    if (shipment->auction_round > 0) {
      window = repository_->GetAuctionWindow(*tx, shipment->id, shipment->auction_round);
    }
    if (!window) {
      throw freight::util::InvalidState("submit bid: shipment has no auction; status " + std::string(ToString(shipment->status)));
    }
    if (window->state == AuctionState::kPending) {
      throw freight::util::InvalidState("submit bid: the auction has not opened yet");
    }
    if (window->closed || window->state != AuctionState::kOpen || shipment->status != freight::model::ShipmentStatus::kBidding) {
      throw freight::util::AuctionClosed("submit bid: the auction for this shipment is closed");
    }
    if (window->closes_at_ms > 0 && now >= window->closes_at_ms) {
      throw freight::util::AuctionClosed("submit bid: the auction deadline has passed");
    }

    freight::db::BidFilter filter;
    filter.shipment_id = shipment->id;
    filter.round       = window->round;
    filter.status      = BidStatus::kActive;
    const auto current = repository_->ListBids(*tx, filter);

    for (const auto& existing : current) {
      if (existing.driver_id == submission.driver_id) {
        throw freight::util::AlreadyExists("submit bid: driver already holds an active bid in this round; withdraw it first");
      }
    }

    if (!current.empty()) {
      const auto best = std::min_element(current.begin(), current.end(),
                                         [](const BidRecord& a, const BidRecord& b) { return a.price < b.price; })->price;
      if (submission.price < best) {
        for (const auto& existing : current) {
          if (existing.price == best) outbid.push_back(existing);
        }
      }
    }

    bid.id              = freight::util::NewId("bid");
    bid.shipment_id     = shipment->id;
    bid.round           = window->round;
    bid.driver_id       = submission.driver_id;
    bid.price           = submission.price;
    bid.submitted_at_ms = now;
    bid.driver_location = submission.location;
    bid.eta_minutes     = submission.eta_minutes;
    bid.message         = submission.message;
    bid.status          = BidStatus::kActive;
    bid.version         = 1;
    freight::db::ThrowIfError(repository_->InsertBid(*tx, bid), "submit bid");
    tx->Commit();

    bid_limit = window->bid_limit;
    active    = current.size() + 1;
  }

  freight::observability::Metrics::Instance().RecordBid(true);
  FREIGHT_LOG_INFO("bid accepted", {StringField("bid_id", bid.id), StringField("shipment_id", bid.shipment_id),
                                    StringField("driver_id", bid.driver_id), DoubleField("price", bid.price)});

  if (dispatcher_) {
    for (const auto& previous : outbid) {
      freight::outbound::Notification notification;
      notification.kind         = freight::outbound::NotificationKind::kBidOutbid;
      notification.recipient_id = previous.driver_id;
      notification.shipment_id  = previous.shipment_id;
      notification.bid_id       = previous.id;
      notification.at_ms        = bid.submitted_at_ms;
      dispatcher_->Publish(std::move(notification));
    }
  }

  if (bid_limit > 0 && active >= bid_limit) {
    try {
      coordinator_->Close(bid.shipment_id, freight::model::CloseTrigger::kBidLimit, bid.round);
    } catch (const std::exception& e) {
      FREIGHT_LOG_WARN("bid limit close failed", {StringField("shipment_id", bid.shipment_id), StringField("error", e.what())});
    }
  }
  return bid;
}

BidRecord BidIntake::Withdraw(const std::string& bid_id, const std::string& driver_id) {
  std::optional<BidRecord> stored;
  {
    auto tx = repository_->Begin();
    stored  = repository_->GetBid(*tx, bid_id);
    tx->Commit();
  }
  if (!stored) {
    throw freight::util::NotFound("withdraw bid: bid not found; verify bid id");
  }
  if (stored->driver_id != driver_id) {
    throw freight::util::ValidationError("withdraw bid: bid belongs to another driver");
  }
  if (stored->status == BidStatus::kWon) {
    return WithdrawWon(*stored);
  }

  BidRecord bid;
  bool      committed = false;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), stored->shipment_id);

    auto tx      = repository_->Begin();
    auto current = repository_->GetBid(*tx, bid_id);
    if (!current) {
      throw freight::util::NotFound("withdraw bid: bid not found; verify bid id");
    }
    bid = *current;
    // The auction committed between the unlocked read and the lock.
    committed = bid.status == BidStatus::kWon;
    if (committed) {
      tx->Rollback();
    } else if (bid.status != BidStatus::kActive) {
      throw freight::util::AuctionClosed("withdraw bid: bid is already " + std::string(ToString(bid.status)));
    }
    if (!committed) {
      auto window = repository_->GetAuctionWindow(*tx, bid.shipment_id, bid.round);
      if (!window || window->closed || window->state != AuctionState::kOpen) {
        throw freight::util::AuctionClosed("withdraw bid: the auction for this bid is closed");
      }

      bid.status = BidStatus::kWithdrawn;
      bid.version++;
      freight::db::ThrowIfError(repository_->UpdateBid(*tx, bid), "withdraw bid");
      tx->Commit();
    }
  }
  if (committed) {
    return WithdrawWon(bid);
  }

  scorer_->RecordCancellation(driver_id, freight::model::CancellationStage::kPreMatch);
  FREIGHT_LOG_INFO("bid withdrawn", {StringField("bid_id", bid.id), StringField("shipment_id", bid.shipment_id), StringField("driver_id", driver_id)});
  return bid;
}

BidRecord BidIntake::WithdrawWon(const BidRecord& bid) {
  dispatch_->CancelWonBid(bid);

  auto tx      = repository_->Begin();
  auto current = repository_->GetBid(*tx, bid.id);
  tx->Commit();
  if (!current) {
    throw freight::util::NotFound("withdraw bid: bid not found; verify bid id");
  }
  return *current;
}

std::vector<BidRecord> BidIntake::ListForDriver(const std::string& driver_id, const std::vector<BidStatus>& statuses) {
  if (driver_id.empty()) {
    throw freight::util::ValidationError("list bids: driver_id is required");
  }

  freight::db::BidFilter filter;
  filter.driver_id = driver_id;

  auto tx   = repository_->Begin();
  auto bids = repository_->ListBids(*tx, filter);
  tx->Commit();

  if (!statuses.empty()) {
    std::erase_if(bids, [&](const BidRecord& bid) { return std::find(statuses.begin(), statuses.end(), bid.status) == statuses.end(); });
  }
  return bids;
}

} // namespace freight::auction
