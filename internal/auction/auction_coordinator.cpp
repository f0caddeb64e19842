#include "auction_coordinator.hpp"

#include <string>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/ranking/backhaul_matcher.hpp"
#include "internal/ranking/bid_ranker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace freight::auction {

using freight::db::model::AuctionWindowRecord;
using freight::db::model::BidRecord;
using freight::db::model::MatchRecord;
using freight::db::model::ShipmentRecord;
using freight::ledger::StatusChange;
using freight::model::AuctionState;
using freight::model::BidStatus;
using freight::model::CloseTrigger;
using freight::model::ExecutionStatus;
using freight::model::ShipmentStatus;
using freight::observability::IntField;
using freight::observability::StringField;

namespace {

std::vector<BidRecord> ActiveBids(freight::db::Repository& repository, freight::db::Transaction& tx, const std::string& shipment_id,
                                  uint32_t round) {
  freight::db::BidFilter filter;
  filter.shipment_id = shipment_id;
  filter.round       = round;
  filter.status      = BidStatus::kActive;
  return repository.ListBids(tx, filter);
}

void MoveBid(freight::db::Repository& repository, freight::db::Transaction& tx, BidRecord& bid, BidStatus to) {
  if (!freight::model::CanTransition(bid.status, to)) {
    throw freight::util::InvalidState("bid " + bid.id + ": cannot move from " + std::string(ToString(bid.status)) + " to " +
                                      std::string(ToString(to)));
  }
  bid.status = to;
  bid.version++;
  freight::db::ThrowIfError(repository.UpdateBid(tx, bid), "update bid");
}

void MoveWindow(AuctionWindowRecord& window, AuctionState to) {
  if (!freight::model::CanTransition(window.state, to)) {
    throw freight::util::InvalidState("auction window for " + window.shipment_id + ": cannot move from " + std::string(ToString(window.state)) +
                                      " to " + std::string(ToString(to)));
  }
  window.state = to;
}

void SaveWindow(freight::db::Repository& repository, freight::db::Transaction& tx, AuctionWindowRecord& window) {
  window.version++;
  freight::db::ThrowIfError(repository.UpdateAuctionWindow(tx, window), "update auction window");
}

} // namespace

AuctionCoordinator::AuctionCoordinator(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ledger::ShipmentLedger> ledger,
                                       std::shared_ptr<const freight::ranking::BidRanker>       ranker,
                                       std::shared_ptr<const freight::ranking::BackhaulMatcher> backhaul,
                                       std::shared_ptr<freight::outbound::EventDispatcher>      dispatcher,
                                       std::shared_ptr<freight::util::KeyedMutex> shipment_locks, AuctionOptions options, double neutral_reputation,
                                       freight::util::ClockFn clock)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      ranker_(std::move(ranker)),
      backhaul_(std::move(backhaul)),
      dispatcher_(std::move(dispatcher)),
      shipment_locks_(std::move(shipment_locks)),
      options_(options),
      neutral_reputation_(neutral_reputation),
      clock_(std::move(clock)) {
}

uint64_t AuctionCoordinator::NowMs() const {
  return freight::util::ToUnixMillis(clock_());
}

uint64_t AuctionCoordinator::ResolveDuration(std::optional<uint64_t> duration_ms) const {
  return duration_ms.value_or(options_.default_duration_ms);
}

uint32_t AuctionCoordinator::ResolveBidLimit(uint32_t bid_limit) const {
  return bid_limit > 0 ? bid_limit : options_.max_bids_per_window;
}

void AuctionCoordinator::SetWindowListener(WindowListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

std::optional<AuctionWindowRecord> AuctionCoordinator::LoadCurrentWindow(freight::db::Transaction& tx, const ShipmentRecord& shipment) {
  if (shipment.auction_round == 0) {
    return std::nullopt;
  }
  return repository_->GetAuctionWindow(tx, shipment.id, shipment.auction_round);
}

// ------------------------------------------------------------------
// Open / Schedule
// ------------------------------------------------------------------

AuctionWindowRecord AuctionCoordinator::OpenLocked(freight::db::Transaction& tx, ShipmentRecord& shipment, std::optional<uint64_t> duration_ms,
                                                   uint32_t bid_limit, const std::string& reason, std::vector<StatusChange>& changes) {
  const auto now      = NowMs();
  const auto duration = ResolveDuration(duration_ms);

  AuctionWindowRecord window;
  window.shipment_id  = shipment.id;
  window.round        = shipment.auction_round + 1;
  window.state        = AuctionState::kOpen;
  window.opens_at_ms  = now;
  window.closes_at_ms = duration > 0 ? now + duration : 0;
  window.bid_limit    = ResolveBidLimit(bid_limit);
  window.version      = 1;
  freight::db::ThrowIfError(repository_->InsertAuctionWindow(tx, window), "open auction");

  shipment.auction_round = window.round;
  changes.push_back(ledger_->Apply(tx, shipment, ShipmentStatus::kBidding, reason));
  return window;
}

AuctionWindowRecord AuctionCoordinator::Open(const std::string& shipment_id, std::optional<uint64_t> duration_ms, uint32_t bid_limit) {
  std::vector<StatusChange> changes;
  AuctionWindowRecord       window;
  ShipmentRecord            shipment;
  {
    freight::util::KeyedLock lock(*shipment_locks_, shipment_id);

    auto tx     = repository_->Begin();
    auto record = repository_->GetShipment(*tx, shipment_id);
    if (!record) {
      throw freight::util::NotFound("open auction: shipment not found; verify shipment id");
    }
    shipment = *record;

    auto current = LoadCurrentWindow(*tx, shipment);
    if (shipment.status == ShipmentStatus::kOpen && current && current->state == AuctionState::kPending) {
      // Open the scheduled round now, keeping its length unless a new one is given.
      const auto now      = NowMs();
      const auto span     = current->closes_at_ms > 0 ? current->closes_at_ms - current->opens_at_ms : 0;
      const auto duration = duration_ms.value_or(span);

      window = *current;
      MoveWindow(window, AuctionState::kOpen);
      window.opens_at_ms  = now;
      window.closes_at_ms = duration > 0 ? now + duration : 0;
      if (bid_limit > 0) window.bid_limit = bid_limit;
      SaveWindow(*repository_, *tx, window);
      changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kBidding, "auction opened"));
    } else {
      if (shipment.status != ShipmentStatus::kOpen) {
        throw freight::util::InvalidState("open auction: shipment must be open to start an auction (status " +
                                          std::string(ToString(shipment.status)) + ")");
      }
      window = OpenLocked(*tx, shipment, duration_ms, bid_limit, "auction opened", changes);
    }
    tx->Commit();
    shipment = changes.back().shipment;
  }

  ledger_->Announce(changes);
  AnnounceWindow(shipment, window);
  return window;
}

AuctionWindowRecord AuctionCoordinator::Schedule(const std::string& shipment_id, uint64_t opens_at_ms, std::optional<uint64_t> duration_ms,
                                                 uint32_t bid_limit) {
  if (opens_at_ms <= NowMs()) {
    return Open(shipment_id, duration_ms, bid_limit);
  }

  AuctionWindowRecord window;
  ShipmentRecord      shipment;
  {
    freight::util::KeyedLock lock(*shipment_locks_, shipment_id);

    auto tx     = repository_->Begin();
    auto record = repository_->GetShipment(*tx, shipment_id);
    if (!record) {
      throw freight::util::NotFound("schedule auction: shipment not found; verify shipment id");
    }
    shipment = *record;
    if (shipment.status != ShipmentStatus::kOpen) {
      throw freight::util::InvalidState("schedule auction: shipment must be open (status " + std::string(ToString(shipment.status)) + ")");
    }
    auto current = LoadCurrentWindow(*tx, shipment);
    if (current && current->state == AuctionState::kPending) {
      throw freight::util::InvalidState("schedule auction: an auction is already scheduled for this shipment");
    }

    const auto duration = ResolveDuration(duration_ms);

    window.shipment_id  = shipment.id;
    window.round        = shipment.auction_round + 1;
    window.state        = AuctionState::kPending;
    window.opens_at_ms  = opens_at_ms;
    window.closes_at_ms = duration > 0 ? opens_at_ms + duration : 0;
    window.bid_limit    = ResolveBidLimit(bid_limit);
    window.version      = 1;
    freight::db::ThrowIfError(repository_->InsertAuctionWindow(*tx, window), "schedule auction");

    shipment.auction_round = window.round;
    ledger_->Save(*tx, shipment);
    tx->Commit();
  }

  FREIGHT_LOG_INFO("auction scheduled", {StringField("shipment_id", shipment_id), IntField("round", window.round),
                                         IntField("opens_at_ms", static_cast<int64_t>(window.opens_at_ms))});
  AnnounceWindow(shipment, window);
  return window;
}

std::optional<AuctionWindowRecord> AuctionCoordinator::Activate(const std::string& shipment_id, uint32_t round) {
  std::vector<StatusChange> changes;
  AuctionWindowRecord       window;
  {
    freight::util::KeyedLock lock(*shipment_locks_, shipment_id);

    auto tx       = repository_->Begin();
    auto shipment = repository_->GetShipment(*tx, shipment_id);
    if (!shipment || shipment->auction_round != round || shipment->status != ShipmentStatus::kOpen) {
      return std::nullopt;
    }
    auto current = repository_->GetAuctionWindow(*tx, shipment_id, round);
    if (!current || current->state != AuctionState::kPending || NowMs() < current->opens_at_ms) {
      return std::nullopt;
    }

    window = *current;
    MoveWindow(window, AuctionState::kOpen);
    SaveWindow(*repository_, *tx, window);
    changes.push_back(ledger_->Apply(*tx, *shipment, ShipmentStatus::kBidding, "scheduled auction opened"));
    tx->Commit();
  }

  ledger_->Announce(changes);
  AnnounceWindow(changes.back().shipment, window);
  return window;
}

AuctionWindowRecord AuctionCoordinator::ReopenLocked(freight::db::Transaction& tx, ShipmentRecord& shipment, const std::string& reason,
                                                     std::vector<StatusChange>& changes) {
  if (shipment.status != ShipmentStatus::kMatched) {
    throw freight::util::InvalidState("reopen auction: shipment must be matched (status " + std::string(ToString(shipment.status)) + ")");
  }
  return OpenLocked(tx, shipment, std::nullopt, 0, reason, changes);
}

void AuctionCoordinator::AnnounceWindow(const ShipmentRecord& shipment, const AuctionWindowRecord& window) {
  if (window.state == AuctionState::kOpen && dispatcher_) {
    freight::outbound::Notification notification;
    notification.kind         = freight::outbound::NotificationKind::kAuctionOpened;
    notification.recipient_id = shipment.shipper_id;
    notification.shipment_id  = shipment.id;
    notification.detail       = "round " + std::to_string(window.round);
    notification.at_ms        = window.opens_at_ms;
    dispatcher_->Publish(std::move(notification));
  }

  WindowListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(window);
  }
}

// ------------------------------------------------------------------
// Close
// ------------------------------------------------------------------

CloseResult AuctionCoordinator::Close(const std::string& shipment_id, CloseTrigger trigger, std::optional<uint32_t> round) {
  CloseResult               result;
  std::vector<StatusChange> changes;
  std::vector<BidRecord>    losers;
  {
    freight::util::KeyedLock lock(*shipment_locks_, shipment_id);

    const auto now = NowMs();

    auto tx     = repository_->Begin();
    auto record = repository_->GetShipment(*tx, shipment_id);
    if (!record) {
      throw freight::util::NotFound("close auction: shipment not found; verify shipment id");
    }
    auto shipment = *record;
    if (shipment.auction_round == 0) {
      throw freight::util::InvalidState("close auction: no auction has been opened for this shipment");
    }

    const auto target_round = round.value_or(shipment.auction_round);
    auto       stored       = repository_->GetAuctionWindow(*tx, shipment_id, target_round);
    if (!stored) {
      throw freight::util::NotFound("close auction: auction round not found");
    }
    auto window = *stored;

    result.shipment = shipment;
    result.window   = window;

    if (window.closed || freight::model::IsFinal(window.state)) {
      if (!window.match_id.empty()) {
        result.match = repository_->GetMatch(*tx, window.match_id);
      }
      tx->Commit();
      result.outcome = CloseOutcome::kAlreadyClosed;
      return result;
    }

    if (window.state == AuctionState::kPending) {
      if (trigger == CloseTrigger::kShipper) {
        throw freight::util::InvalidState("close auction: the scheduled auction has not opened yet; cancel the shipment instead");
      }
      result.outcome = CloseOutcome::kIgnored;
      return result;
    }

    auto bids = ActiveBids(*repository_, *tx, shipment_id, window.round);

    if (trigger == CloseTrigger::kTimer && (target_round != shipment.auction_round || window.closes_at_ms == 0 || now < window.closes_at_ms)) {
      result.outcome = CloseOutcome::kIgnored;
      return result;
    }
    if (trigger == CloseTrigger::kBidLimit && (window.bid_limit == 0 || bids.size() < window.bid_limit)) {
      result.outcome = CloseOutcome::kIgnored;
      return result;
    }

    MoveWindow(window, AuctionState::kClosing);
    window.closed = true;

    if (bids.empty()) {
      MoveWindow(window, AuctionState::kVoid);
      SaveWindow(*repository_, *tx, window);

      if (shipment.relist_on_no_bids) {
        changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kOpen, "auction closed without bids; re-listed"));
        result.outcome = CloseOutcome::kRelisted;
      } else {
        changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kCancelled, "auction closed without bids"));
        result.outcome = CloseOutcome::kCancelled;
      }
    } else {
      std::vector<freight::ranking::BidCandidate> candidates;
      candidates.reserve(bids.size());
      for (const auto& bid : bids) {
        auto driver = repository_->GetDriver(*tx, bid.driver_id);

        freight::ranking::BidCandidate candidate;
        candidate.bid            = bid;
        candidate.reputation     = driver ? driver->reputation : neutral_reputation_;
        candidate.backhaul_bonus = backhaul_->Bonus(shipment, driver ? driver->capacity_kg : 0.0);
        candidates.push_back(std::move(candidate));
      }

      const auto ranked = ranker_->Rank(shipment, candidates);
      const auto winner = ranked.front().bid;

      MatchRecord match;
      match.id               = freight::util::NewId("mch");
      match.shipment_id      = shipment.id;
      match.bid_id           = winner.id;
      match.driver_id        = winner.driver_id;
      match.price            = winner.price;
      match.round            = window.round;
      match.committed_at_ms  = now;
      match.updated_at_ms    = now;
      match.execution_status = ExecutionStatus::kAssigned;
      match.version          = 1;
      freight::db::ThrowIfError(repository_->InsertMatch(*tx, match), "commit auction: insert match");

      for (auto& bid : bids) {
        if (bid.id == winner.id) {
          MoveBid(*repository_, *tx, bid, BidStatus::kWon);
        } else {
          MoveBid(*repository_, *tx, bid, BidStatus::kLost);
          losers.push_back(bid);
        }
      }

      changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kMatched, "auction committed"));

      MoveWindow(window, AuctionState::kCommitted);
      window.match_id = match.id;
      SaveWindow(*repository_, *tx, window);

      result.match   = match;
      result.outcome = CloseOutcome::kMatched;
    }

    tx->Commit();
    result.shipment = shipment;
    result.window   = window;
  }

  ledger_->Announce(changes);

  freight::observability::Metrics::Instance().RecordAuctionClose(ToString(trigger), ToString(result.outcome));
  FREIGHT_LOG_INFO("auction closed", {StringField("shipment_id", shipment_id), IntField("round", result.window.round),
                                      StringField("trigger", ToString(trigger)), StringField("outcome", ToString(result.outcome)),
                                      StringField("match_id", result.match ? result.match->id : "")});

  if (dispatcher_ && result.match) {
    const auto& match = *result.match;

    freight::outbound::Notification won;
    won.kind         = freight::outbound::NotificationKind::kAuctionWon;
    won.recipient_id = match.driver_id;
    won.shipment_id  = match.shipment_id;
    won.bid_id       = match.bid_id;
    won.detail       = "match " + match.id;
    won.at_ms        = match.committed_at_ms;
    dispatcher_->Publish(std::move(won));

    for (const auto& bid : losers) {
      freight::outbound::Notification lost;
      lost.kind         = freight::outbound::NotificationKind::kAuctionLost;
      lost.recipient_id = bid.driver_id;
      lost.shipment_id  = bid.shipment_id;
      lost.bid_id       = bid.id;
      lost.at_ms        = match.committed_at_ms;
      dispatcher_->Publish(std::move(lost));
    }

    freight::outbound::SettlementInstruction settlement;
    settlement.match_id        = match.id;
    settlement.shipment_id     = match.shipment_id;
    settlement.shipper_id      = result.shipment.shipper_id;
    settlement.driver_id       = match.driver_id;
    settlement.price           = match.price;
    settlement.committed_at_ms = match.committed_at_ms;
    dispatcher_->Publish(std::move(settlement));
  }

  return result;
}

// ------------------------------------------------------------------
// Cancel
// ------------------------------------------------------------------

ShipmentRecord AuctionCoordinator::CancelShipment(const std::string& shipment_id, const std::string& reason) {
  std::vector<StatusChange> changes;
  std::vector<BidRecord>    losers;
  {
    freight::util::KeyedLock lock(*shipment_locks_, shipment_id);

    auto tx     = repository_->Begin();
    auto record = repository_->GetShipment(*tx, shipment_id);
    if (!record) {
      throw freight::util::NotFound("cancel shipment: shipment not found; verify shipment id");
    }
    auto shipment = *record;

    if (shipment.status == ShipmentStatus::kMatched || shipment.status == ShipmentStatus::kInTransit) {
      throw freight::util::InvalidState("cancel shipment: shipment is already matched to a driver");
    }
    if (freight::model::IsTerminal(shipment.status)) {
      throw freight::util::InvalidState("cancel shipment: shipment is already " + std::string(ToString(shipment.status)));
    }

    auto window = LoadCurrentWindow(*tx, shipment);
    if (window && !freight::model::IsFinal(window->state)) {
      if (window->state == AuctionState::kOpen) {
        for (auto& bid : ActiveBids(*repository_, *tx, shipment_id, window->round)) {
          MoveBid(*repository_, *tx, bid, BidStatus::kLost);
          losers.push_back(bid);
        }
      }
      MoveWindow(*window, AuctionState::kVoid);
      window->closed = true;
      SaveWindow(*repository_, *tx, *window);
    }

    changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kCancelled, reason.empty() ? "cancelled by shipper" : reason));
    tx->Commit();
  }

  ledger_->Announce(changes);

  if (dispatcher_) {
    for (const auto& bid : losers) {
      freight::outbound::Notification lost;
      lost.kind         = freight::outbound::NotificationKind::kAuctionLost;
      lost.recipient_id = bid.driver_id;
      lost.shipment_id  = bid.shipment_id;
      lost.bid_id       = bid.id;
      lost.detail       = "shipment cancelled";
      lost.at_ms        = changes.back().shipment.updated_at_ms;
      dispatcher_->Publish(std::move(lost));
    }
  }
  return changes.back().shipment;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<AuctionWindowRecord> AuctionCoordinator::CurrentWindow(const std::string& shipment_id) {
  auto tx       = repository_->Begin();
  auto shipment = repository_->GetShipment(*tx, shipment_id);
  if (!shipment) {
    throw freight::util::NotFound("auction window: shipment not found; verify shipment id");
  }
  auto window = LoadCurrentWindow(*tx, *shipment);
  tx->Commit();
  return window;
}

std::vector<AuctionWindowRecord> AuctionCoordinator::LiveWindows() {
  auto tx      = repository_->Begin();
  auto windows = repository_->ListAuctionWindows(*tx, AuctionState::kPending);
  auto open    = repository_->ListAuctionWindows(*tx, AuctionState::kOpen);
  tx->Commit();

  windows.insert(windows.end(), open.begin(), open.end());
  return windows;
}

} // namespace freight::auction
