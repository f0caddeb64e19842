#include "dispatch_tracker.hpp"

#include "internal/auction/auction_coordinator.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/reputation/reputation_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace freight::dispatch {

using freight::db::model::MatchRecord;
using freight::db::model::ShipmentRecord;
using freight::model::BidStatus;
using freight::model::ExecutionStatus;
using freight::model::ShipmentStatus;
using freight::observability::BoolField;
using freight::observability::StringField;

namespace {

MatchRecord RequireMatch(freight::db::Repository& repository, freight::db::Transaction& tx, const std::string& match_id,
                         const std::string& driver_id) {
  auto match = repository.GetMatch(tx, match_id);
  if (!match) {
    throw freight::util::NotFound("match not found; verify match id");
  }
  if (match->driver_id != driver_id) {
    throw freight::util::ValidationError("match " + match_id + " is assigned to another driver");
  }
  return *match;
}

ShipmentRecord RequireShipment(freight::db::Repository& repository, freight::db::Transaction& tx, const std::string& shipment_id) {
  auto shipment = repository.GetShipment(tx, shipment_id);
  if (!shipment) {
    throw freight::util::NotFound("shipment not found; verify shipment id");
  }
  return *shipment;
}

void MoveMatch(freight::db::Repository& repository, freight::db::Transaction& tx, MatchRecord& match, ExecutionStatus to, uint64_t now) {
  if (!freight::model::CanTransition(match.execution_status, to)) {
    throw freight::util::InvalidState("match " + match.id + ": cannot move from " + std::string(ToString(match.execution_status)) + " to " +
                                      std::string(ToString(to)));
  }
  match.execution_status = to;
  match.updated_at_ms    = now;
  match.version++;
  freight::db::ThrowIfError(repository.UpdateMatch(tx, match), "update match");
}

} // namespace

DispatchTracker::DispatchTracker(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ledger::ShipmentLedger> ledger,
                                 std::shared_ptr<freight::auction::AuctionCoordinator>  coordinator,
                                 std::shared_ptr<freight::reputation::ReputationScorer> scorer,
                                 std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, DispatchOptions options,
                                 freight::util::ClockFn clock)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      coordinator_(std::move(coordinator)),
      scorer_(std::move(scorer)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      clock_(std::move(clock)) {
}

std::string DispatchTracker::ShipmentOf(const std::string& match_id) {
  auto tx    = repository_->Begin();
  auto match = repository_->GetMatch(*tx, match_id);
  tx->Commit();
  if (!match) {
    throw freight::util::NotFound("match not found; verify match id");
  }
  return match->shipment_id;
}

// ------------------------------------------------------------------
// Driver reports
// ------------------------------------------------------------------

ExecutionResult DispatchTracker::ReportPickup(const std::string& match_id, const std::string& driver_id) {
  const auto shipment_id = ShipmentOf(match_id);

  ExecutionResult                            result;
  std::vector<freight::ledger::StatusChange> changes;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), shipment_id);

    auto tx       = repository_->Begin();
    auto match    = RequireMatch(*repository_, *tx, match_id, driver_id);
    auto shipment = RequireShipment(*repository_, *tx, match.shipment_id);

    MoveMatch(*repository_, *tx, match, ExecutionStatus::kPickedUp, freight::util::ToUnixMillis(clock_()));
    changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kInTransit, "picked up"));
    tx->Commit();

    result = {match, shipment};
  }

  ledger_->Announce(changes);
  return result;
}

ExecutionResult DispatchTracker::ReportDeparture(const std::string& match_id, const std::string& driver_id) {
  const auto shipment_id = ShipmentOf(match_id);

  freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), shipment_id);

  auto tx       = repository_->Begin();
  auto match    = RequireMatch(*repository_, *tx, match_id, driver_id);
  auto shipment = RequireShipment(*repository_, *tx, match.shipment_id);

  MoveMatch(*repository_, *tx, match, ExecutionStatus::kInTransit, freight::util::ToUnixMillis(clock_()));
  tx->Commit();

  FREIGHT_LOG_INFO("match departed", {StringField("match_id", match.id), StringField("shipment_id", match.shipment_id)});
  return {match, shipment};
}

ExecutionResult DispatchTracker::ReportDelivery(const std::string& match_id, const std::string& driver_id) {
  const auto shipment_id = ShipmentOf(match_id);

  ExecutionResult                            result;
  std::vector<freight::ledger::StatusChange> changes;
  bool                                       on_time = true;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), shipment_id);

    const auto now = freight::util::ToUnixMillis(clock_());

    auto tx       = repository_->Begin();
    auto match    = RequireMatch(*repository_, *tx, match_id, driver_id);
    auto shipment = RequireShipment(*repository_, *tx, match.shipment_id);

    MoveMatch(*repository_, *tx, match, ExecutionStatus::kDelivered, now);
    changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kDelivered, "delivered"));
    tx->Commit();

    on_time = shipment.delivery_end_ms == 0 || now <= shipment.delivery_end_ms;
    result  = {match, shipment};
  }

  ledger_->Announce(changes);

  scorer_->RecordCompletion(driver_id, on_time);
  const auto destination = result.shipment.destination;
  scorer_->MutateDriver(driver_id, [&](freight::db::model::DriverRecord& driver) {
    driver.location  = destination;
    driver.available = true;
  });

  freight::observability::Metrics::Instance().RecordExecutionOutcome("delivered");
  FREIGHT_LOG_INFO("match delivered",
                   {StringField("match_id", match_id), StringField("driver_id", driver_id), BoolField("on_time", on_time)});
  return result;
}

ExecutionResult DispatchTracker::ReportUnableToFulfill(const std::string& match_id, const std::string& driver_id, const std::string& reason) {
  const auto shipment_id = ShipmentOf(match_id);
  const auto why         = reason.empty() ? std::string("driver unable to fulfil") : reason;

  std::optional<Cancellation>                cancellation;
  ExecutionResult                            failed;
  std::vector<freight::ledger::StatusChange> changes;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), shipment_id);

    auto tx       = repository_->Begin();
    auto match    = RequireMatch(*repository_, *tx, match_id, driver_id);
    auto shipment = RequireShipment(*repository_, *tx, match.shipment_id);

    switch (match.execution_status) {
      case ExecutionStatus::kAssigned:
        cancellation = CancelBeforePickupLocked(*tx, match, shipment, why);
        break;
      case ExecutionStatus::kPickedUp:
      case ExecutionStatus::kInTransit:
        MoveMatch(*repository_, *tx, match, ExecutionStatus::kFailed, freight::util::ToUnixMillis(clock_()));
        changes.push_back(ledger_->Apply(*tx, shipment, ShipmentStatus::kFailed, why));
        failed = {match, shipment};
        break;
      default:
        throw freight::util::InvalidState("match " + match.id + " is already " + std::string(ToString(match.execution_status)));
    }
    tx->Commit();
  }

  if (cancellation) {
    FinishCancellation(*cancellation, why);
    return cancellation->result;
  }

  ledger_->Announce(changes);
  scorer_->RecordFailure(driver_id);
  freight::observability::Metrics::Instance().RecordExecutionOutcome("failed");
  FREIGHT_LOG_WARN("match failed after pickup", {StringField("match_id", match_id), StringField("driver_id", driver_id), StringField("reason", why)});

  if (dispatcher_) {
    freight::outbound::Escalation escalation;
    escalation.match_id    = failed.match.id;
    escalation.shipment_id = failed.match.shipment_id;
    escalation.driver_id   = driver_id;
    escalation.reason      = why;
    escalation.at_ms       = failed.match.updated_at_ms;
    dispatcher_->Publish(std::move(escalation));
  }
  return failed;
}

// ------------------------------------------------------------------
// No-shows and withdrawals
// ------------------------------------------------------------------

ShipmentRecord DispatchTracker::ReportNoShow(const std::string& shipment_id) {
  Cancellation cancellation;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), shipment_id);

    auto tx       = repository_->Begin();
    auto shipment = RequireShipment(*repository_, *tx, shipment_id);

    freight::db::MatchFilter filter;
    filter.shipment_id      = shipment_id;
    filter.execution_status = ExecutionStatus::kAssigned;
    auto assigned           = repository_->ListMatches(*tx, filter);
    if (assigned.empty()) {
      throw freight::util::InvalidState("report no-show: shipment has no assigned driver awaiting pickup");
    }
    if (freight::util::ToUnixMillis(clock_()) < shipment.pickup_start_ms) {
      throw freight::util::InvalidState("report no-show: the pickup window has not started yet");
    }

    cancellation = CancelBeforePickupLocked(*tx, assigned.back(), shipment, "driver no-show");
    tx->Commit();
  }

  FinishCancellation(cancellation, "driver no-show");
  return cancellation.result.shipment;
}

std::size_t DispatchTracker::SweepNoShows() {
  std::vector<MatchRecord> assigned;
  {
    freight::db::MatchFilter filter;
    filter.execution_status = ExecutionStatus::kAssigned;

    auto tx  = repository_->Begin();
    assigned = repository_->ListMatches(*tx, filter);
    tx->Commit();
  }

  std::size_t cancelled = 0;
  for (const auto& candidate : assigned) {
    try {
      std::optional<Cancellation> cancellation;
      {
        freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), candidate.shipment_id);

        const auto now = freight::util::ToUnixMillis(clock_());

        auto tx       = repository_->Begin();
        auto match    = repository_->GetMatch(*tx, candidate.id);
        auto shipment = repository_->GetShipment(*tx, candidate.shipment_id);
        // Without a pickup window there is no deadline to miss; only the shipper can report a no-show.
        if (!match || !shipment || match->execution_status != ExecutionStatus::kAssigned || shipment->pickup_end_ms == 0 ||
            now <= shipment->pickup_end_ms + options_.no_show_grace_ms) {
          continue;
        }
        cancellation = CancelBeforePickupLocked(*tx, *match, *shipment, "pickup window missed");
        tx->Commit();
      }
      FinishCancellation(*cancellation, "pickup window missed");
      ++cancelled;
    } catch (const std::exception& e) {
      FREIGHT_LOG_WARN("no-show sweep failed", {StringField("match_id", candidate.id), StringField("error", e.what())});
    }
  }
  return cancelled;
}

ExecutionResult DispatchTracker::CancelWonBid(const freight::db::model::BidRecord& bid) {
  Cancellation cancellation;
  {
    freight::util::KeyedLock lock(coordinator_->ShipmentLocks(), bid.shipment_id);

    auto tx       = repository_->Begin();
    auto shipment = RequireShipment(*repository_, *tx, bid.shipment_id);

    freight::db::MatchFilter filter;
    filter.shipment_id = bid.shipment_id;
    filter.driver_id   = bid.driver_id;

    std::optional<MatchRecord> live;
    for (const auto& match : repository_->ListMatches(*tx, filter)) {
      if (match.bid_id == bid.id && !freight::model::IsTerminal(match.execution_status)) {
        live = match;
      }
    }
    if (!live) {
      throw freight::util::AuctionClosed("withdraw bid: the match for this bid is no longer active");
    }
    if (live->execution_status != ExecutionStatus::kAssigned) {
      throw freight::util::InvalidState("withdraw bid: cargo is already picked up; report unable to fulfil instead");
    }

    cancellation = CancelBeforePickupLocked(*tx, *live, shipment, "winning bid withdrawn");
    tx->Commit();
  }

  FinishCancellation(cancellation, "winning bid withdrawn");
  return cancellation.result;
}

DispatchTracker::Cancellation DispatchTracker::CancelBeforePickupLocked(freight::db::Transaction& tx, MatchRecord match, ShipmentRecord shipment,
                                                                        const std::string& reason) {
  Cancellation cancellation;

  MoveMatch(*repository_, tx, match, ExecutionStatus::kCancelled, freight::util::ToUnixMillis(clock_()));

  auto bid = repository_->GetBid(tx, match.bid_id);
  if (bid && bid->status == BidStatus::kWon) {
    bid->status = BidStatus::kWithdrawn;
    bid->version++;
    freight::db::ThrowIfError(repository_->UpdateBid(tx, *bid), "withdraw winning bid");
  }

  cancellation.window = coordinator_->ReopenLocked(tx, shipment, reason, cancellation.changes);
  cancellation.result = {match, shipment};
  return cancellation;
}

void DispatchTracker::FinishCancellation(const Cancellation& cancellation, const std::string& reason) {
  ledger_->Announce(cancellation.changes);
  coordinator_->AnnounceWindow(cancellation.result.shipment, cancellation.window);

  scorer_->RecordCancellation(cancellation.result.match.driver_id, freight::model::CancellationStage::kPostMatch);
  freight::observability::Metrics::Instance().RecordExecutionOutcome("cancelled");
  FREIGHT_LOG_INFO("match cancelled before pickup; auction re-opened",
                   {StringField("match_id", cancellation.result.match.id), StringField("shipment_id", cancellation.result.match.shipment_id),
                    StringField("reason", reason)});
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

MatchRecord DispatchTracker::GetMatch(const std::string& match_id) {
  auto tx    = repository_->Begin();
  auto match = repository_->GetMatch(*tx, match_id);
  tx->Commit();
  if (!match) {
    throw freight::util::NotFound("match not found; verify match id");
  }
  return *match;
}

std::optional<MatchRecord> DispatchTracker::ActiveMatch(const std::string& shipment_id) {
  freight::db::MatchFilter filter;
  filter.shipment_id = shipment_id;

  auto tx      = repository_->Begin();
  auto matches = repository_->ListMatches(*tx, filter);
  tx->Commit();

  for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
    if (!freight::model::IsTerminal(it->execution_status)) {
      return *it;
    }
  }
  return std::nullopt;
}

std::vector<MatchRecord> DispatchTracker::MatchesForDriver(const std::string& driver_id) {
  if (driver_id.empty()) {
    throw freight::util::ValidationError("list matches: driver_id is required");
  }

  freight::db::MatchFilter filter;
  filter.driver_id = driver_id;

  auto tx      = repository_->Begin();
  auto matches = repository_->ListMatches(*tx, filter);
  tx->Commit();
  return matches;
}

} // namespace freight::dispatch
