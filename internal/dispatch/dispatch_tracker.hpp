#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/util/time.hpp"

namespace freight::auction {
class AuctionCoordinator;
}
namespace freight::outbound {
class EventDispatcher;
}
namespace freight::reputation {
class ReputationScorer;
}

namespace freight::dispatch {

struct DispatchOptions {
  // How long after the pickup window ends an Assigned match counts as a no-show.
  uint64_t no_show_grace_ms  = 30 * 60 * 1000;
  uint64_t sweep_interval_ms = 60 * 1000;
};

struct ExecutionResult {
  freight::db::model::MatchRecord    match;
  freight::db::model::ShipmentRecord shipment;
};

/*
  Tracks committed matches from assignment to delivery.

  Driver reports move the match execution status and the shipment status
  together in one transaction under the shipment lock. A driver backing out
  before pickup re-opens the auction; a failure after pickup is escalated.
  Reputation is updated after commit, never inside the shipment transaction.
*/
class DispatchTracker {
 public:
  DispatchTracker(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ledger::ShipmentLedger> ledger,
                  std::shared_ptr<freight::auction::AuctionCoordinator> coordinator,
                  std::shared_ptr<freight::reputation::ReputationScorer> scorer, std::shared_ptr<freight::outbound::EventDispatcher> dispatcher,
                  DispatchOptions options, freight::util::ClockFn clock = freight::util::Now);

  ExecutionResult ReportPickup(const std::string& match_id, const std::string& driver_id);
  ExecutionResult ReportDeparture(const std::string& match_id, const std::string& driver_id);
  ExecutionResult ReportDelivery(const std::string& match_id, const std::string& driver_id);
  ExecutionResult ReportUnableToFulfill(const std::string& match_id, const std::string& driver_id, const std::string& reason);

  // Shipper-reported no-show; only once the pickup window has started.
  freight::db::model::ShipmentRecord ReportNoShow(const std::string& shipment_id);

  // Cancels Assigned matches whose pickup window ended more than the grace period ago.
  std::size_t SweepNoShows();

  // The driver withdrew a bid that already won.
  ExecutionResult CancelWonBid(const freight::db::model::BidRecord& bid);

  freight::db::model::MatchRecord                GetMatch(const std::string& match_id);
  std::optional<freight::db::model::MatchRecord> ActiveMatch(const std::string& shipment_id);
  std::vector<freight::db::model::MatchRecord>   MatchesForDriver(const std::string& driver_id);

  const DispatchOptions& Options() const {
    return options_;
  }

 private:
  struct Cancellation {
    ExecutionResult                            result;
    freight::db::model::AuctionWindowRecord    window;
    std::vector<freight::ledger::StatusChange> changes;
  };

  std::string ShipmentOf(const std::string& match_id);

  // Assigned -> Cancelled, winning bid withdrawn, shipment re-auctioned.
  Cancellation CancelBeforePickupLocked(freight::db::Transaction& tx, freight::db::model::MatchRecord match,
                                        freight::db::model::ShipmentRecord shipment, const std::string& reason);
  void         FinishCancellation(const Cancellation& cancellation, const std::string& reason);

  std::shared_ptr<freight::db::Repository>               repository_;
  std::shared_ptr<freight::ledger::ShipmentLedger>       ledger_;
  std::shared_ptr<freight::auction::AuctionCoordinator>  coordinator_;
  std::shared_ptr<freight::reputation::ReputationScorer> scorer_;
  std::shared_ptr<freight::outbound::EventDispatcher>    dispatcher_;
  DispatchOptions                                        options_;
  freight::util::ClockFn                                 clock_;
};

} // namespace freight::dispatch
