#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/geo.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace freight::dispatch {
class DispatchTracker;
}
namespace freight::outbound {
class EventDispatcher;
}
namespace freight::reputation {
class ReputationScorer;
}

namespace freight::auction {

class AuctionCoordinator;

struct BidSubmission {
  std::string shipment_id;
  std::string driver_id;

  double                   price       = 0.0;
  double                   eta_minutes = 0.0;
  freight::model::GeoPoint location;
  std::string              message;
};

/*
  Validates and records driver bids against the current auction round.

  A driver holds at most one Active bid per round; the check and the insert
  happen under the shipment lock, so concurrent duplicates resolve to
  exactly one stored bid.
*/
class BidIntake {
 public:
  BidIntake(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<AuctionCoordinator> coordinator,
            std::shared_ptr<freight::dispatch::DispatchTracker> dispatch, std::shared_ptr<freight::reputation::ReputationScorer> scorer,
            std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, freight::util::ClockFn clock = freight::util::Now);

  freight::db::model::BidRecord Submit(const BidSubmission& submission);

  // Active bids are withdrawn; a Won bid cancels its match and re-opens the auction.
  freight::db::model::BidRecord Withdraw(const std::string& bid_id, const std::string& driver_id);

  std::vector<freight::db::model::BidRecord> ListForDriver(const std::string& driver_id, const std::vector<freight::model::BidStatus>& statuses);

 private:
  freight::db::model::BidRecord WithdrawWon(const freight::db::model::BidRecord& bid);
  uint64_t                      NowMs() const;

  std::shared_ptr<freight::db::Repository>               repository_;
  std::shared_ptr<AuctionCoordinator>                    coordinator_;
  std::shared_ptr<freight::dispatch::DispatchTracker>    dispatch_;
  std::shared_ptr<freight::reputation::ReputationScorer> scorer_;
  std::shared_ptr<freight::outbound::EventDispatcher>    dispatcher_;
  freight::util::ClockFn                                 clock_;
};

} // namespace freight::auction
