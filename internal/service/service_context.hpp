#pragma once

#include <memory>

namespace freight::auction {
class AuctionCoordinator;
class BidIntake;
} // namespace freight::auction
namespace freight::db {
class Repository;
}
namespace freight::dispatch {
class DispatchTracker;
}
namespace freight::ledger {
class ShipmentLedger;
}
namespace freight::ranking {
class BackhaulMatcher;
}
namespace freight::reputation {
class ReputationScorer;
}

namespace freight::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<freight::db::Repository>               repository;
  std::shared_ptr<freight::ledger::ShipmentLedger>       ledger;
  std::shared_ptr<freight::auction::AuctionCoordinator>  coordinator;
  std::shared_ptr<freight::auction::BidIntake>           intake;
  std::shared_ptr<freight::dispatch::DispatchTracker>    dispatch;
  std::shared_ptr<freight::reputation::ReputationScorer> scorer;
  std::shared_ptr<freight::ranking::BackhaulMatcher>     backhaul;
};

} // namespace freight::service
