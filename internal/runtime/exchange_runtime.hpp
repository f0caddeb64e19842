#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/util/time.hpp"

namespace freight::auction {
class AuctionCoordinator;
class AuctionScheduler;
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
namespace freight::outbound {
class EventDispatcher;
}
namespace freight::ranking {
class BackhaulMatcher;
class BidRanker;
class OpenShipmentIndex;
} // namespace freight::ranking
namespace freight::reputation {
class ReputationScorer;
}
namespace freight::util {
class KeyedMutex;
}

namespace freight::runtime {

/*
  The exchange core with no transport attached.

  Owns every long-lived component. Start() launches the outbound
  dispatcher and the auction timers; Stop() halts timers first and then
  drains outbound events.
*/
struct ExchangeRuntime {
  std::shared_ptr<freight::db::Repository>               repository;
  std::shared_ptr<freight::util::KeyedMutex>             shipment_locks;
  std::shared_ptr<freight::outbound::EventDispatcher>    dispatcher;
  std::shared_ptr<freight::ranking::OpenShipmentIndex>   index;
  std::shared_ptr<freight::ranking::BidRanker>           ranker;
  std::shared_ptr<freight::ranking::BackhaulMatcher>     backhaul;
  std::shared_ptr<freight::ledger::ShipmentLedger>       ledger;
  std::shared_ptr<freight::reputation::ReputationScorer> scorer;
  std::shared_ptr<freight::auction::AuctionCoordinator>  coordinator;
  std::shared_ptr<freight::dispatch::DispatchTracker>    dispatch;
  std::shared_ptr<freight::auction::BidIntake>           intake;
  std::shared_ptr<freight::auction::AuctionScheduler>    scheduler;

  void Start();
  void Stop();
};

std::shared_ptr<freight::db::Repository> BuildRepository(const freight::runtime::config::RuntimeConfig& config);

// Wires the core on the given repository; the clock is injectable for tests.
ExchangeRuntime BuildRuntime(const freight::runtime::config::RuntimeConfig& config, std::shared_ptr<freight::db::Repository> repository,
                             freight::util::ClockFn clock = freight::util::Now);

ExchangeRuntime BuildRuntime(const freight::runtime::config::RuntimeConfig& config);

} // namespace freight::runtime
