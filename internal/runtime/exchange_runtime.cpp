#include "exchange_runtime.hpp"

#include "internal/auction/auction_coordinator.hpp"
#include "internal/auction/auction_scheduler.hpp"
#include "internal/auction/bid_intake.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/outbound/log_sinks.hpp"
#include "internal/ranking/backhaul_matcher.hpp"
#include "internal/ranking/bid_ranker.hpp"
#include "internal/ranking/open_shipment_index.hpp"
#include "internal/reputation/reputation_scorer.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace freight::runtime {

using freight::observability::IntField;
using freight::observability::StringField;

std::shared_ptr<freight::db::Repository> BuildRepository(const freight::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& path = database.sqlite().path().empty() ? std::string("freight-exchange.db") : database.sqlite().path();

    auto sqlite_db = std::make_shared<freight::db::sqlite::SqliteDB>(path);
    freight::db::sqlite::BootstrapSchema(*sqlite_db);
    FREIGHT_LOG_INFO("using sqlite repository", {StringField("path", path)});
    return std::make_shared<freight::db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  FREIGHT_LOG_INFO("using in-memory repository");
  return std::make_shared<freight::db::memory::MemoryRepository>();
}

ExchangeRuntime BuildRuntime(const freight::runtime::config::RuntimeConfig& config, std::shared_ptr<freight::db::Repository> repository,
                             freight::util::ClockFn clock) {
  const auto auction_options    = freight::config::AuctionOptionsFrom(config);
  const auto reputation_options = freight::config::ReputationOptionsFrom(config);
  const auto backhaul_options   = freight::config::BackhaulOptionsFrom(config);
  const auto dispatch_options   = freight::config::DispatchOptionsFrom(config);

  ExchangeRuntime rt;
  rt.repository     = std::move(repository);
  rt.shipment_locks = std::make_shared<freight::util::KeyedMutex>();

  // ------------------------------------------------------------------
  // Outbound
  // ------------------------------------------------------------------
  rt.dispatcher = std::make_shared<freight::outbound::EventDispatcher>(std::make_shared<freight::outbound::LoggingNotificationSink>(),
                                                                       std::make_shared<freight::outbound::LoggingSettlementGateway>(),
                                                                       std::make_shared<freight::outbound::LoggingEscalationSink>());

  // ------------------------------------------------------------------
  // Ranking
  // ------------------------------------------------------------------
  rt.index    = std::make_shared<freight::ranking::OpenShipmentIndex>(backhaul_options.grid_cell_degrees);
  rt.ranker   = std::make_shared<freight::ranking::BidRanker>(freight::config::RankingWeightsFrom(config));
  rt.backhaul = std::make_shared<freight::ranking::BackhaulMatcher>(rt.index, backhaul_options);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  rt.ledger      = std::make_shared<freight::ledger::ShipmentLedger>(rt.repository, rt.index, rt.dispatcher, clock);
  rt.scorer      = std::make_shared<freight::reputation::ReputationScorer>(rt.repository, reputation_options, clock);
  rt.coordinator = std::make_shared<freight::auction::AuctionCoordinator>(rt.repository, rt.ledger, rt.ranker, rt.backhaul, rt.dispatcher,
                                                                          rt.shipment_locks, auction_options,
                                                                          reputation_options.neutral_default, clock);
  rt.dispatch    = std::make_shared<freight::dispatch::DispatchTracker>(rt.repository, rt.ledger, rt.coordinator, rt.scorer, rt.dispatcher,
                                                                        dispatch_options, clock);
  rt.intake      = std::make_shared<freight::auction::BidIntake>(rt.repository, rt.coordinator, rt.dispatch, rt.scorer, rt.dispatcher, clock);
  rt.scheduler   = std::make_shared<freight::auction::AuctionScheduler>(rt.coordinator, rt.dispatch, auction_options, dispatch_options, clock);

  const auto listed = rt.ledger->RebuildIndex();
  FREIGHT_LOG_INFO("open shipment index rebuilt", {IntField("shipments", static_cast<int64_t>(listed))});
  return rt;
}

ExchangeRuntime BuildRuntime(const freight::runtime::config::RuntimeConfig& config) {
  return BuildRuntime(config, BuildRepository(config));
}

void ExchangeRuntime::Start() {
  dispatcher->Start();
  scheduler->Start();
}

void ExchangeRuntime::Stop() {
  if (scheduler) scheduler->Stop();
  if (dispatcher) dispatcher->Stop();
}

} // namespace freight::runtime
