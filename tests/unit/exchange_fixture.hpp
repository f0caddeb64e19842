#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/auction/bid_intake.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/outbound/sinks.hpp"
#include "internal/ranking/backhaul_matcher.hpp"
#include "internal/ranking/bid_ranker.hpp"
#include "internal/ranking/open_shipment_index.hpp"
#include "internal/reputation/reputation_scorer.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/time.hpp"

namespace freight::testing {

constexpr uint64_t kStartMs  = 1'700'000'000'000;
constexpr uint64_t kMinuteMs = 60'000;
constexpr uint64_t kHourMs   = 60 * kMinuteMs;

class ManualClock {
 public:
  explicit ManualClock(uint64_t start_ms = kStartMs) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const {
    return now_ms_.load();
  }

  void Advance(uint64_t ms) {
    now_ms_ += ms;
  }

  void Set(uint64_t ms) {
    now_ms_ = ms;
  }

  freight::util::ClockFn Fn() {
    return [this] { return freight::util::FromUnixMillis(now_ms_.load()); };
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

// Captures every outbound event for assertions.
class RecordingSinks final : public freight::outbound::NotificationSink,
                             public freight::outbound::SettlementGateway,
                             public freight::outbound::EscalationSink {
 public:
  void Notify(const freight::outbound::Notification& event) override {
    std::lock_guard lock(mutex_);
    notifications_.push_back(event);
  }

  void MatchCommitted(const freight::outbound::SettlementInstruction& instruction) override {
    std::lock_guard lock(mutex_);
    settlements_.push_back(instruction);
  }

  void Escalate(const freight::outbound::Escalation& escalation) override {
    std::lock_guard lock(mutex_);
    escalations_.push_back(escalation);
  }

  std::vector<freight::outbound::Notification> Notifications(freight::outbound::NotificationKind kind) const {
    std::lock_guard                              lock(mutex_);
    std::vector<freight::outbound::Notification> out;
    for (const auto& n : notifications_) {
      if (n.kind == kind) out.push_back(n);
    }
    return out;
  }

  std::vector<freight::outbound::SettlementInstruction> Settlements() const {
    std::lock_guard lock(mutex_);
    return settlements_;
  }

  std::vector<freight::outbound::Escalation> Escalations() const {
    std::lock_guard lock(mutex_);
    return escalations_;
  }

 private:
  mutable std::mutex                                    mutex_;
  std::vector<freight::outbound::Notification>          notifications_;
  std::vector<freight::outbound::SettlementInstruction> settlements_;
  std::vector<freight::outbound::Escalation>            escalations_;
};

// True when fn throws E; any other exception propagates.
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

inline freight::model::GeoPoint Point(double lat, double lon, const std::string& label = {}) {
  freight::model::GeoPoint point;
  point.latitude  = lat;
  point.longitude = lon;
  point.label     = label;
  return point;
}

// Chicago -> Indianapolis, pickup in 2-6h, delivery in 8-12h.
inline freight::ledger::ShipmentDraft MakeDraft(const std::string& shipper_id = "shipper-1", uint64_t now_ms = kStartMs) {
  freight::ledger::ShipmentDraft draft;
  draft.shipper_id        = shipper_id;
  draft.origin            = Point(41.8781, -87.6298, "Chicago");
  draft.destination       = Point(39.7684, -86.1581, "Indianapolis");
  draft.weight_kg         = 8000.0;
  draft.cargo_type        = "dry-van";
  draft.description       = "palletized paper goods";
  draft.pickup_start_ms   = now_ms + 2 * kHourMs;
  draft.pickup_end_ms     = now_ms + 6 * kHourMs;
  draft.delivery_start_ms = now_ms + 8 * kHourMs;
  draft.delivery_end_ms   = now_ms + 12 * kHourMs;
  return draft;
}

/*
  The exchange core on an in-memory repository with a manual clock and
  recording sinks. The outbound dispatcher is not started: Flush() delivers
  queued events inline.
*/
struct Exchange {
  explicit Exchange(freight::auction::AuctionOptions auction_options = {}, freight::dispatch::DispatchOptions dispatch_options = {},
                    std::shared_ptr<freight::db::Repository> repo = nullptr)
      : repository(repo ? std::move(repo) : std::make_shared<freight::db::memory::MemoryRepository>()) {
    sinks          = std::make_shared<RecordingSinks>();
    dispatcher     = std::make_shared<freight::outbound::EventDispatcher>(sinks, sinks, sinks);
    shipment_locks = std::make_shared<freight::util::KeyedMutex>();
    index          = std::make_shared<freight::ranking::OpenShipmentIndex>(0.5);
    ranker         = std::make_shared<freight::ranking::BidRanker>();
    backhaul       = std::make_shared<freight::ranking::BackhaulMatcher>(index, freight::ranking::BackhaulOptions{});
    ledger         = std::make_shared<freight::ledger::ShipmentLedger>(repository, index, dispatcher, clock.Fn());
    scorer         = std::make_shared<freight::reputation::ReputationScorer>(repository, freight::reputation::ReputationOptions{}, clock.Fn());
    coordinator    = std::make_shared<freight::auction::AuctionCoordinator>(repository, ledger, ranker, backhaul, dispatcher, shipment_locks,
                                                                         auction_options, scorer->Options().neutral_default, clock.Fn());
    dispatch = std::make_shared<freight::dispatch::DispatchTracker>(repository, ledger, coordinator, scorer, dispatcher, dispatch_options, clock.Fn());
    intake   = std::make_shared<freight::auction::BidIntake>(repository, coordinator, dispatch, scorer, dispatcher, clock.Fn());
  }

  // Draft -> Open.
  freight::db::model::ShipmentRecord Post(const freight::ledger::ShipmentDraft& draft) {
    const auto created = ledger->Create(draft);
    return ledger->Transition(created.id, freight::model::ShipmentStatus::kDraft, freight::model::ShipmentStatus::kOpen, "published");
  }

  freight::db::model::ShipmentRecord PostAndOpen(const freight::ledger::ShipmentDraft& draft) {
    const auto shipment = Post(draft);
    coordinator->Open(shipment.id);
    return ledger->Get(shipment.id);
  }

  freight::db::model::BidRecord Bid(const std::string& shipment_id, const std::string& driver_id, double price, double eta_minutes = 30.0) {
    freight::auction::BidSubmission submission;
    submission.shipment_id = shipment_id;
    submission.driver_id   = driver_id;
    submission.price       = price;
    submission.eta_minutes = eta_minutes;
    submission.location    = Point(41.85, -87.65);
    return intake->Submit(submission);
  }

  ManualClock                                            clock;
  std::shared_ptr<freight::db::Repository>               repository;
  std::shared_ptr<RecordingSinks>                        sinks;
  std::shared_ptr<freight::outbound::EventDispatcher>    dispatcher;
  std::shared_ptr<freight::util::KeyedMutex>             shipment_locks;
  std::shared_ptr<freight::ranking::OpenShipmentIndex>   index;
  std::shared_ptr<freight::ranking::BidRanker>           ranker;
  std::shared_ptr<freight::ranking::BackhaulMatcher>     backhaul;
  std::shared_ptr<freight::ledger::ShipmentLedger>       ledger;
  std::shared_ptr<freight::reputation::ReputationScorer> scorer;
  std::shared_ptr<freight::auction::AuctionCoordinator>  coordinator;
  std::shared_ptr<freight::dispatch::DispatchTracker>    dispatch;
  std::shared_ptr<freight::auction::BidIntake>           intake;
};

} // namespace freight::testing
