#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/shipment_ledger.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/time.hpp"

namespace freight::outbound {
class EventDispatcher;
}
namespace freight::ranking {
class BackhaulMatcher;
class BidRanker;
} // namespace freight::ranking

namespace freight::auction {

struct AuctionOptions {
  // 0 = explicit close only
  uint64_t default_duration_ms = 15 * 60 * 1000;
  double   min_price_floor     = 0.0;
  // 0 = unlimited
  uint32_t max_bids_per_window = 0;
  uint64_t timer_tick_ms       = 1000;
};

enum class CloseOutcome : std::uint8_t {
  kMatched,
  kRelisted,
  kCancelled,
  kAlreadyClosed,
  // Timer fired early or for a stale round; nothing changed.
  kIgnored,
};

struct CloseResult {
  CloseOutcome                                   outcome = CloseOutcome::kIgnored;
  freight::db::model::ShipmentRecord             shipment;
  freight::db::model::AuctionWindowRecord        window;
  std::optional<freight::db::model::MatchRecord> match;
};

/*
  Owns the auction lifecycle of each shipment.

  Every mutation runs under the shipment's mutex from the shared registry
  and inside a single repository transaction; notifications and ledger
  announcements are published only after that transaction commits.

  Close() is the single path for timer, shipper and bid-limit closes and is
  idempotent: closing a committed window returns the existing match.
*/
class AuctionCoordinator {
 public:
  using WindowListener = std::function<void(const freight::db::model::AuctionWindowRecord&)>;

  AuctionCoordinator(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ledger::ShipmentLedger> ledger,
                     std::shared_ptr<const freight::ranking::BidRanker> ranker, std::shared_ptr<const freight::ranking::BackhaulMatcher> backhaul,
                     std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, std::shared_ptr<freight::util::KeyedMutex> shipment_locks,
                     AuctionOptions options, double neutral_reputation, freight::util::ClockFn clock = freight::util::Now);

  // Open shipment -> Bidding with a new round. A scheduled (Pending) round is opened immediately instead.
  freight::db::model::AuctionWindowRecord Open(const std::string& shipment_id, std::optional<uint64_t> duration_ms = std::nullopt,
                                               uint32_t bid_limit = 0);

  // Records a Pending round that opens at opens_at_ms; opens now if that time has passed.
  freight::db::model::AuctionWindowRecord Schedule(const std::string& shipment_id, uint64_t opens_at_ms,
                                                   std::optional<uint64_t> duration_ms = std::nullopt, uint32_t bid_limit = 0);

  // Opens a due Pending round. Returns nullopt when the round is not (or no longer) pending and due.
  std::optional<freight::db::model::AuctionWindowRecord> Activate(const std::string& shipment_id, uint32_t round);

  CloseResult Close(const std::string& shipment_id, freight::model::CloseTrigger trigger, std::optional<uint32_t> round = std::nullopt);

  freight::db::model::ShipmentRecord CancelShipment(const std::string& shipment_id, const std::string& reason);

  /*
    Matched -> Bidding with a fresh round. The caller holds the shipment
    lock and the transaction, and must call AnnounceWindow() after commit.
  */
  freight::db::model::AuctionWindowRecord ReopenLocked(freight::db::Transaction& tx, freight::db::model::ShipmentRecord& shipment,
                                                       const std::string& reason, std::vector<freight::ledger::StatusChange>& changes);

  void AnnounceWindow(const freight::db::model::ShipmentRecord& shipment, const freight::db::model::AuctionWindowRecord& window);

  std::optional<freight::db::model::AuctionWindowRecord> CurrentWindow(const std::string& shipment_id);

  // Pending and Open windows, for timer rehydration.
  std::vector<freight::db::model::AuctionWindowRecord> LiveWindows();

  void SetWindowListener(WindowListener listener);

  freight::util::KeyedMutex& ShipmentLocks() {
    return *shipment_locks_;
  }

  const AuctionOptions& Options() const {
    return options_;
  }

  uint64_t NowMs() const;

 private:
  freight::db::model::AuctionWindowRecord OpenLocked(freight::db::Transaction& tx, freight::db::model::ShipmentRecord& shipment,
                                                     std::optional<uint64_t> duration_ms, uint32_t bid_limit, const std::string& reason,
                                                     std::vector<freight::ledger::StatusChange>& changes);

  std::optional<freight::db::model::AuctionWindowRecord> LoadCurrentWindow(freight::db::Transaction& tx,
                                                                           const freight::db::model::ShipmentRecord& shipment);

  uint64_t ResolveDuration(std::optional<uint64_t> duration_ms) const;
  uint32_t ResolveBidLimit(uint32_t bid_limit) const;

  std::shared_ptr<freight::db::Repository>                 repository_;
  std::shared_ptr<freight::ledger::ShipmentLedger>         ledger_;
  std::shared_ptr<const freight::ranking::BidRanker>       ranker_;
  std::shared_ptr<const freight::ranking::BackhaulMatcher> backhaul_;
  std::shared_ptr<freight::outbound::EventDispatcher>      dispatcher_;
  std::shared_ptr<freight::util::KeyedMutex>               shipment_locks_;
  AuctionOptions                                           options_;
  double                                                   neutral_reputation_;
  freight::util::ClockFn                                   clock_;

  std::mutex     listener_mutex_;
  WindowListener listener_;
};

constexpr std::string_view ToString(CloseOutcome outcome) {
  switch (outcome) {
    case CloseOutcome::kMatched:
      return "matched";
    case CloseOutcome::kRelisted:
      return "relisted";
    case CloseOutcome::kCancelled:
      return "cancelled";
    case CloseOutcome::kAlreadyClosed:
      return "already_closed";
    case CloseOutcome::kIgnored:
      return "ignored";
  }
  return "unknown";
}

} // namespace freight::auction
