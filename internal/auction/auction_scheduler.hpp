#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "internal/auction/auction_coordinator.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/util/time.hpp"

namespace freight::auction {

/*
  Deadline timers for auction windows.

  Keeps a min-heap of due actions (open a scheduled round, close an expired
  one) and fires them from a single background thread. Firing only calls
  into the coordinator, which re-checks the round under the shipment lock,
  so stale or duplicate entries are harmless. Also runs the periodic
  no-show sweep.
*/
class AuctionScheduler {
 public:
  AuctionScheduler(std::shared_ptr<AuctionCoordinator> coordinator, std::shared_ptr<freight::dispatch::DispatchTracker> dispatch,
                   AuctionOptions auction_options, freight::dispatch::DispatchOptions dispatch_options,
                   freight::util::ClockFn clock = freight::util::Now);
  ~AuctionScheduler();

  AuctionScheduler(const AuctionScheduler&)            = delete;
  AuctionScheduler& operator=(const AuctionScheduler&) = delete;

  void Start();
  void Stop();

  void Track(const freight::db::model::AuctionWindowRecord& window);

  // Re-arms timers for every Pending and Open window in the store.
  std::size_t Rehydrate();

  // Fires everything due at the current clock reading; returns how many entries fired.
  std::size_t RunDue();

  std::size_t Pending() const;

 private:
  enum class Action : std::uint8_t { kOpen, kClose };

  struct Entry {
    uint64_t    due_ms = 0;
    std::string shipment_id;
    uint32_t    round  = 0;
    Action      action = Action::kClose;

    bool operator>(const Entry& other) const {
      return due_ms > other.due_ms;
    }
  };

  void     Loop();
  void     Fire(const Entry& entry);
  uint64_t NowMs() const;

  std::shared_ptr<AuctionCoordinator>                 coordinator_;
  std::shared_ptr<freight::dispatch::DispatchTracker> dispatch_;
  AuctionOptions                                      auction_options_;
  freight::dispatch::DispatchOptions                  dispatch_options_;
  freight::util::ClockFn                              clock_;

  mutable std::mutex                                                 mutex_;
  std::condition_variable                                            cv_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap_;
  uint64_t                                                           next_sweep_ms_ = 0;
  bool                                                               running_       = false;
  std::thread                                                        thread_;
};

} // namespace freight::auction
