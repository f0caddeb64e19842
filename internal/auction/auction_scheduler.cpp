#include "auction_scheduler.hpp"

#include <chrono>
#include <functional>

#include "internal/observability/logging.hpp"

namespace freight::auction {

using freight::db::model::AuctionWindowRecord;
using freight::model::AuctionState;
using freight::observability::IntField;
using freight::observability::StringField;

AuctionScheduler::AuctionScheduler(std::shared_ptr<AuctionCoordinator> coordinator, std::shared_ptr<freight::dispatch::DispatchTracker> dispatch,
                                   AuctionOptions auction_options, freight::dispatch::DispatchOptions dispatch_options,
                                   freight::util::ClockFn clock)
    : coordinator_(std::move(coordinator)),
      dispatch_(std::move(dispatch)),
      auction_options_(auction_options),
      dispatch_options_(dispatch_options),
      clock_(std::move(clock)) {
}

AuctionScheduler::~AuctionScheduler() {
  Stop();
}

uint64_t AuctionScheduler::NowMs() const {
  return freight::util::ToUnixMillis(clock_());
}

void AuctionScheduler::Track(const AuctionWindowRecord& window) {
  Entry entry;
  entry.shipment_id = window.shipment_id;
  entry.round       = window.round;

  if (window.state == AuctionState::kPending) {
    entry.action = Action::kOpen;
    entry.due_ms = window.opens_at_ms;
  } else if (window.state == AuctionState::kOpen && !window.closed && window.closes_at_ms > 0) {
    entry.action = Action::kClose;
    entry.due_ms = window.closes_at_ms;
  } else {
    return;
  }

  {
    std::lock_guard lock(mutex_);
    heap_.push(std::move(entry));
  }
  cv_.notify_one();
}

std::size_t AuctionScheduler::Rehydrate() {
  const auto windows = coordinator_->LiveWindows();
  for (const auto& window : windows) {
    Track(window);
  }
  FREIGHT_LOG_INFO("auction timers rehydrated", {IntField("windows", static_cast<int64_t>(windows.size()))});
  return windows.size();
}

std::size_t AuctionScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return heap_.size();
}

std::size_t AuctionScheduler::RunDue() {
  const auto now = NowMs();

  std::vector<Entry> due;
  bool               sweep = false;
  {
    std::lock_guard lock(mutex_);
    while (!heap_.empty() && heap_.top().due_ms <= now) {
      due.push_back(heap_.top());
      heap_.pop();
    }
    if (dispatch_ && now >= next_sweep_ms_) {
      sweep          = true;
      next_sweep_ms_ = now + dispatch_options_.sweep_interval_ms;
    }
  }

  for (const auto& entry : due) {
    Fire(entry);
  }

  if (sweep) {
    try {
      const auto cancelled = dispatch_->SweepNoShows();
      if (cancelled > 0) {
        FREIGHT_LOG_INFO("no-show sweep cancelled matches", {IntField("count", static_cast<int64_t>(cancelled))});
      }
    } catch (const std::exception& e) {
      FREIGHT_LOG_WARN("no-show sweep failed", {StringField("error", e.what())});
    }
  }
  return due.size();
}

void AuctionScheduler::Fire(const Entry& entry) {
  try {
    if (entry.action == Action::kOpen) {
      // Activation announces the window, which re-arms the close timer through the listener.
      coordinator_->Activate(entry.shipment_id, entry.round);
    } else {
      coordinator_->Close(entry.shipment_id, freight::model::CloseTrigger::kTimer, entry.round);
    }
  } catch (const std::exception& e) {
    FREIGHT_LOG_WARN("auction timer failed", {StringField("shipment_id", entry.shipment_id), IntField("round", entry.round),
                                              StringField("error", e.what())});
  }
}

void AuctionScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }

  coordinator_->SetWindowListener([this](const AuctionWindowRecord& window) { Track(window); });
  Rehydrate();

  thread_ = std::thread([this] { Loop(); });
}

void AuctionScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  coordinator_->SetWindowListener(nullptr);
}

void AuctionScheduler::Loop() {
  const auto tick = std::chrono::milliseconds(auction_options_.timer_tick_ms > 0 ? auction_options_.timer_tick_ms : 1000);

  for (;;) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, tick, [this] { return !running_; });
      if (!running_) return;
    }
    RunDue();
  }
}

} // namespace freight::auction
