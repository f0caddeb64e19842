#include "event_dispatcher.hpp"

#include <exception>
#include <string>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace freight::outbound {

EventDispatcher::EventDispatcher(std::shared_ptr<NotificationSink> notifications, std::shared_ptr<SettlementGateway> settlement,
                                 std::shared_ptr<EscalationSink> escalations)
    : notifications_(std::move(notifications)), settlement_(std::move(settlement)), escalations_(std::move(escalations)) {
}

EventDispatcher::~EventDispatcher() {
  Stop();
}

void EventDispatcher::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  shutdown_ = false;
  running_  = true;
  thread_   = std::thread(&EventDispatcher::Run, this);
}

void EventDispatcher::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(mutex_);
  running_ = false;
}

void EventDispatcher::Publish(OutboundEvent event) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void EventDispatcher::Flush() {
  std::unique_lock lock(mutex_);
  if (!running_) {
    // No worker: deliver inline so callers still observe every event.
    while (!queue_.empty()) {
      auto event = std::move(queue_.front());
      queue_.pop_front();
      lock.unlock();
      Deliver(event);
      lock.lock();
      ++delivered_;
    }
    return;
  }
  idle_cv_.wait(lock, [&] { return queue_.empty() && !busy_; });
}

uint64_t EventDispatcher::Delivered() const {
  std::lock_guard lock(mutex_);
  return delivered_;
}

void EventDispatcher::Run() {
  while (true) {
    OutboundEvent event;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) break;

      event = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    Deliver(event);

    {
      std::lock_guard lock(mutex_);
      busy_ = false;
      ++delivered_;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void EventDispatcher::Deliver(const OutboundEvent& event) {
  try {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, Notification>) {
            if (notifications_) notifications_->Notify(e);
          } else if constexpr (std::is_same_v<T, SettlementInstruction>) {
            if (settlement_) settlement_->MatchCommitted(e);
          } else {
            if (escalations_) escalations_->Escalate(e);
          }
        },
        event);
  } catch (const std::exception& e) {
    FREIGHT_LOG_ERROR("outbound delivery failed", {freight::observability::StringField("error", e.what()),
                                                    freight::observability::IntField("event_index", static_cast<int64_t>(event.index()))});
  }
}

} // namespace freight::outbound
