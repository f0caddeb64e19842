#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/outbound/events.hpp"
#include "internal/outbound/sinks.hpp"

namespace freight::outbound {

/*
  Fire-and-forget fan-out of outbound events.

  Publish() only enqueues; a single worker thread drains the queue and
  calls the sinks in publish order. A failing sink is logged and skipped.
  Stop() drains what is already queued before joining.
*/
class EventDispatcher {
 public:
  EventDispatcher(std::shared_ptr<NotificationSink> notifications, std::shared_ptr<SettlementGateway> settlement,
                  std::shared_ptr<EscalationSink> escalations);
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&)            = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  void Start();
  void Stop();

  void Publish(OutboundEvent event);

  // Blocks until everything published so far has been delivered.
  void Flush();

  uint64_t Delivered() const;

 private:
  void Run();
  void Deliver(const OutboundEvent& event);

  std::shared_ptr<NotificationSink>  notifications_;
  std::shared_ptr<SettlementGateway> settlement_;
  std::shared_ptr<EscalationSink>    escalations_;

  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::condition_variable   idle_cv_;
  std::deque<OutboundEvent> queue_;
  bool                      shutdown_  = false;
  bool                      running_   = false;
  bool                      busy_      = false;
  uint64_t                  delivered_ = 0;

  std::thread thread_;
};

} // namespace freight::outbound
