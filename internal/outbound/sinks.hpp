#pragma once

#include "internal/outbound/events.hpp"

namespace freight::outbound {

/*
  Narrow interfaces to external collaborators.

  Implementations are invoked from the dispatcher thread only, one event at
  a time, and may block.
*/

class NotificationSink {
 public:
  virtual ~NotificationSink()                      = default;
  virtual void Notify(const Notification& event) = 0;
};

class SettlementGateway {
 public:
  virtual ~SettlementGateway()                                      = default;
  virtual void MatchCommitted(const SettlementInstruction& instruction) = 0;
};

class EscalationSink {
 public:
  virtual ~EscalationSink()                         = default;
  virtual void Escalate(const Escalation& escalation) = 0;
};

} // namespace freight::outbound
