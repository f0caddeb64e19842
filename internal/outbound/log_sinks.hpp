#pragma once

#include "internal/outbound/sinks.hpp"

namespace freight::outbound {

// Default sinks: record outbound traffic in the service log.

class LoggingNotificationSink final : public NotificationSink {
 public:
  void Notify(const Notification& event) override;
};

class LoggingSettlementGateway final : public SettlementGateway {
 public:
  void MatchCommitted(const SettlementInstruction& instruction) override;
};

class LoggingEscalationSink final : public EscalationSink {
 public:
  void Escalate(const Escalation& escalation) override;
};

} // namespace freight::outbound
