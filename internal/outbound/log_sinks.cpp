#include "log_sinks.hpp"

#include "internal/observability/logging.hpp"

namespace freight::outbound {

using freight::observability::DoubleField;
using freight::observability::IntField;
using freight::observability::StringField;

void LoggingNotificationSink::Notify(const Notification& event) {
  FREIGHT_LOG_INFO("notification", {StringField("kind", ToString(event.kind)), StringField("recipient", event.recipient_id),
                                     StringField("shipment_id", event.shipment_id), StringField("bid_id", event.bid_id),
                                     StringField("detail", event.detail)});
}

void LoggingSettlementGateway::MatchCommitted(const SettlementInstruction& instruction) {
  FREIGHT_LOG_INFO("settlement: match committed",
                   {StringField("match_id", instruction.match_id), StringField("shipment_id", instruction.shipment_id),
                    StringField("shipper_id", instruction.shipper_id), StringField("driver_id", instruction.driver_id),
                    DoubleField("price", instruction.price), IntField("committed_at_ms", static_cast<int64_t>(instruction.committed_at_ms))});
}

void LoggingEscalationSink::Escalate(const Escalation& escalation) {
  FREIGHT_LOG_WARN("escalation: post-pickup failure",
                   {StringField("match_id", escalation.match_id), StringField("shipment_id", escalation.shipment_id),
                    StringField("driver_id", escalation.driver_id), StringField("reason", escalation.reason)});
}

} // namespace freight::outbound
