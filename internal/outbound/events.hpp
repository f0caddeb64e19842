#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace freight::outbound {

enum class NotificationKind : std::uint8_t {
  kAuctionOpened,
  kBidOutbid,
  kAuctionWon,
  kAuctionLost,
  kShipmentStatusChanged,
};

constexpr std::string_view ToString(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::kAuctionOpened:
      return "auction-opened";
    case NotificationKind::kBidOutbid:
      return "bid-outbid";
    case NotificationKind::kAuctionWon:
      return "auction-won";
    case NotificationKind::kAuctionLost:
      return "auction-lost";
    case NotificationKind::kShipmentStatusChanged:
      return "shipment-status-changed";
  }
  return "unknown";
}

struct Notification {
  NotificationKind kind = NotificationKind::kShipmentStatusChanged;

  // shipper or driver id
  std::string recipient_id;
  std::string shipment_id;
  std::string bid_id;

  std::string detail;
  uint64_t    at_ms = 0;
};

// "match committed at price P"
struct SettlementInstruction {
  std::string match_id;
  std::string shipment_id;
  std::string shipper_id;
  std::string driver_id;
  double      price           = 0.0;
  uint64_t    committed_at_ms = 0;
};

// Post-pickup failure that needs a human.
struct Escalation {
  std::string match_id;
  std::string shipment_id;
  std::string driver_id;
  std::string reason;
  uint64_t    at_ms = 0;
};

using OutboundEvent = std::variant<Notification, SettlementInstruction, Escalation>;

} // namespace freight::outbound
