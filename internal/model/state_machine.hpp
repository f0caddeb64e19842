#pragma once

#include <cstdint>
#include <string_view>

namespace freight::model {

enum class ShipmentStatus : std::uint8_t {
  kUnspecified = 0,
  kDraft       = 1,
  kOpen        = 2,
  kBidding     = 3,
  kMatched     = 4,
  kInTransit   = 5,
  kDelivered   = 6,
  kCancelled   = 7,
  kFailed      = 8,
};

constexpr bool IsTerminal(ShipmentStatus status) {
  return status == ShipmentStatus::kDelivered || status == ShipmentStatus::kCancelled || status == ShipmentStatus::kFailed;
}

// Open and Bidding shipments are candidates for backhaul chaining.
constexpr bool IsListed(ShipmentStatus status) {
  return status == ShipmentStatus::kOpen || status == ShipmentStatus::kBidding;
}

constexpr bool CanTransition(ShipmentStatus from, ShipmentStatus to) {
  if (IsTerminal(from) || from == to) {
    return false;
  }

  switch (from) {
    case ShipmentStatus::kDraft:
      return to == ShipmentStatus::kOpen || to == ShipmentStatus::kCancelled;
    case ShipmentStatus::kOpen:
      return to == ShipmentStatus::kBidding || to == ShipmentStatus::kCancelled;
    case ShipmentStatus::kBidding:
      // Open: zero-bid re-list. Cancelled: shipper cancel or zero-bid without re-list.
      return to == ShipmentStatus::kMatched || to == ShipmentStatus::kOpen || to == ShipmentStatus::kCancelled;
    case ShipmentStatus::kMatched:
      // Bidding: driver cancelled before pickup, re-auction.
      return to == ShipmentStatus::kInTransit || to == ShipmentStatus::kBidding;
    case ShipmentStatus::kInTransit:
      return to == ShipmentStatus::kDelivered || to == ShipmentStatus::kFailed;
    default:
      return false;
  }
}

enum class BidStatus : std::uint8_t {
  kUnspecified = 0,
  kActive      = 1,
  kWithdrawn   = 2,
  kLost        = 3,
  kWon         = 4,
};

constexpr bool CanTransition(BidStatus from, BidStatus to) {
  switch (from) {
    case BidStatus::kActive:
      return to == BidStatus::kWithdrawn || to == BidStatus::kLost || to == BidStatus::kWon;
    case BidStatus::kWon:
      // The winner backed out; the bid no longer represents a live commitment.
      return to == BidStatus::kWithdrawn;
    default:
      return false;
  }
}

enum class AuctionState : std::uint8_t {
  kUnspecified = 0,
  kPending     = 1,
  kOpen        = 2,
  kClosing     = 3,
  kCommitted   = 4,
  kVoid        = 5,
};

constexpr bool IsFinal(AuctionState state) {
  return state == AuctionState::kCommitted || state == AuctionState::kVoid;
}

constexpr bool CanTransition(AuctionState from, AuctionState to) {
  switch (from) {
    case AuctionState::kPending:
      return to == AuctionState::kOpen || to == AuctionState::kVoid;
    case AuctionState::kOpen:
      return to == AuctionState::kClosing || to == AuctionState::kVoid;
    case AuctionState::kClosing:
      return to == AuctionState::kCommitted || to == AuctionState::kVoid;
    default:
      return false;
  }
}

enum class ExecutionStatus : std::uint8_t {
  kUnspecified = 0,
  kAssigned    = 1,
  kPickedUp    = 2,
  kInTransit   = 3,
  kDelivered   = 4,
  kCancelled   = 5,
  kFailed      = 6,
};

constexpr bool IsTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::kDelivered || status == ExecutionStatus::kCancelled || status == ExecutionStatus::kFailed;
}

constexpr bool CanTransition(ExecutionStatus from, ExecutionStatus to) {
  switch (from) {
    case ExecutionStatus::kAssigned:
      return to == ExecutionStatus::kPickedUp || to == ExecutionStatus::kCancelled;
    case ExecutionStatus::kPickedUp:
      return to == ExecutionStatus::kInTransit || to == ExecutionStatus::kDelivered || to == ExecutionStatus::kFailed;
    case ExecutionStatus::kInTransit:
      return to == ExecutionStatus::kDelivered || to == ExecutionStatus::kFailed;
    default:
      return false;
  }
}

enum class CancellationStage : std::uint8_t {
  kPreMatch   = 0,
  kPostMatch  = 1,
  kPostPickup = 2,
};

enum class CloseTrigger : std::uint8_t {
  kTimer    = 0,
  kShipper  = 1,
  kBidLimit = 2,
};

constexpr std::string_view ToString(ShipmentStatus status) {
  switch (status) {
    case ShipmentStatus::kDraft:
      return "draft";
    case ShipmentStatus::kOpen:
      return "open";
    case ShipmentStatus::kBidding:
      return "bidding";
    case ShipmentStatus::kMatched:
      return "matched";
    case ShipmentStatus::kInTransit:
      return "in_transit";
    case ShipmentStatus::kDelivered:
      return "delivered";
    case ShipmentStatus::kCancelled:
      return "cancelled";
    case ShipmentStatus::kFailed:
      return "failed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(BidStatus status) {
  switch (status) {
    case BidStatus::kActive:
      return "active";
    case BidStatus::kWithdrawn:
      return "withdrawn";
    case BidStatus::kLost:
      return "lost";
    case BidStatus::kWon:
      return "won";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(AuctionState state) {
  switch (state) {
    case AuctionState::kPending:
      return "pending";
    case AuctionState::kOpen:
      return "open";
    case AuctionState::kClosing:
      return "closing";
    case AuctionState::kCommitted:
      return "committed";
    case AuctionState::kVoid:
      return "void";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kAssigned:
      return "assigned";
    case ExecutionStatus::kPickedUp:
      return "picked_up";
    case ExecutionStatus::kInTransit:
      return "in_transit";
    case ExecutionStatus::kDelivered:
      return "delivered";
    case ExecutionStatus::kCancelled:
      return "cancelled";
    case ExecutionStatus::kFailed:
      return "failed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(CancellationStage stage) {
  switch (stage) {
    case CancellationStage::kPreMatch:
      return "pre_match";
    case CancellationStage::kPostMatch:
      return "post_match";
    case CancellationStage::kPostPickup:
      return "post_pickup";
  }
  return "unknown";
}

constexpr std::string_view ToString(CloseTrigger trigger) {
  switch (trigger) {
    case CloseTrigger::kTimer:
      return "timer";
    case CloseTrigger::kShipper:
      return "shipper";
    case CloseTrigger::kBidLimit:
      return "bid_limit";
  }
  return "unknown";
}

} // namespace freight::model
