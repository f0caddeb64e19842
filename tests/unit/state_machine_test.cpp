#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace freight::model;

void TestShipmentHappyPath() {
  assert(CanTransition(ShipmentStatus::kDraft, ShipmentStatus::kOpen));
  assert(CanTransition(ShipmentStatus::kOpen, ShipmentStatus::kBidding));
  assert(CanTransition(ShipmentStatus::kBidding, ShipmentStatus::kMatched));
  assert(CanTransition(ShipmentStatus::kMatched, ShipmentStatus::kInTransit));
  assert(CanTransition(ShipmentStatus::kInTransit, ShipmentStatus::kDelivered));
}

void TestShipmentRejectsSkipsAndTerminalMoves() {
  assert(!CanTransition(ShipmentStatus::kDraft, ShipmentStatus::kBidding));
  assert(!CanTransition(ShipmentStatus::kOpen, ShipmentStatus::kMatched));
  assert(!CanTransition(ShipmentStatus::kMatched, ShipmentStatus::kCancelled));
  assert(!CanTransition(ShipmentStatus::kMatched, ShipmentStatus::kDelivered));

  for (const auto terminal : {ShipmentStatus::kDelivered, ShipmentStatus::kCancelled, ShipmentStatus::kFailed}) {
    assert(IsTerminal(terminal));
    for (const auto to : {ShipmentStatus::kDraft, ShipmentStatus::kOpen, ShipmentStatus::kBidding, ShipmentStatus::kMatched,
                          ShipmentStatus::kInTransit, ShipmentStatus::kDelivered, ShipmentStatus::kCancelled, ShipmentStatus::kFailed}) {
      assert(!CanTransition(terminal, to));
    }
  }
}

void TestShipmentRecoveryEdges() {
  // Zero-bid re-list and pre-pickup cancellation re-auction.
  assert(CanTransition(ShipmentStatus::kBidding, ShipmentStatus::kOpen));
  assert(CanTransition(ShipmentStatus::kMatched, ShipmentStatus::kBidding));
  assert(CanTransition(ShipmentStatus::kInTransit, ShipmentStatus::kFailed));
  assert(IsListed(ShipmentStatus::kOpen));
  assert(IsListed(ShipmentStatus::kBidding));
  assert(!IsListed(ShipmentStatus::kMatched));
}

void TestBidAndWindowTransitions() {
  assert(CanTransition(BidStatus::kActive, BidStatus::kWon));
  assert(CanTransition(BidStatus::kActive, BidStatus::kWithdrawn));
  assert(CanTransition(BidStatus::kWon, BidStatus::kWithdrawn));
  assert(!CanTransition(BidStatus::kLost, BidStatus::kActive));
  assert(!CanTransition(BidStatus::kWithdrawn, BidStatus::kActive));

  assert(CanTransition(AuctionState::kPending, AuctionState::kOpen));
  assert(CanTransition(AuctionState::kOpen, AuctionState::kClosing));
  assert(CanTransition(AuctionState::kClosing, AuctionState::kCommitted));
  assert(!CanTransition(AuctionState::kCommitted, AuctionState::kOpen));
  assert(!CanTransition(AuctionState::kVoid, AuctionState::kOpen));
  assert(IsFinal(AuctionState::kCommitted) && IsFinal(AuctionState::kVoid));
}

void TestExecutionTransitions() {
  assert(CanTransition(ExecutionStatus::kAssigned, ExecutionStatus::kPickedUp));
  assert(CanTransition(ExecutionStatus::kPickedUp, ExecutionStatus::kDelivered));
  assert(CanTransition(ExecutionStatus::kInTransit, ExecutionStatus::kFailed));
  assert(!CanTransition(ExecutionStatus::kAssigned, ExecutionStatus::kDelivered));
  assert(!CanTransition(ExecutionStatus::kPickedUp, ExecutionStatus::kCancelled));
  assert(!CanTransition(ExecutionStatus::kDelivered, ExecutionStatus::kFailed));
}

} // namespace

int main() {
  TestShipmentHappyPath();
  TestShipmentRejectsSkipsAndTerminalMoves();
  TestShipmentRecoveryEdges();
  TestBidAndWindowTransitions();
  TestExecutionTransitions();

  std::cout << "freight_exchange_unit_state_machine: pass\n";
  return 0;
}
