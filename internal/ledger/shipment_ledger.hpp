#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/geo.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace freight::outbound {
class EventDispatcher;
}
namespace freight::ranking {
class OpenShipmentIndex;
}

namespace freight::ledger {

// Caller-supplied part of a new shipment.
struct ShipmentDraft {
  std::string shipper_id;

  freight::model::GeoPoint origin;
  freight::model::GeoPoint destination;

  double      weight_kg = 0.0;
  std::string cargo_type;
  std::string description;

  uint64_t pickup_start_ms   = 0;
  uint64_t pickup_end_ms     = 0;
  uint64_t delivery_start_ms = 0;
  uint64_t delivery_end_ms   = 0;

  std::optional<double> reserve_price;
  bool                  relist_on_no_bids = true;
};

// A committed-or-about-to-commit status move, announced after commit.
struct StatusChange {
  freight::db::model::ShipmentRecord shipment;
  freight::model::ShipmentStatus     from = freight::model::ShipmentStatus::kUnspecified;
  std::string                        reason;
};

/*
  Authoritative store of shipment records and their state machine.

  Every status move is a compare-and-swap on the record version plus an
  appended ShipmentEvent in the same transaction. Callers that already
  hold a transaction use Apply() and must Announce() the returned changes
  once that transaction commits; Announce keeps the open-shipment index
  and shippers in sync with the store.
*/
class ShipmentLedger {
 public:
  ShipmentLedger(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ranking::OpenShipmentIndex> index,
                 std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, freight::util::ClockFn clock = freight::util::Now);

  freight::db::model::ShipmentRecord Create(const ShipmentDraft& draft);

  freight::db::model::ShipmentRecord                Get(const std::string& shipment_id);
  std::optional<freight::db::model::ShipmentRecord> Find(const std::string& shipment_id);

  // Throws Conflict when the stored status is no longer `from`, InvalidState when the move is illegal.
  freight::db::model::ShipmentRecord Transition(const std::string& shipment_id, freight::model::ShipmentStatus from,
                                                freight::model::ShipmentStatus to, const std::string& reason);

  StatusChange Apply(freight::db::Transaction& tx, freight::db::model::ShipmentRecord& record, freight::model::ShipmentStatus to,
                     const std::string& reason) const;

  // Persists non-status fields (auction_round) with the same version CAS.
  void Save(freight::db::Transaction& tx, freight::db::model::ShipmentRecord& record) const;

  void Announce(const StatusChange& change);
  void Announce(const std::vector<StatusChange>& changes);

  std::vector<freight::db::model::ShipmentEventRecord> Events(const std::string& shipment_id);
  std::vector<freight::db::model::ShipmentRecord>      List(const freight::db::ShipmentFilter& filter);

  // Reloads every Open/Bidding shipment into the index; returns how many.
  std::size_t RebuildIndex();

  uint64_t NowMs() const;

 private:
  std::shared_ptr<freight::db::Repository>             repository_;
  std::shared_ptr<freight::ranking::OpenShipmentIndex> index_;
  std::shared_ptr<freight::outbound::EventDispatcher>  dispatcher_;
  freight::util::ClockFn                               clock_;
};

} // namespace freight::ledger
