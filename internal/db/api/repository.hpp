#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/auction_window_record.hpp"
#include "internal/db/model/bid_record.hpp"
#include "internal/db/model/driver_record.hpp"
#include "internal/db/model/match_record.hpp"
#include "internal/db/model/shipment_event_record.hpp"
#include "internal/db/model/shipment_record.hpp"

namespace freight::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Update* is a compare-and-swap: it succeeds only when the stored version
    equals record.version - 1, otherwise it returns ErrorCode::Conflict
  - Insert* fails with ErrorCode::AlreadyExists on a duplicate key

  The DB is the source of truth for:
    shipment state
    bids and matches
    driver reputation
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Shipments
  // ---------------------------------------------------------------------

  virtual Result InsertShipment(Transaction&, const model::ShipmentRecord&) = 0;

  virtual std::optional<model::ShipmentRecord> GetShipment(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ShipmentRecord> ListShipments(Transaction&, const ShipmentFilter&) = 0;

  virtual Result UpdateShipment(Transaction&, const model::ShipmentRecord&) = 0;

  // Assigns the next sequence number for the shipment.
  virtual Result AppendShipmentEvent(Transaction&, model::ShipmentEventRecord&) = 0;

  virtual std::vector<model::ShipmentEventRecord> ListShipmentEvents(Transaction&, const std::string& shipment_id) = 0;

  // ---------------------------------------------------------------------
  // Auction windows
  // ---------------------------------------------------------------------

  virtual Result InsertAuctionWindow(Transaction&, const model::AuctionWindowRecord&) = 0;

  virtual std::optional<model::AuctionWindowRecord> GetAuctionWindow(Transaction&, const std::string& shipment_id, uint32_t round) = 0;

  virtual std::vector<model::AuctionWindowRecord> ListAuctionWindows(Transaction&, freight::model::AuctionState state) = 0;

  virtual Result UpdateAuctionWindow(Transaction&, const model::AuctionWindowRecord&) = 0;

  // ---------------------------------------------------------------------
  // Bids
  // ---------------------------------------------------------------------

  virtual Result InsertBid(Transaction&, const model::BidRecord&) = 0;

  virtual std::optional<model::BidRecord> GetBid(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::BidRecord> ListBids(Transaction&, const BidFilter&) = 0;

  virtual Result UpdateBid(Transaction&, const model::BidRecord&) = 0;

  // ---------------------------------------------------------------------
  // Matches
  // ---------------------------------------------------------------------

  virtual Result InsertMatch(Transaction&, const model::MatchRecord&) = 0;

  virtual std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::MatchRecord> ListMatches(Transaction&, const MatchFilter&) = 0;

  virtual Result UpdateMatch(Transaction&, const model::MatchRecord&) = 0;

  // ---------------------------------------------------------------------
  // Drivers
  // ---------------------------------------------------------------------

  virtual Result InsertDriver(Transaction&, const model::DriverRecord&) = 0;

  virtual std::optional<model::DriverRecord> GetDriver(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::DriverRecord> ListDrivers(Transaction&) = 0;

  virtual Result UpdateDriver(Transaction&, const model::DriverRecord&) = 0;
};

} // namespace freight::db
