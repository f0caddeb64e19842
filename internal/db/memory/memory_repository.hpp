#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace freight::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertShipment(Transaction&, const model::ShipmentRecord&) override;
  std::optional<model::ShipmentRecord> GetShipment(Transaction&, const std::string&) override;
  std::vector<model::ShipmentRecord> ListShipments(Transaction&, const ShipmentFilter&) override;
  Result UpdateShipment(Transaction&, const model::ShipmentRecord&) override;
  Result AppendShipmentEvent(Transaction&, model::ShipmentEventRecord&) override;
  std::vector<model::ShipmentEventRecord> ListShipmentEvents(Transaction&, const std::string&) override;

  Result InsertAuctionWindow(Transaction&, const model::AuctionWindowRecord&) override;
  std::optional<model::AuctionWindowRecord> GetAuctionWindow(Transaction&, const std::string&, uint32_t) override;
  std::vector<model::AuctionWindowRecord> ListAuctionWindows(Transaction&, freight::model::AuctionState) override;
  Result UpdateAuctionWindow(Transaction&, const model::AuctionWindowRecord&) override;

  Result InsertBid(Transaction&, const model::BidRecord&) override;
  std::optional<model::BidRecord> GetBid(Transaction&, const std::string&) override;
  std::vector<model::BidRecord> ListBids(Transaction&, const BidFilter&) override;
  Result UpdateBid(Transaction&, const model::BidRecord&) override;

  Result InsertMatch(Transaction&, const model::MatchRecord&) override;
  std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string&) override;
  std::vector<model::MatchRecord> ListMatches(Transaction&, const MatchFilter&) override;
  Result UpdateMatch(Transaction&, const model::MatchRecord&) override;

  Result InsertDriver(Transaction&, const model::DriverRecord&) override;
  std::optional<model::DriverRecord> GetDriver(Transaction&, const std::string&) override;
  std::vector<model::DriverRecord> ListDrivers(Transaction&) override;
  Result UpdateDriver(Transaction&, const model::DriverRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ShipmentRecord> shipments;
    std::unordered_map<std::string, std::vector<model::ShipmentEventRecord>> events;
    std::unordered_map<std::string, model::AuctionWindowRecord> windows;
    std::unordered_map<std::string, model::BidRecord> bids;
    std::unordered_map<std::string, model::MatchRecord> matches;
    std::unordered_map<std::string, model::DriverRecord> drivers;
  };

  mutable std::shared_mutex mutex_;
  State committed_;
};

}
