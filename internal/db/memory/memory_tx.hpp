#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace freight::db::memory {

/*
  Pending writes for one table.

  base_versions holds the committed version observed before the first write
  to a key; Commit() rejects the transaction if any of them moved.
*/
template <typename Record>
struct WriteSet {
  std::unordered_map<std::string, Record>   records;
  std::unordered_map<std::string, uint64_t> base_versions;
  std::unordered_set<std::string>           inserted;
};

/*
  Transaction = committed view + write set

  Unlike a whole-state snapshot, transactions touching disjoint records never
  conflict, so auctions on different shipments commit independently.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  struct Pending {
    WriteSet<model::ShipmentRecord>                 shipments;
    WriteSet<model::AuctionWindowRecord>            windows;
    WriteSet<model::BidRecord>                      bids;
    WriteSet<model::MatchRecord>                    matches;
    WriteSet<model::DriverRecord>                   drivers;
    std::vector<model::ShipmentEventRecord>         events;
  };

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  Pending& Writes() {
    return pending_;
  }

 private:
  MemoryRepository& repo_;
  Pending           pending_;
  bool              committed_   = false;
  bool              rolled_back_ = false;
};

} // namespace freight::db::memory
