#include "memory_repository.hpp"

#include <algorithm>
#include <mutex>

#include "memory_tx.hpp"

namespace freight::db::memory {

namespace {

std::string WindowKey(const std::string& shipment_id, uint32_t round) {
  return shipment_id + "#" + std::to_string(round);
}

template <typename Record>
std::optional<Record> Read(const WriteSet<Record>& writes, const std::unordered_map<std::string, Record>& committed, std::shared_mutex& mutex,
                           const std::string& key) {
  if (auto it = writes.records.find(key); it != writes.records.end()) {
    return it->second;
  }

  std::shared_lock lock(mutex);
  auto             it = committed.find(key);
  if (it == committed.end()) return std::nullopt;
  return it->second;
}

template <typename Record>
Result Insert(WriteSet<Record>& writes, const std::unordered_map<std::string, Record>& committed, std::shared_mutex& mutex,
              const std::string& key, const Record& record) {
  if (Read(writes, committed, mutex, key).has_value()) {
    return Result::Err(ErrorCode::AlreadyExists, key);
  }
  writes.records[key] = record;
  writes.inserted.insert(key);
  return Result::Ok();
}

template <typename Record>
Result Update(WriteSet<Record>& writes, const std::unordered_map<std::string, Record>& committed, std::shared_mutex& mutex,
              const std::string& key, const Record& record) {
  auto current = Read(writes, committed, mutex, key);
  if (!current.has_value()) {
    return Result::Err(ErrorCode::NotFound, key);
  }
  if (current->version + 1 != record.version) {
    return Result::Err(ErrorCode::Conflict, "version mismatch for " + key);
  }
  if (!writes.records.contains(key)) {
    writes.base_versions[key] = current->version;
  }
  writes.records[key] = record;
  return Result::Ok();
}

// Committed rows overlaid with this transaction's writes.
template <typename Record, typename Pred>
std::vector<Record> Scan(const WriteSet<Record>& writes, const std::unordered_map<std::string, Record>& committed, std::shared_mutex& mutex,
                         Pred&& pred) {
  std::unordered_map<std::string, Record> merged;
  {
    std::shared_lock lock(mutex);
    for (const auto& [key, record] : committed) {
      if (!writes.records.contains(key)) merged.emplace(key, record);
    }
  }
  for (const auto& [key, record] : writes.records) {
    merged.emplace(key, record);
  }

  std::vector<Record> out;
  for (auto& [_, record] : merged) {
    if (pred(record)) out.push_back(std::move(record));
  }
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction::Pending& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx).Writes();
}

// ------------------------------------------------------------------
// Shipments
// ------------------------------------------------------------------

Result MemoryRepository::InsertShipment(Transaction& t, const model::ShipmentRecord& r) {
  return Insert(TX(t).shipments, committed_.shipments, mutex_, r.id, r);
}

std::optional<model::ShipmentRecord> MemoryRepository::GetShipment(Transaction& t, const std::string& id) {
  return Read(TX(t).shipments, committed_.shipments, mutex_, id);
}

std::vector<model::ShipmentRecord> MemoryRepository::ListShipments(Transaction& t, const ShipmentFilter& filter) {
  auto out = Scan(TX(t).shipments, committed_.shipments, mutex_, [&](const model::ShipmentRecord& r) {
    if (filter.shipper_id && r.shipper_id != *filter.shipper_id) return false;
    if (!filter.statuses.empty() && std::find(filter.statuses.begin(), filter.statuses.end(), r.status) == filter.statuses.end()) return false;
    return true;
  });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateShipment(Transaction& t, const model::ShipmentRecord& r) {
  return Update(TX(t).shipments, committed_.shipments, mutex_, r.id, r);
}

Result MemoryRepository::AppendShipmentEvent(Transaction& t, model::ShipmentEventRecord& r) {
  auto&    pending = TX(t).events;
  uint64_t count   = 0;
  {
    std::shared_lock lock(mutex_);
    if (auto it = committed_.events.find(r.shipment_id); it != committed_.events.end()) count = it->second.size();
  }
  count += static_cast<uint64_t>(std::count_if(pending.begin(), pending.end(), [&](const auto& e) { return e.shipment_id == r.shipment_id; }));
  r.sequence = count + 1;
  pending.push_back(r);
  return Result::Ok();
}

std::vector<model::ShipmentEventRecord> MemoryRepository::ListShipmentEvents(Transaction& t, const std::string& shipment_id) {
  std::vector<model::ShipmentEventRecord> out;
  {
    std::shared_lock lock(mutex_);
    if (auto it = committed_.events.find(shipment_id); it != committed_.events.end()) out = it->second;
  }
  for (const auto& e : TX(t).events) {
    if (e.shipment_id == shipment_id) out.push_back(e);
  }
  return out;
}

// ------------------------------------------------------------------
// Auction windows
// ------------------------------------------------------------------

Result MemoryRepository::InsertAuctionWindow(Transaction& t, const model::AuctionWindowRecord& r) {
  return Insert(TX(t).windows, committed_.windows, mutex_, WindowKey(r.shipment_id, r.round), r);
}

std::optional<model::AuctionWindowRecord> MemoryRepository::GetAuctionWindow(Transaction& t, const std::string& shipment_id, uint32_t round) {
  return Read(TX(t).windows, committed_.windows, mutex_, WindowKey(shipment_id, round));
}

std::vector<model::AuctionWindowRecord> MemoryRepository::ListAuctionWindows(Transaction& t, freight::model::AuctionState state) {
  auto out = Scan(TX(t).windows, committed_.windows, mutex_, [&](const model::AuctionWindowRecord& r) { return r.state == state; });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.shipment_id != b.shipment_id) return a.shipment_id < b.shipment_id;
    return a.round < b.round;
  });
  return out;
}

Result MemoryRepository::UpdateAuctionWindow(Transaction& t, const model::AuctionWindowRecord& r) {
  return Update(TX(t).windows, committed_.windows, mutex_, WindowKey(r.shipment_id, r.round), r);
}

// ------------------------------------------------------------------
// Bids
// ------------------------------------------------------------------

Result MemoryRepository::InsertBid(Transaction& t, const model::BidRecord& r) {
  return Insert(TX(t).bids, committed_.bids, mutex_, r.id, r);
}

std::optional<model::BidRecord> MemoryRepository::GetBid(Transaction& t, const std::string& id) {
  return Read(TX(t).bids, committed_.bids, mutex_, id);
}

std::vector<model::BidRecord> MemoryRepository::ListBids(Transaction& t, const BidFilter& filter) {
  auto out = Scan(TX(t).bids, committed_.bids, mutex_, [&](const model::BidRecord& r) {
    if (filter.shipment_id && r.shipment_id != *filter.shipment_id) return false;
    if (filter.driver_id && r.driver_id != *filter.driver_id) return false;
    if (filter.round && r.round != *filter.round) return false;
    if (filter.status && r.status != *filter.status) return false;
    return true;
  });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.submitted_at_ms != b.submitted_at_ms) return a.submitted_at_ms < b.submitted_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateBid(Transaction& t, const model::BidRecord& r) {
  return Update(TX(t).bids, committed_.bids, mutex_, r.id, r);
}

// ------------------------------------------------------------------
// Matches
// ------------------------------------------------------------------

Result MemoryRepository::InsertMatch(Transaction& t, const model::MatchRecord& r) {
  return Insert(TX(t).matches, committed_.matches, mutex_, r.id, r);
}

std::optional<model::MatchRecord> MemoryRepository::GetMatch(Transaction& t, const std::string& id) {
  return Read(TX(t).matches, committed_.matches, mutex_, id);
}

std::vector<model::MatchRecord> MemoryRepository::ListMatches(Transaction& t, const MatchFilter& filter) {
  auto out = Scan(TX(t).matches, committed_.matches, mutex_, [&](const model::MatchRecord& r) {
    if (filter.shipment_id && r.shipment_id != *filter.shipment_id) return false;
    if (filter.driver_id && r.driver_id != *filter.driver_id) return false;
    if (filter.execution_status && r.execution_status != *filter.execution_status) return false;
    return true;
  });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.committed_at_ms != b.committed_at_ms) return a.committed_at_ms < b.committed_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateMatch(Transaction& t, const model::MatchRecord& r) {
  return Update(TX(t).matches, committed_.matches, mutex_, r.id, r);
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result MemoryRepository::InsertDriver(Transaction& t, const model::DriverRecord& r) {
  return Insert(TX(t).drivers, committed_.drivers, mutex_, r.id, r);
}

std::optional<model::DriverRecord> MemoryRepository::GetDriver(Transaction& t, const std::string& id) {
  return Read(TX(t).drivers, committed_.drivers, mutex_, id);
}

std::vector<model::DriverRecord> MemoryRepository::ListDrivers(Transaction& t) {
  auto out = Scan(TX(t).drivers, committed_.drivers, mutex_, [](const model::DriverRecord&) { return true; });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::UpdateDriver(Transaction& t, const model::DriverRecord& r) {
  return Update(TX(t).drivers, committed_.drivers, mutex_, r.id, r);
}

} // namespace freight::db::memory
