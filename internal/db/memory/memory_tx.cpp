#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace freight::db::memory {

namespace {

template <typename Record>
void Validate(const WriteSet<Record>& writes, const std::unordered_map<std::string, Record>& committed, const char* table) {
  for (const auto& [key, record] : writes.records) {
    (void)record;
    const auto it = committed.find(key);
    if (writes.inserted.contains(key)) {
      if (it != committed.end()) {
        throw freight::util::Conflict(std::string("transaction conflict: concurrent insert into ") + table + " for key " + key);
      }
      continue;
    }

    const auto base = writes.base_versions.find(key);
    if (it == committed.end() || base == writes.base_versions.end() || it->second.version != base->second) {
      throw freight::util::Conflict(std::string("transaction conflict: ") + table + " record " + key + " was modified concurrently");
    }
  }
}

template <typename Record>
void Apply(WriteSet<Record>& writes, std::unordered_map<std::string, Record>& committed) {
  for (auto& [key, record] : writes.records) {
    committed[key] = std::move(record);
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) {
    return;
  }

  std::unique_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  Validate(pending_.shipments, state.shipments, "shipment");
  Validate(pending_.windows, state.windows, "auction_window");
  Validate(pending_.bids, state.bids, "bid");
  Validate(pending_.matches, state.matches, "match");
  Validate(pending_.drivers, state.drivers, "driver");

  Apply(pending_.shipments, state.shipments);
  Apply(pending_.windows, state.windows);
  Apply(pending_.bids, state.bids);
  Apply(pending_.matches, state.matches);
  Apply(pending_.drivers, state.drivers);

  for (auto& event : pending_.events) {
    auto& log      = state.events[event.shipment_id];
    event.sequence = log.size() + 1;
    log.push_back(std::move(event));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  pending_     = Pending{};
  rolled_back_ = true;
}

} // namespace freight::db::memory
