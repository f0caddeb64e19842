#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace freight::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  // duplicate keys surface as SQLITE_CONSTRAINT_PRIMARYKEY
  sqlite3_extended_result_codes(db_, 1);

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS shipment (id TEXT PRIMARY KEY, shipper_id TEXT NOT NULL, origin_lat REAL NOT NULL, origin_lon REAL NOT NULL, "
      "origin_label TEXT, dest_lat REAL NOT NULL, dest_lon REAL NOT NULL, dest_label TEXT, weight_kg REAL NOT NULL, cargo_type TEXT, "
      "description TEXT, pickup_start_ms INTEGER NOT NULL, pickup_end_ms INTEGER NOT NULL, delivery_start_ms INTEGER NOT NULL, "
      "delivery_end_ms INTEGER NOT NULL, reserve_price REAL, relist_on_no_bids INTEGER NOT NULL, status INTEGER NOT NULL, "
      "auction_round INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS shipment_status_idx ON shipment(status);",
      "CREATE INDEX IF NOT EXISTS shipment_shipper_idx ON shipment(shipper_id);",
      "CREATE TABLE IF NOT EXISTS shipment_event (shipment_id TEXT NOT NULL REFERENCES shipment(id), sequence INTEGER NOT NULL, "
      "from_status INTEGER NOT NULL, to_status INTEGER NOT NULL, reason TEXT, at_ms INTEGER NOT NULL, PRIMARY KEY (shipment_id, sequence));",
      "CREATE TABLE IF NOT EXISTS auction_window (shipment_id TEXT NOT NULL REFERENCES shipment(id), round INTEGER NOT NULL, "
      "state INTEGER NOT NULL, opens_at_ms INTEGER NOT NULL, closes_at_ms INTEGER NOT NULL, bid_limit INTEGER NOT NULL, "
      "closed INTEGER NOT NULL, match_id TEXT, version INTEGER NOT NULL, PRIMARY KEY (shipment_id, round));",
      "CREATE INDEX IF NOT EXISTS auction_window_state_idx ON auction_window(state);",
      "CREATE TABLE IF NOT EXISTS bid (id TEXT PRIMARY KEY, shipment_id TEXT NOT NULL REFERENCES shipment(id), round INTEGER NOT NULL, "
      "driver_id TEXT NOT NULL, price REAL NOT NULL, submitted_at_ms INTEGER NOT NULL, driver_lat REAL NOT NULL, driver_lon REAL NOT NULL, "
      "driver_label TEXT, eta_minutes REAL NOT NULL, message TEXT, status INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS bid_shipment_idx ON bid(shipment_id, round);",
      "CREATE INDEX IF NOT EXISTS bid_driver_idx ON bid(driver_id);",
      "CREATE TABLE IF NOT EXISTS shipment_match (id TEXT PRIMARY KEY, shipment_id TEXT NOT NULL REFERENCES shipment(id), "
      "bid_id TEXT NOT NULL REFERENCES bid(id), driver_id TEXT NOT NULL, price REAL NOT NULL, round INTEGER NOT NULL, "
      "committed_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, execution_status INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS shipment_match_shipment_idx ON shipment_match(shipment_id);",
      "CREATE TABLE IF NOT EXISTS driver (id TEXT PRIMARY KEY, reputation REAL NOT NULL, completed_jobs INTEGER NOT NULL, "
      "on_time_jobs INTEGER NOT NULL, cancellations INTEGER NOT NULL, failures INTEGER NOT NULL, lat REAL NOT NULL, lon REAL NOT NULL, "
      "label TEXT, available INTEGER NOT NULL, capacity_kg REAL NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace freight::db::sqlite
