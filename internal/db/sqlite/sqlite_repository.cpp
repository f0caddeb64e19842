#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

namespace freight::db::sqlite {

using freight::db::ErrorCode;
using freight::db::Result;
using freight::model::AuctionState;
using freight::model::BidStatus;
using freight::model::ExecutionStatus;
using freight::model::GeoPoint;
using freight::model::ShipmentStatus;

namespace {

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) st = nullptr;
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st != nullptr;
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

// Binds lat, lon, label at idx, idx+1, idx+2.
void BindPoint(sqlite3_stmt* st, int idx, const GeoPoint& p) {
  BindDouble(st, idx, p.latitude);
  BindDouble(st, idx + 1, p.longitude);
  BindText(st, idx + 2, p.label);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

GeoPoint ColPoint(sqlite3_stmt* st, int col) {
  GeoPoint p;
  p.latitude  = ColDouble(st, col);
  p.longitude = ColDouble(st, col + 1);
  p.label     = ColText(st, col + 2);
  return p;
}

constexpr const char* kShipmentColumns =
    "id,shipper_id,origin_lat,origin_lon,origin_label,dest_lat,dest_lon,dest_label,weight_kg,cargo_type,description,"
    "pickup_start_ms,pickup_end_ms,delivery_start_ms,delivery_end_ms,reserve_price,relist_on_no_bids,status,auction_round,"
    "created_at_ms,updated_at_ms,version";

model::ShipmentRecord ReadShipment(sqlite3_stmt* st) {
  model::ShipmentRecord r;
  r.id                = ColText(st, 0);
  r.shipper_id        = ColText(st, 1);
  r.origin            = ColPoint(st, 2);
  r.destination       = ColPoint(st, 5);
  r.weight_kg         = ColDouble(st, 8);
  r.cargo_type        = ColText(st, 9);
  r.description       = ColText(st, 10);
  r.pickup_start_ms   = ColU64(st, 11);
  r.pickup_end_ms     = ColU64(st, 12);
  r.delivery_start_ms = ColU64(st, 13);
  r.delivery_end_ms   = ColU64(st, 14);
  if (sqlite3_column_type(st, 15) != SQLITE_NULL) r.reserve_price = ColDouble(st, 15);
  r.relist_on_no_bids = ColI32(st, 16) != 0;
  r.status            = static_cast<ShipmentStatus>(ColI32(st, 17));
  r.auction_round     = static_cast<uint32_t>(ColU64(st, 18));
  r.created_at_ms     = ColU64(st, 19);
  r.updated_at_ms     = ColU64(st, 20);
  r.version           = ColU64(st, 21);
  return r;
}

// Binds every mutable shipment column starting at idx; returns next index.
int BindShipmentBody(sqlite3_stmt* st, int idx, const model::ShipmentRecord& r) {
  BindText(st, idx++, r.shipper_id);
  BindPoint(st, idx, r.origin);
  idx += 3;
  BindPoint(st, idx, r.destination);
  idx += 3;
  BindDouble(st, idx++, r.weight_kg);
  BindText(st, idx++, r.cargo_type);
  BindText(st, idx++, r.description);
  BindU64(st, idx++, r.pickup_start_ms);
  BindU64(st, idx++, r.pickup_end_ms);
  BindU64(st, idx++, r.delivery_start_ms);
  BindU64(st, idx++, r.delivery_end_ms);
  if (r.reserve_price) {
    BindDouble(st, idx++, *r.reserve_price);
  } else {
    sqlite3_bind_null(st, idx++);
  }
  BindI32(st, idx++, r.relist_on_no_bids ? 1 : 0);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindU64(st, idx++, r.auction_round);
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.updated_at_ms);
  BindU64(st, idx++, r.version);
  return idx;
}

constexpr const char* kWindowColumns = "shipment_id,round,state,opens_at_ms,closes_at_ms,bid_limit,closed,match_id,version";

model::AuctionWindowRecord ReadWindow(sqlite3_stmt* st) {
  model::AuctionWindowRecord r;
  r.shipment_id  = ColText(st, 0);
  r.round        = static_cast<uint32_t>(ColU64(st, 1));
  r.state        = static_cast<AuctionState>(ColI32(st, 2));
  r.opens_at_ms  = ColU64(st, 3);
  r.closes_at_ms = ColU64(st, 4);
  r.bid_limit    = static_cast<uint32_t>(ColU64(st, 5));
  r.closed       = ColI32(st, 6) != 0;
  r.match_id     = ColText(st, 7);
  r.version      = ColU64(st, 8);
  return r;
}

constexpr const char* kBidColumns =
    "id,shipment_id,round,driver_id,price,submitted_at_ms,driver_lat,driver_lon,driver_label,eta_minutes,message,status,version";

model::BidRecord ReadBid(sqlite3_stmt* st) {
  model::BidRecord r;
  r.id              = ColText(st, 0);
  r.shipment_id     = ColText(st, 1);
  r.round           = static_cast<uint32_t>(ColU64(st, 2));
  r.driver_id       = ColText(st, 3);
  r.price           = ColDouble(st, 4);
  r.submitted_at_ms = ColU64(st, 5);
  r.driver_location = ColPoint(st, 6);
  r.eta_minutes     = ColDouble(st, 9);
  r.message         = ColText(st, 10);
  r.status          = static_cast<BidStatus>(ColI32(st, 11));
  r.version         = ColU64(st, 12);
  return r;
}

constexpr const char* kMatchColumns = "id,shipment_id,bid_id,driver_id,price,round,committed_at_ms,updated_at_ms,execution_status,version";

model::MatchRecord ReadMatch(sqlite3_stmt* st) {
  model::MatchRecord r;
  r.id               = ColText(st, 0);
  r.shipment_id      = ColText(st, 1);
  r.bid_id           = ColText(st, 2);
  r.driver_id        = ColText(st, 3);
  r.price            = ColDouble(st, 4);
  r.round            = static_cast<uint32_t>(ColU64(st, 5));
  r.committed_at_ms  = ColU64(st, 6);
  r.updated_at_ms    = ColU64(st, 7);
  r.execution_status = static_cast<ExecutionStatus>(ColI32(st, 8));
  r.version          = ColU64(st, 9);
  return r;
}

constexpr const char* kDriverColumns =
    "id,reputation,completed_jobs,on_time_jobs,cancellations,failures,lat,lon,label,available,capacity_kg,updated_at_ms,version";

model::DriverRecord ReadDriver(sqlite3_stmt* st) {
  model::DriverRecord r;
  r.id             = ColText(st, 0);
  r.reputation     = ColDouble(st, 1);
  r.completed_jobs = ColU64(st, 2);
  r.on_time_jobs   = ColU64(st, 3);
  r.cancellations  = ColU64(st, 4);
  r.failures       = ColU64(st, 5);
  r.location       = ColPoint(st, 6);
  r.available      = ColI32(st, 9) != 0;
  r.capacity_kg    = ColDouble(st, 10);
  r.updated_at_ms  = ColU64(st, 11);
  r.version        = ColU64(st, 12);
  return r;
}

template <typename Reader>
auto CollectRows(sqlite3_stmt* st, Reader&& reader) {
  std::vector<decltype(reader(st))> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(reader(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::CheckCas(sqlite3* db, int rc, const char* exists_sql, const std::string& key) {
    auto result = Translate(db, rc);
    if (!result) return result;
    if (sqlite3_changes(db) > 0) return Result::Ok();

    Statement exists(db, exists_sql);
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(exists.st, 1, key);
    if (sqlite3_step(exists.st) == SQLITE_ROW)
        return Result::Err(ErrorCode::Conflict, "version mismatch for " + key);
    return Result::Err(ErrorCode::NotFound, key);
}

// ------------------------------------------------------------------
// Shipments
// ------------------------------------------------------------------

Result SqliteRepository::InsertShipment(Transaction& t, const model::ShipmentRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO shipment(") + kShipmentColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.id);
    BindShipmentBody(st.st, 2, r);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::ShipmentRecord> SqliteRepository::GetShipment(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kShipmentColumns + " FROM shipment WHERE id=?;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.st, 1, id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
    return ReadShipment(st.st);
}

std::vector<model::ShipmentRecord> SqliteRepository::ListShipments(Transaction& t, const ShipmentFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kShipmentColumns + " FROM shipment WHERE 1=1";
    if (filter.shipper_id) sql += " AND shipper_id=?";
    if (!filter.statuses.empty()) {
        sql += " AND status IN (";
        for (size_t i = 0; i < filter.statuses.size(); ++i) sql += i == 0 ? "?" : ",?";
        sql += ")";
    }
    sql += " ORDER BY created_at_ms DESC, id ASC;";

    Statement st(db, sql.c_str());
    if (!st) return {};

    int idx = 1;
    if (filter.shipper_id) BindText(st.st, idx++, *filter.shipper_id);
    for (auto status : filter.statuses) BindI32(st.st, idx++, static_cast<int>(status));

    return CollectRows(st.st, ReadShipment);
}

Result SqliteRepository::UpdateShipment(Transaction& t, const model::ShipmentRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE shipment SET shipper_id=?,origin_lat=?,origin_lon=?,origin_label=?,dest_lat=?,dest_lon=?,dest_label=?,weight_kg=?,"
        "cargo_type=?,description=?,pickup_start_ms=?,pickup_end_ms=?,delivery_start_ms=?,delivery_end_ms=?,reserve_price=?,"
        "relist_on_no_bids=?,status=?,auction_round=?,created_at_ms=?,updated_at_ms=?,version=? WHERE id=? AND version=?;";
    Statement st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int idx = BindShipmentBody(st.st, 1, r);
    BindText(st.st, idx++, r.id);
    BindU64(st.st, idx, r.version - 1);

    return CheckCas(db, sqlite3_step(st.st), "SELECT 1 FROM shipment WHERE id=?;", r.id);
}

Result SqliteRepository::AppendShipmentEvent(Transaction& t, model::ShipmentEventRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement next(db, "SELECT COALESCE(MAX(sequence),0)+1 FROM shipment_event WHERE shipment_id=?;");
        if (!next) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindText(next.st, 1, r.shipment_id);
        if (sqlite3_step(next.st) != SQLITE_ROW) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        r.sequence = ColU64(next.st, 0);
    }

    Statement st(db, "INSERT INTO shipment_event(shipment_id,sequence,from_status,to_status,reason,at_ms) VALUES(?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.shipment_id);
    BindU64(st.st, 2, r.sequence);
    BindI32(st.st, 3, static_cast<int>(r.from));
    BindI32(st.st, 4, static_cast<int>(r.to));
    BindText(st.st, 5, r.reason);
    BindU64(st.st, 6, r.at_ms);

    return Translate(db, sqlite3_step(st.st));
}

std::vector<model::ShipmentEventRecord> SqliteRepository::ListShipmentEvents(Transaction& t, const std::string& shipment_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT shipment_id,sequence,from_status,to_status,reason,at_ms FROM shipment_event WHERE shipment_id=? ORDER BY sequence;");
    if (!st) return {};
    BindText(st.st, 1, shipment_id);

    return CollectRows(st.st, [](sqlite3_stmt* row) {
        model::ShipmentEventRecord r;
        r.shipment_id = ColText(row, 0);
        r.sequence    = ColU64(row, 1);
        r.from        = static_cast<ShipmentStatus>(ColI32(row, 2));
        r.to          = static_cast<ShipmentStatus>(ColI32(row, 3));
        r.reason      = ColText(row, 4);
        r.at_ms       = ColU64(row, 5);
        return r;
    });
}

// ------------------------------------------------------------------
// Auction windows
// ------------------------------------------------------------------

Result SqliteRepository::InsertAuctionWindow(Transaction& t, const model::AuctionWindowRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO auction_window(") + kWindowColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.shipment_id);
    BindU64(st.st, 2, r.round);
    BindI32(st.st, 3, static_cast<int>(r.state));
    BindU64(st.st, 4, r.opens_at_ms);
    BindU64(st.st, 5, r.closes_at_ms);
    BindU64(st.st, 6, r.bid_limit);
    BindI32(st.st, 7, r.closed ? 1 : 0);
    BindText(st.st, 8, r.match_id);
    BindU64(st.st, 9, r.version);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::AuctionWindowRecord> SqliteRepository::GetAuctionWindow(Transaction& t, const std::string& shipment_id, uint32_t round) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kWindowColumns + " FROM auction_window WHERE shipment_id=? AND round=?;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.st, 1, shipment_id);
    BindU64(st.st, 2, round);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
    return ReadWindow(st.st);
}

std::vector<model::AuctionWindowRecord> SqliteRepository::ListAuctionWindows(Transaction& t, AuctionState state) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kWindowColumns + " FROM auction_window WHERE state=? ORDER BY shipment_id, round;";
    Statement st(db, sql.c_str());
    if (!st) return {};
    BindI32(st.st, 1, static_cast<int>(state));

    return CollectRows(st.st, ReadWindow);
}

Result SqliteRepository::UpdateAuctionWindow(Transaction& t, const model::AuctionWindowRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE auction_window SET state=?,opens_at_ms=?,closes_at_ms=?,bid_limit=?,closed=?,match_id=?,version=? "
        "WHERE shipment_id=? AND round=? AND version=?;";
    Statement st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.st, 1, static_cast<int>(r.state));
    BindU64(st.st, 2, r.opens_at_ms);
    BindU64(st.st, 3, r.closes_at_ms);
    BindU64(st.st, 4, r.bid_limit);
    BindI32(st.st, 5, r.closed ? 1 : 0);
    BindText(st.st, 6, r.match_id);
    BindU64(st.st, 7, r.version);
    BindText(st.st, 8, r.shipment_id);
    BindU64(st.st, 9, r.round);
    BindU64(st.st, 10, r.version - 1);

    auto result = Translate(db, sqlite3_step(st.st));
    if (!result) return result;
    if (sqlite3_changes(db) > 0) return Result::Ok();
    return GetAuctionWindow(t, r.shipment_id, r.round).has_value() ? Result::Err(ErrorCode::Conflict, "auction window version mismatch")
                                                                   : Result::Err(ErrorCode::NotFound, r.shipment_id);
}

// ------------------------------------------------------------------
// Bids
// ------------------------------------------------------------------

Result SqliteRepository::InsertBid(Transaction& t, const model::BidRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO bid(") + kBidColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.id);
    BindText(st.st, 2, r.shipment_id);
    BindU64(st.st, 3, r.round);
    BindText(st.st, 4, r.driver_id);
    BindDouble(st.st, 5, r.price);
    BindU64(st.st, 6, r.submitted_at_ms);
    BindPoint(st.st, 7, r.driver_location);
    BindDouble(st.st, 10, r.eta_minutes);
    BindText(st.st, 11, r.message);
    BindI32(st.st, 12, static_cast<int>(r.status));
    BindU64(st.st, 13, r.version);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::BidRecord> SqliteRepository::GetBid(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kBidColumns + " FROM bid WHERE id=?;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.st, 1, id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
    return ReadBid(st.st);
}

std::vector<model::BidRecord> SqliteRepository::ListBids(Transaction& t, const BidFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kBidColumns + " FROM bid WHERE 1=1";
    if (filter.shipment_id) sql += " AND shipment_id=?";
    if (filter.driver_id) sql += " AND driver_id=?";
    if (filter.round) sql += " AND round=?";
    if (filter.status) sql += " AND status=?";
    sql += " ORDER BY submitted_at_ms ASC, id ASC;";

    Statement st(db, sql.c_str());
    if (!st) return {};

    int idx = 1;
    if (filter.shipment_id) BindText(st.st, idx++, *filter.shipment_id);
    if (filter.driver_id) BindText(st.st, idx++, *filter.driver_id);
    if (filter.round) BindU64(st.st, idx++, *filter.round);
    if (filter.status) BindI32(st.st, idx++, static_cast<int>(*filter.status));

    return CollectRows(st.st, ReadBid);
}

Result SqliteRepository::UpdateBid(Transaction& t, const model::BidRecord& r) {
    auto* db = TX(t).Handle();

    // Only status moves after submission.
    Statement st(db, "UPDATE bid SET status=?,version=? WHERE id=? AND version=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.st, 1, static_cast<int>(r.status));
    BindU64(st.st, 2, r.version);
    BindText(st.st, 3, r.id);
    BindU64(st.st, 4, r.version - 1);

    return CheckCas(db, sqlite3_step(st.st), "SELECT 1 FROM bid WHERE id=?;", r.id);
}

// ------------------------------------------------------------------
// Matches
// ------------------------------------------------------------------

Result SqliteRepository::InsertMatch(Transaction& t, const model::MatchRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO shipment_match(") + kMatchColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.id);
    BindText(st.st, 2, r.shipment_id);
    BindText(st.st, 3, r.bid_id);
    BindText(st.st, 4, r.driver_id);
    BindDouble(st.st, 5, r.price);
    BindU64(st.st, 6, r.round);
    BindU64(st.st, 7, r.committed_at_ms);
    BindU64(st.st, 8, r.updated_at_ms);
    BindI32(st.st, 9, static_cast<int>(r.execution_status));
    BindU64(st.st, 10, r.version);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::MatchRecord> SqliteRepository::GetMatch(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kMatchColumns + " FROM shipment_match WHERE id=?;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.st, 1, id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
    return ReadMatch(st.st);
}

std::vector<model::MatchRecord> SqliteRepository::ListMatches(Transaction& t, const MatchFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kMatchColumns + " FROM shipment_match WHERE 1=1";
    if (filter.shipment_id) sql += " AND shipment_id=?";
    if (filter.driver_id) sql += " AND driver_id=?";
    if (filter.execution_status) sql += " AND execution_status=?";
    sql += " ORDER BY committed_at_ms ASC, id ASC;";

    Statement st(db, sql.c_str());
    if (!st) return {};

    int idx = 1;
    if (filter.shipment_id) BindText(st.st, idx++, *filter.shipment_id);
    if (filter.driver_id) BindText(st.st, idx++, *filter.driver_id);
    if (filter.execution_status) BindI32(st.st, idx++, static_cast<int>(*filter.execution_status));

    return CollectRows(st.st, ReadMatch);
}

Result SqliteRepository::UpdateMatch(Transaction& t, const model::MatchRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE shipment_match SET execution_status=?,updated_at_ms=?,version=? WHERE id=? AND version=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.st, 1, static_cast<int>(r.execution_status));
    BindU64(st.st, 2, r.updated_at_ms);
    BindU64(st.st, 3, r.version);
    BindText(st.st, 4, r.id);
    BindU64(st.st, 5, r.version - 1);

    return CheckCas(db, sqlite3_step(st.st), "SELECT 1 FROM shipment_match WHERE id=?;", r.id);
}

// ------------------------------------------------------------------
// Drivers
// ------------------------------------------------------------------

Result SqliteRepository::InsertDriver(Transaction& t, const model::DriverRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO driver(") + kDriverColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db, sql.c_str());
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.id);
    BindDouble(st.st, 2, r.reputation);
    BindU64(st.st, 3, r.completed_jobs);
    BindU64(st.st, 4, r.on_time_jobs);
    BindU64(st.st, 5, r.cancellations);
    BindU64(st.st, 6, r.failures);
    BindPoint(st.st, 7, r.location);
    BindI32(st.st, 10, r.available ? 1 : 0);
    BindDouble(st.st, 11, r.capacity_kg);
    BindU64(st.st, 12, r.updated_at_ms);
    BindU64(st.st, 13, r.version);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::DriverRecord> SqliteRepository::GetDriver(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDriverColumns + " FROM driver WHERE id=?;";
    Statement st(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.st, 1, id);
    if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
    return ReadDriver(st.st);
}

std::vector<model::DriverRecord> SqliteRepository::ListDrivers(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kDriverColumns + " FROM driver ORDER BY id;";
    Statement st(db, sql.c_str());
    if (!st) return {};

    return CollectRows(st.st, ReadDriver);
}

Result SqliteRepository::UpdateDriver(Transaction& t, const model::DriverRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE driver SET reputation=?,completed_jobs=?,on_time_jobs=?,cancellations=?,failures=?,lat=?,lon=?,label=?,available=?,"
        "capacity_kg=?,updated_at_ms=?,version=? WHERE id=? AND version=?;";
    Statement st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st.st, 1, r.reputation);
    BindU64(st.st, 2, r.completed_jobs);
    BindU64(st.st, 3, r.on_time_jobs);
    BindU64(st.st, 4, r.cancellations);
    BindU64(st.st, 5, r.failures);
    BindPoint(st.st, 6, r.location);
    BindI32(st.st, 9, r.available ? 1 : 0);
    BindDouble(st.st, 10, r.capacity_kg);
    BindU64(st.st, 11, r.updated_at_ms);
    BindU64(st.st, 12, r.version);
    BindText(st.st, 13, r.id);
    BindU64(st.st, 14, r.version - 1);

    return CheckCas(db, sqlite3_step(st.st), "SELECT 1 FROM driver WHERE id=?;", r.id);
}

} // namespace freight::db::sqlite
