#include "shipment_ledger.hpp"

#include <cmath>
#include <string>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/outbound/event_dispatcher.hpp"
#include "internal/ranking/open_shipment_index.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace freight::ledger {

using freight::db::model::ShipmentEventRecord;
using freight::db::model::ShipmentRecord;
using freight::model::ShipmentStatus;
using freight::observability::StringField;

namespace {

void Validate(const ShipmentDraft& draft) {
  if (draft.shipper_id.empty()) {
    throw freight::util::ValidationError("create shipment: shipper_id is required");
  }
  if (!freight::model::IsValid(draft.origin) || !freight::model::IsValid(draft.destination)) {
    throw freight::util::ValidationError("create shipment: origin and destination must be valid coordinates");
  }
  if (!(draft.weight_kg > 0.0) || !std::isfinite(draft.weight_kg)) {
    throw freight::util::ValidationError("create shipment: weight_kg must be positive");
  }
  if (draft.pickup_start_ms > draft.pickup_end_ms) {
    throw freight::util::ValidationError("create shipment: pickup window ends before it starts");
  }
  if (draft.delivery_start_ms > draft.delivery_end_ms) {
    throw freight::util::ValidationError("create shipment: delivery window ends before it starts");
  }
  if (draft.delivery_end_ms < draft.pickup_start_ms) {
    throw freight::util::ValidationError("create shipment: delivery window closes before pickup can start");
  }
  if (draft.reserve_price && !(*draft.reserve_price > 0.0)) {
    throw freight::util::ValidationError("create shipment: reserve_price must be positive when set");
  }
}

} // namespace

ShipmentLedger::ShipmentLedger(std::shared_ptr<freight::db::Repository> repository, std::shared_ptr<freight::ranking::OpenShipmentIndex> index,
                               std::shared_ptr<freight::outbound::EventDispatcher> dispatcher, freight::util::ClockFn clock)
    : repository_(std::move(repository)), index_(std::move(index)), dispatcher_(std::move(dispatcher)), clock_(std::move(clock)) {
}

uint64_t ShipmentLedger::NowMs() const {
  return freight::util::ToUnixMillis(clock_());
}

ShipmentRecord ShipmentLedger::Create(const ShipmentDraft& draft) {
  Validate(draft);

  const auto now = NowMs();

  ShipmentRecord record;
  record.id                = freight::util::NewId("shp");
  record.shipper_id        = draft.shipper_id;
  record.origin            = draft.origin;
  record.destination       = draft.destination;
  record.weight_kg         = draft.weight_kg;
  record.cargo_type        = draft.cargo_type;
  record.description       = draft.description;
  record.pickup_start_ms   = draft.pickup_start_ms;
  record.pickup_end_ms     = draft.pickup_end_ms;
  record.delivery_start_ms = draft.delivery_start_ms;
  record.delivery_end_ms   = draft.delivery_end_ms;
  record.reserve_price     = draft.reserve_price;
  record.relist_on_no_bids = draft.relist_on_no_bids;
  record.status            = ShipmentStatus::kDraft;
  record.created_at_ms     = now;
  record.updated_at_ms     = now;
  record.version           = 1;

  ShipmentEventRecord event;
  event.shipment_id = record.id;
  event.from        = ShipmentStatus::kUnspecified;
  event.to          = ShipmentStatus::kDraft;
  event.reason      = "created";
  event.at_ms       = now;

  auto tx = repository_->Begin();
  freight::db::ThrowIfError(repository_->InsertShipment(*tx, record), "create shipment");
  freight::db::ThrowIfError(repository_->AppendShipmentEvent(*tx, event), "create shipment: append event");
  tx->Commit();

  FREIGHT_LOG_INFO("shipment created", {StringField("shipment_id", record.id), StringField("shipper_id", record.shipper_id)});
  return record;
}

std::optional<ShipmentRecord> ShipmentLedger::Find(const std::string& shipment_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetShipment(*tx, shipment_id);
  tx->Commit();
  return record;
}

ShipmentRecord ShipmentLedger::Get(const std::string& shipment_id) {
  auto record = Find(shipment_id);
  if (!record) {
    throw freight::util::NotFound("get shipment: shipment not found; verify shipment id");
  }
  return *record;
}

ShipmentRecord ShipmentLedger::Transition(const std::string& shipment_id, ShipmentStatus from, ShipmentStatus to, const std::string& reason) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetShipment(*tx, shipment_id);
  if (!record) {
    throw freight::util::NotFound("transition shipment: shipment not found; verify shipment id");
  }
  if (record->status != from) {
    throw freight::util::Conflict("transition shipment: expected status " + std::string(ToString(from)) + " but found " +
                                  std::string(ToString(record->status)) + "; refresh and retry");
  }

  auto change = Apply(*tx, *record, to, reason);
  tx->Commit();

  Announce(change);
  return change.shipment;
}

StatusChange ShipmentLedger::Apply(freight::db::Transaction& tx, ShipmentRecord& record, ShipmentStatus to, const std::string& reason) const {
  if (!freight::model::CanTransition(record.status, to)) {
    throw freight::util::InvalidState("shipment " + record.id + ": cannot move from " + std::string(ToString(record.status)) + " to " +
                                      std::string(ToString(to)));
  }

  const auto now  = NowMs();
  const auto from = record.status;

  record.status        = to;
  record.updated_at_ms = now;
  record.version++;
  freight::db::ThrowIfError(repository_->UpdateShipment(tx, record), "transition shipment");

  ShipmentEventRecord event;
  event.shipment_id = record.id;
  event.from        = from;
  event.to          = to;
  event.reason      = reason;
  event.at_ms       = now;
  freight::db::ThrowIfError(repository_->AppendShipmentEvent(tx, event), "transition shipment: append event");

  return {record, from, reason};
}

void ShipmentLedger::Save(freight::db::Transaction& tx, ShipmentRecord& record) const {
  record.updated_at_ms = NowMs();
  record.version++;
  freight::db::ThrowIfError(repository_->UpdateShipment(tx, record), "save shipment");
}

void ShipmentLedger::Announce(const StatusChange& change) {
  index_->Apply(change.shipment);

  FREIGHT_LOG_INFO("shipment status changed", {StringField("shipment_id", change.shipment.id), StringField("from", ToString(change.from)),
                                               StringField("to", ToString(change.shipment.status)), StringField("reason", change.reason)});

  if (!dispatcher_) return;

  freight::outbound::Notification notification;
  notification.kind         = freight::outbound::NotificationKind::kShipmentStatusChanged;
  notification.recipient_id = change.shipment.shipper_id;
  notification.shipment_id  = change.shipment.id;
  notification.detail       = std::string(ToString(change.from)) + "->" + std::string(ToString(change.shipment.status)) + ": " + change.reason;
  notification.at_ms        = change.shipment.updated_at_ms;
  dispatcher_->Publish(std::move(notification));
}

void ShipmentLedger::Announce(const std::vector<StatusChange>& changes) {
  for (const auto& change : changes) {
    Announce(change);
  }
}

std::vector<ShipmentEventRecord> ShipmentLedger::Events(const std::string& shipment_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetShipment(*tx, shipment_id)) {
    throw freight::util::NotFound("shipment events: shipment not found; verify shipment id");
  }
  auto events = repository_->ListShipmentEvents(*tx, shipment_id);
  tx->Commit();
  return events;
}

std::vector<ShipmentRecord> ShipmentLedger::List(const freight::db::ShipmentFilter& filter) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListShipments(*tx, filter);
  tx->Commit();
  return records;
}

std::size_t ShipmentLedger::RebuildIndex() {
  freight::db::ShipmentFilter filter;
  filter.statuses = {ShipmentStatus::kOpen, ShipmentStatus::kBidding};

  const auto listed = List(filter);
  for (const auto& record : listed) {
    index_->Apply(record);
  }
  return listed.size();
}

} // namespace freight::ledger
