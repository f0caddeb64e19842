#pragma once

#include <google/protobuf/timestamp.pb.h>

#include "exchange_fixture.hpp"
#include "internal/service/service_context.hpp"

namespace freight::testing {

inline freight::service::ServiceContext ContextFor(Exchange& ex) {
  freight::service::ServiceContext ctx;
  ctx.repository  = ex.repository;
  ctx.ledger      = ex.ledger;
  ctx.coordinator = ex.coordinator;
  ctx.intake      = ex.intake;
  ctx.dispatch    = ex.dispatch;
  ctx.scorer      = ex.scorer;
  ctx.backhaul    = ex.backhaul;
  return ctx;
}

inline google::protobuf::Timestamp TimestampAt(uint64_t ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

} // namespace freight::testing
