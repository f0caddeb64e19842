#include "reputation_scorer.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace freight::reputation {

using freight::db::model::DriverRecord;
using freight::model::CancellationStage;
using freight::observability::DoubleField;
using freight::observability::StringField;

namespace {

double Bound(double score) {
  return std::clamp(score, 0.0, 1.0);
}

void CheckFraction(double value, const char* name) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw std::invalid_argument(std::string("reputation options: ") + name + " must be within [0,1]");
  }
}

} // namespace

ReputationScorer::ReputationScorer(std::shared_ptr<freight::db::Repository> repository, ReputationOptions options, freight::util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
  CheckFraction(options_.neutral_default, "neutral_default");
  CheckFraction(options_.completion_gain, "completion_gain");
  CheckFraction(options_.late_target, "late_target");
  CheckFraction(options_.late_gain, "late_gain");
  CheckFraction(options_.pre_match_penalty, "pre_match_penalty");
  CheckFraction(options_.post_match_penalty, "post_match_penalty");
  CheckFraction(options_.post_pickup_penalty, "post_pickup_penalty");
  if (options_.late_gain > options_.completion_gain) {
    throw std::invalid_argument("reputation options: late_gain must not exceed completion_gain");
  }
  if (!(options_.pre_match_penalty <= options_.post_match_penalty && options_.post_match_penalty <= options_.post_pickup_penalty)) {
    throw std::invalid_argument("reputation options: penalties must not decrease by stage");
  }
}

double ReputationScorer::ApplyCompletion(double score, bool on_time) const {
  if (on_time) {
    return Bound(score + options_.completion_gain * (1.0 - score));
  }
  return Bound(score + options_.late_gain * (options_.late_target - score));
}

double ReputationScorer::Penalty(CancellationStage stage) const {
  switch (stage) {
    case CancellationStage::kPreMatch:
      return options_.pre_match_penalty;
    case CancellationStage::kPostMatch:
      return options_.post_match_penalty;
    case CancellationStage::kPostPickup:
      return options_.post_pickup_penalty;
  }
  return options_.post_pickup_penalty;
}

double ReputationScorer::ApplyCancellation(double score, CancellationStage stage) const {
  return Bound(score * (1.0 - Penalty(stage)));
}

std::optional<DriverRecord> ReputationScorer::FindDriver(const std::string& driver_id) {
  auto tx     = repository_->Begin();
  auto driver = repository_->GetDriver(*tx, driver_id);
  tx->Commit();
  return driver;
}

double ReputationScorer::Score(const std::string& driver_id) {
  auto driver = FindDriver(driver_id);
  return driver ? driver->reputation : options_.neutral_default;
}

DriverRecord ReputationScorer::EnsureDriver(const std::string& driver_id) {
  return MutateDriver(driver_id, [](DriverRecord&) {});
}

DriverRecord ReputationScorer::MutateDriver(const std::string& driver_id, const Mutation& mutate) {
  if (driver_id.empty()) {
    throw freight::util::ValidationError("driver profile: driver_id is required");
  }

  freight::util::KeyedLock lock(driver_locks_, driver_id);

  const auto now = freight::util::ToUnixMillis(clock_());

  auto tx       = repository_->Begin();
  auto existing = repository_->GetDriver(*tx, driver_id);

  DriverRecord driver;
  if (existing) {
    driver = *existing;
  } else {
    driver.id            = driver_id;
    driver.reputation    = options_.neutral_default;
    driver.updated_at_ms = now;
    driver.version       = 1;
  }

  const auto before = driver;
  mutate(driver);
  driver.id         = driver_id;
  driver.reputation = Bound(driver.reputation);

  if (!existing) {
    freight::db::ThrowIfError(repository_->InsertDriver(*tx, driver), "create driver profile");
  } else if (driver.reputation != before.reputation || driver.completed_jobs != before.completed_jobs ||
             driver.on_time_jobs != before.on_time_jobs || driver.cancellations != before.cancellations || driver.failures != before.failures ||
             driver.available != before.available || driver.capacity_kg != before.capacity_kg ||
             driver.location.latitude != before.location.latitude || driver.location.longitude != before.location.longitude ||
             driver.location.label != before.location.label) {
    driver.updated_at_ms = now;
    driver.version       = before.version + 1;
    freight::db::ThrowIfError(repository_->UpdateDriver(*tx, driver), "update driver profile");
  }
  tx->Commit();
  return driver;
}

double ReputationScorer::RecordCompletion(const std::string& driver_id, bool on_time) {
  auto driver = MutateDriver(driver_id, [&](DriverRecord& d) {
    d.reputation = ApplyCompletion(d.reputation, on_time);
    d.completed_jobs++;
    if (on_time) d.on_time_jobs++;
  });

  FREIGHT_LOG_INFO("reputation: completion", {StringField("driver_id", driver_id), freight::observability::BoolField("on_time", on_time),
                                              DoubleField("score", driver.reputation)});
  return driver.reputation;
}

double ReputationScorer::RecordCancellation(const std::string& driver_id, CancellationStage stage) {
  auto driver = MutateDriver(driver_id, [&](DriverRecord& d) {
    d.reputation = ApplyCancellation(d.reputation, stage);
    d.cancellations++;
  });

  FREIGHT_LOG_INFO("reputation: cancellation",
                   {StringField("driver_id", driver_id), StringField("stage", ToString(stage)), DoubleField("score", driver.reputation)});
  return driver.reputation;
}

double ReputationScorer::RecordFailure(const std::string& driver_id) {
  auto driver = MutateDriver(driver_id, [&](DriverRecord& d) {
    d.reputation = ApplyCancellation(d.reputation, CancellationStage::kPostPickup);
    d.failures++;
  });

  FREIGHT_LOG_WARN("reputation: failure", {StringField("driver_id", driver_id), DoubleField("score", driver.reputation)});
  return driver.reputation;
}

} // namespace freight::reputation
