#pragma once

#include <functional>
#include <optional>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/time.hpp"

namespace freight::reputation {

struct ReputationOptions {
  double neutral_default = 0.5;

  // On-time completion: s += completion_gain * (1 - s)
  double completion_gain = 0.10;

  // Late completion: s += late_gain * (late_target - s)
  double late_target = 0.40;
  double late_gain   = 0.05;

  // Cancellation: s *= (1 - penalty[stage])
  double pre_match_penalty   = 0.02;
  double post_match_penalty  = 0.10;
  double post_pickup_penalty = 0.25;
};

/*
  Bounded per-driver trust score in [0,1].

  All driver-profile writes go through MutateDriver(), which serializes on
  the driver's own mutex and never on a global one. Each call opens its own
  transaction, so it must not be invoked while the caller holds another
  repository transaction on the same thread.
*/
class ReputationScorer {
 public:
  using Mutation = std::function<void(freight::db::model::DriverRecord&)>;

  ReputationScorer(std::shared_ptr<freight::db::Repository> repository, ReputationOptions options,
                   freight::util::ClockFn clock = freight::util::Now);

  // Neutral default for unknown drivers.
  double Score(const std::string& driver_id);

  double RecordCompletion(const std::string& driver_id, bool on_time);
  double RecordCancellation(const std::string& driver_id, freight::model::CancellationStage stage);

  // Post-pickup failure: PostPickup penalty plus the failure counter.
  double RecordFailure(const std::string& driver_id);

  // Creates the profile with the neutral default when missing.
  freight::db::model::DriverRecord EnsureDriver(const std::string& driver_id);

  freight::db::model::DriverRecord MutateDriver(const std::string& driver_id, const Mutation& mutate);

  std::optional<freight::db::model::DriverRecord> FindDriver(const std::string& driver_id);

  double ApplyCompletion(double score, bool on_time) const;
  double ApplyCancellation(double score, freight::model::CancellationStage stage) const;
  double Penalty(freight::model::CancellationStage stage) const;

  const ReputationOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<freight::db::Repository> repository_;
  ReputationOptions                        options_;
  freight::util::ClockFn                   clock_;
  freight::util::KeyedMutex                driver_locks_;
};

} // namespace freight::reputation
