#pragma once

#include "config/config.pb.h"

#include "internal/auction/auction_coordinator.hpp"
#include "internal/dispatch/dispatch_tracker.hpp"
#include "internal/ranking/backhaul_matcher.hpp"
#include "internal/ranking/bid_ranker.hpp"
#include "internal/reputation/reputation_scorer.hpp"

namespace freight::config {

/*
  Config -> component options.

  proto3 scalars cannot distinguish "unset" from zero, so a zero (or
  negative) tunable keeps the built-in default. The auction duration is
  an explicit optional because zero means "close by hand only"; the bid
  limit and price floor are taken as-is.
*/

freight::auction::AuctionOptions       AuctionOptionsFrom(const freight::runtime::config::RuntimeConfig& config);
freight::ranking::RankingWeights       RankingWeightsFrom(const freight::runtime::config::RuntimeConfig& config);
freight::ranking::BackhaulOptions      BackhaulOptionsFrom(const freight::runtime::config::RuntimeConfig& config);
freight::reputation::ReputationOptions ReputationOptionsFrom(const freight::runtime::config::RuntimeConfig& config);
freight::dispatch::DispatchOptions     DispatchOptionsFrom(const freight::runtime::config::RuntimeConfig& config);

} // namespace freight::config
