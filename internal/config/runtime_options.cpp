#include "runtime_options.hpp"

namespace freight::config {

namespace {

template <typename T>
void Override(T& target, T value) {
  if (value > T{}) {
    target = value;
  }
}

} // namespace

freight::auction::AuctionOptions AuctionOptionsFrom(const freight::runtime::config::RuntimeConfig& config) {
  freight::auction::AuctionOptions options;
  if (!config.has_auction()) {
    return options;
  }

  const auto& auction = config.auction();
  if (auction.has_default_duration_ms()) {
    options.default_duration_ms = auction.default_duration_ms();
  }
  options.min_price_floor     = auction.min_price_floor();
  options.max_bids_per_window = auction.max_bids_per_window();
  Override(options.timer_tick_ms, auction.timer_tick_ms());
  return options;
}

freight::ranking::RankingWeights RankingWeightsFrom(const freight::runtime::config::RuntimeConfig& config) {
  freight::ranking::RankingWeights weights;
  if (!config.has_ranking()) {
    return weights;
  }

  const auto& ranking = config.ranking();
  // Weights are replaced as a set; a partial block would silently skew the sum.
  if (ranking.price_weight() > 0 || ranking.reputation_weight() > 0 || ranking.proximity_weight() > 0 || ranking.backhaul_weight() > 0) {
    weights.price      = ranking.price_weight();
    weights.reputation = ranking.reputation_weight();
    weights.proximity  = ranking.proximity_weight();
    weights.backhaul   = ranking.backhaul_weight();
  }
  Override(weights.eta_half_life_minutes, ranking.eta_half_life_minutes());
  return weights;
}

freight::ranking::BackhaulOptions BackhaulOptionsFrom(const freight::runtime::config::RuntimeConfig& config) {
  freight::ranking::BackhaulOptions options;
  const auto&                       backhaul = config.backhaul();
  Override(options.radius_km, backhaul.radius_km());
  Override(options.max_results, static_cast<std::size_t>(backhaul.max_results()));
  Override(options.grid_cell_degrees, backhaul.grid_cell_degrees());
  return options;
}

freight::reputation::ReputationOptions ReputationOptionsFrom(const freight::runtime::config::RuntimeConfig& config) {
  freight::reputation::ReputationOptions options;
  const auto&                            reputation = config.reputation();
  Override(options.neutral_default, reputation.neutral_default());
  Override(options.completion_gain, reputation.completion_gain());
  Override(options.late_target, reputation.late_target());
  Override(options.late_gain, reputation.late_gain());
  Override(options.pre_match_penalty, reputation.pre_match_penalty());
  Override(options.post_match_penalty, reputation.post_match_penalty());
  Override(options.post_pickup_penalty, reputation.post_pickup_penalty());
  return options;
}

freight::dispatch::DispatchOptions DispatchOptionsFrom(const freight::runtime::config::RuntimeConfig& config) {
  freight::dispatch::DispatchOptions options;
  const auto&                        dispatch = config.dispatch();
  Override(options.no_show_grace_ms, dispatch.no_show_grace_ms());
  Override(options.sweep_interval_ms, dispatch.sweep_interval_ms());
  return options;
}

} // namespace freight::config
