#include "bid_ranker.hpp"

#include <algorithm>
#include <cmath>

namespace freight::ranking {

BidRanker::BidRanker(RankingWeights weights) : weights_(weights) {
}

double BidRanker::PriceScore(double price, double reference_price) {
  if (!(reference_price > 0.0)) {
    return 0.0;
  }
  return std::clamp(1.0 - price / (2.0 * reference_price), 0.0, 1.0);
}

double BidRanker::ProximityScore(double eta_minutes) const {
  const double half_life = weights_.eta_half_life_minutes > 0.0 ? weights_.eta_half_life_minutes : 60.0;
  return 1.0 / (1.0 + std::max(0.0, eta_minutes) / half_life);
}

double BidRanker::ReferencePrice(const std::optional<double>& reserve_price, const std::vector<BidCandidate>& candidates) {
  if (reserve_price && *reserve_price > 0.0) {
    return *reserve_price;
  }
  if (candidates.empty()) {
    return 0.0;
  }

  double sum = 0.0;
  for (const auto& candidate : candidates) {
    sum += candidate.bid.price;
  }
  return sum / static_cast<double>(candidates.size());
}

ScoredBid BidRanker::Score(const BidCandidate& candidate, double reference_price) const {
  ScoredBid scored;
  scored.bid             = candidate.bid;
  scored.price_score     = PriceScore(candidate.bid.price, reference_price);
  scored.reputation      = std::clamp(candidate.reputation, 0.0, 1.0);
  scored.proximity_score = ProximityScore(candidate.bid.eta_minutes);
  scored.backhaul_bonus  = std::clamp(candidate.backhaul_bonus, 0.0, 1.0);

  scored.score = weights_.price * scored.price_score + weights_.reputation * scored.reputation + weights_.proximity * scored.proximity_score +
                 weights_.backhaul * scored.backhaul_bonus;
  return scored;
}

bool BidRanker::RanksBefore(const ScoredBid& a, const ScoredBid& b) {
  // Compare on a 1e-9 grid; a raw epsilon test is not transitive and would break std::sort.
  const auto a_key = std::llround(a.score / kTieEpsilon);
  const auto b_key = std::llround(b.score / kTieEpsilon);
  if (a_key != b_key) {
    return a_key > b_key;
  }
  if (a.bid.submitted_at_ms != b.bid.submitted_at_ms) {
    return a.bid.submitted_at_ms < b.bid.submitted_at_ms;
  }
  if (a.bid.driver_id != b.bid.driver_id) {
    return a.bid.driver_id < b.bid.driver_id;
  }
  return a.bid.id < b.bid.id;
}

std::vector<ScoredBid> BidRanker::Rank(const freight::db::model::ShipmentRecord& shipment, const std::vector<BidCandidate>& candidates) const {
  const double reference = ReferencePrice(shipment.reserve_price, candidates);

  std::vector<ScoredBid> ranked;
  ranked.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    ranked.push_back(Score(candidate, reference));
  }

  std::sort(ranked.begin(), ranked.end(), RanksBefore);
  return ranked;
}

} // namespace freight::ranking
