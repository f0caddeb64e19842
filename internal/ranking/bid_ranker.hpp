#pragma once

#include <optional>
#include <vector>

#include "internal/db/model/bid_record.hpp"
#include "internal/db/model/shipment_record.hpp"

namespace freight::ranking {

struct RankingWeights {
  double price                 = 0.50;
  double reputation            = 0.25;
  double proximity             = 0.15;
  double backhaul              = 0.10;
  double eta_half_life_minutes = 60.0;
};

// Per-bid inputs that come from outside the bid record.
struct BidCandidate {
  freight::db::model::BidRecord bid;
  double                        reputation     = 0.0;
  double                        backhaul_bonus = 0.0;
};

struct ScoredBid {
  freight::db::model::BidRecord bid;

  double score           = 0.0;
  double price_score     = 0.0;
  double reputation      = 0.0;
  double proximity_score = 0.0;
  double backhaul_bonus  = 0.0;
};

/*
  Composite bid score:

    w_price * priceScore + w_rep * reputation + w_prox * proximity + w_backhaul * backhaul

  Pure and deterministic. Scores within 1e-9 are ties, broken by earlier
  submission and then by driver id, so the order is strict.
*/
class BidRanker {
 public:
  static constexpr double kTieEpsilon = 1e-9;

  explicit BidRanker(RankingWeights weights = {});

  // Best first.
  std::vector<ScoredBid> Rank(const freight::db::model::ShipmentRecord& shipment, const std::vector<BidCandidate>& candidates) const;

  ScoredBid Score(const BidCandidate& candidate, double reference_price) const;

  // clamp(1 - price / (2 * reference), 0, 1)
  static double PriceScore(double price, double reference_price);

  double ProximityScore(double eta_minutes) const;

  // Reserve price if set, else the mean candidate price.
  static double ReferencePrice(const std::optional<double>& reserve_price, const std::vector<BidCandidate>& candidates);

  static bool RanksBefore(const ScoredBid& a, const ScoredBid& b);

  const RankingWeights& Weights() const {
    return weights_;
  }

 private:
  RankingWeights weights_;
};

} // namespace freight::ranking
