#include "internal/ranking/bid_ranker.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using freight::db::model::BidRecord;
using freight::db::model::ShipmentRecord;
using freight::ranking::BidCandidate;
using freight::ranking::BidRanker;

BidCandidate Candidate(const std::string& driver, double price, uint64_t submitted_at_ms, double reputation = 0.5, double eta_minutes = 30.0) {
  BidCandidate candidate;
  candidate.bid.id              = "bid-" + driver;
  candidate.bid.driver_id       = driver;
  candidate.bid.price           = price;
  candidate.bid.submitted_at_ms = submitted_at_ms;
  candidate.bid.eta_minutes     = eta_minutes;
  candidate.reputation          = reputation;
  return candidate;
}

void TestLowerPriceWinsAndEarlierBidBreaksTies() {
  BidRanker      ranker;
  ShipmentRecord shipment;

  const uint64_t t0     = 1'000'000;
  const auto     ranked = ranker.Rank(shipment, {Candidate("A", 500.0, t0), Candidate("B", 480.0, t0), Candidate("C", 480.0, t0 + 2000)});

  assert(ranked.size() == 3);
  assert(ranked[0].bid.driver_id == "B");
  assert(ranked[1].bid.driver_id == "C");
  assert(ranked[2].bid.driver_id == "A");
  assert(std::fabs(ranked[0].score - ranked[1].score) < BidRanker::kTieEpsilon);
}

void TestRankingIsDeterministicRegardlessOfInputOrder() {
  BidRanker      ranker;
  ShipmentRecord shipment;

  std::vector<BidCandidate> candidates = {Candidate("d3", 610.0, 30, 0.7, 15.0), Candidate("d1", 590.0, 10, 0.4, 90.0),
                                          Candidate("d2", 600.0, 20, 0.5, 45.0), Candidate("d4", 600.0, 20, 0.5, 45.0)};

  const auto first = ranker.Rank(shipment, candidates);
  std::reverse(candidates.begin(), candidates.end());
  const auto second = ranker.Rank(shipment, candidates);

  assert(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].bid.id == second[i].bid.id);
  }
  // Identical bids at the same instant fall back to driver id.
  const auto d2 = std::find_if(first.begin(), first.end(), [](const auto& s) { return s.bid.driver_id == "d2"; });
  const auto d4 = std::find_if(first.begin(), first.end(), [](const auto& s) { return s.bid.driver_id == "d4"; });
  assert(d2 < d4);
}

void TestBetterInputsNeverLowerTheScore() {
  BidRanker ranker;
  const double reference = 500.0;

  const auto base        = ranker.Score(Candidate("x", 450.0, 0, 0.5, 30.0), reference);
  const auto cheaper     = ranker.Score(Candidate("x", 400.0, 0, 0.5, 30.0), reference);
  const auto trusted     = ranker.Score(Candidate("x", 450.0, 0, 0.9, 30.0), reference);
  const auto closer      = ranker.Score(Candidate("x", 450.0, 0, 0.5, 5.0), reference);
  auto       with_chain  = Candidate("x", 450.0, 0, 0.5, 30.0);
  with_chain.backhaul_bonus = 0.8;
  const auto chained     = ranker.Score(with_chain, reference);

  assert(cheaper.score > base.score);
  assert(trusted.score > base.score);
  assert(closer.score > base.score);
  assert(chained.score > base.score);
}

void TestReferencePriceUsesReserveThenMean() {
  std::vector<BidCandidate> candidates = {Candidate("a", 300.0, 0), Candidate("b", 500.0, 0)};
  assert(BidRanker::ReferencePrice(std::nullopt, candidates) == 400.0);
  assert(BidRanker::ReferencePrice(450.0, candidates) == 450.0);
  assert(BidRanker::ReferencePrice(std::nullopt, {}) == 0.0);
}

void TestPriceScoreIsClamped() {
  assert(BidRanker::PriceScore(0.0, 100.0) == 1.0);
  assert(BidRanker::PriceScore(100.0, 100.0) == 0.5);
  assert(BidRanker::PriceScore(250.0, 100.0) == 0.0);
  assert(BidRanker::PriceScore(100.0, 0.0) == 0.0);
}

void TestProximityHalvesAtHalfLife() {
  BidRanker ranker;
  assert(ranker.ProximityScore(0.0) == 1.0);
  assert(std::fabs(ranker.ProximityScore(60.0) - 0.5) < 1e-12);
  assert(ranker.ProximityScore(120.0) < ranker.ProximityScore(60.0));
}

} // namespace

int main() {
  TestLowerPriceWinsAndEarlierBidBreaksTies();
  TestRankingIsDeterministicRegardlessOfInputOrder();
  TestBetterInputsNeverLowerTheScore();
  TestReferencePriceUsesReserveThenMean();
  TestPriceScoreIsClamped();
  TestProximityHalvesAtHalfLife();

  std::cout << "freight_exchange_unit_bid_ranker: pass\n";
  return 0;
}
