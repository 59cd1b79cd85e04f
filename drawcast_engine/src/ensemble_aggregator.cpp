// ensemble_aggregator.cpp
//
// Combines the six model votes into one decision:
//   1. weighted BIG/SMALL scores (confidence * weight)
//   2. raw confidence = winning score / total, agreement = majority share
//   3. confidence shaping (consensus bonus, market damping, streaks, clamp)
//   4. recovery mode from the run streak + market state
//   5. tier, recommendation and reasoning trace

#include "drawcast/ensemble.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "drawcast/timing.hpp"

namespace drawcast {

const char* RecoveryModeName(RecoveryMode m) {
  switch (m) {
    case RecoveryMode::MartingaleSafe:
      return "MARTINGALE_SAFE";
    case RecoveryMode::Caution:
      return "CAUTION";
    case RecoveryMode::AntiTrend:
      return "ANTI_TREND";
    case RecoveryMode::Normal:
    default:
      return "NORMAL";
  }
}

const char* TierName(Tier t) {
  switch (t) {
    case Tier::UltraHigh:
      return "ULTRA_HIGH";
    case Tier::High:
      return "HIGH";
    case Tier::Medium:
      return "MEDIUM";
    case Tier::Low:
      return "LOW";
    case Tier::VeryLow:
    default:
      return "VERY_LOW";
  }
}

const char* TierRecommendation(Tier t) {
  switch (t) {
    case Tier::UltraHigh:
      return "MAX CONFIDENCE";
    case Tier::High:
      return "HIGH CONFIDENCE";
    case Tier::Medium:
      return "MEDIUM CONFIDENCE";
    case Tier::Low:
      return "LOW CONFIDENCE";
    case Tier::VeryLow:
    default:
      return "VERY LOW - PROCEED WITH CAUTION";
  }
}

ForecastContext::ForecastContext(const EngineConfig& cfg)
    : buffer(cfg.buffer_capacity),
      adapter(ModelWeights(cfg.initial_weights.begin(),
                           cfg.initial_weights.end()),
              cfg.verbose) {}

RecoveryMode SelectRecoveryMode(const RunStreak& streak,
                                const MarketState& market) {
  const int losses = streak.consecutive_losses;
  if (losses >= 3 && market.volatility < 0.5) {
    return RecoveryMode::MartingaleSafe;
  }
  if (losses >= 2 && !market.is_exploitable) {
    return RecoveryMode::Caution;
  }
  if (losses >= 2 && IsStrongTrend(market.recent_trend)) {
    return RecoveryMode::AntiTrend;
  }
  return RecoveryMode::Normal;
}

Label ApplyRecoveryMode(Label raw, RecoveryMode mode) {
  return mode == RecoveryMode::AntiTrend ? Opposite(raw) : raw;
}

Tier ClassifyTier(double confidence_pct, double agreement) {
  if (confidence_pct >= 78.0 && agreement >= 0.8) return Tier::UltraHigh;
  if (confidence_pct >= 70.0 && agreement >= 0.7) return Tier::High;
  if (confidence_pct >= 63.0 && agreement >= 0.6) return Tier::Medium;
  if (confidence_pct >= 55.0) return Tier::Low;
  return Tier::VeryLow;
}

double ShapeConfidence(double raw_confidence,
                       double agreement,
                       const MarketState& market,
                       const RunStreak& streak) {
  double c = raw_confidence;

  if (agreement >= 0.8) {
    c += 0.08;
  } else if (agreement >= 0.6) {
    c += 0.04;
  }

  if (!market.is_exploitable) c *= 0.85;
  if (market.volatility > 0.6) c *= 0.90;
  if (streak.consecutive_wins >= 5) c += 0.05;
  if (streak.consecutive_losses >= 1) c -= 0.05;

  return std::clamp(c, kMinEnsembleConfidence, kMaxEnsembleConfidence);
}

std::vector<std::string> BuildReasons(const MarketState& market,
                                      double agreement,
                                      const RunStreak& streak,
                                      RecoveryMode mode) {
  std::vector<std::string> reasons;
  if (market.is_exploitable) {
    reasons.emplace_back("Exploitable randomness detected");
  }
  if (agreement >= 0.7) reasons.emplace_back("Strong model consensus");
  if (streak.consecutive_wins >= 5) {
    reasons.emplace_back("High-win streak active");
  }
  if (mode != RecoveryMode::Normal) {
    reasons.emplace_back(std::string("Recovery mode: ") +
                         RecoveryModeName(mode));
  }
  if (reasons.empty()) {
    reasons.emplace_back("Default prediction based on ensemble");
  }
  return reasons;
}

EnsembleDecision CombineVotes(std::vector<ModelVote> votes,
                              const ModelWeights& weights,
                              double default_weight,
                              const MarketState& market,
                              const RunStreak& streak) {
  double big_score = 0.0;
  double small_score = 0.0;
  std::size_t big_votes = 0;

  for (const auto& v : votes) {
    auto it = weights.find(ModelName(v.model));
    const double w = it == weights.end() ? default_weight : it->second;
    const double score = v.output.confidence * w;
    if (v.output.label == Label::Big) {
      big_score += score;
      ++big_votes;
    } else {
      small_score += score;
    }
  }

  EnsembleDecision d;
  const double total = big_score + small_score;
  d.raw_label = big_score > small_score ? Label::Big : Label::Small;
  d.raw_confidence =
      total > 0.0 ? std::max(big_score, small_score) / total : 0.5;

  const std::size_t n = votes.size();
  d.agreement = n > 0 ? static_cast<double>(std::max(big_votes, n - big_votes)) /
                            static_cast<double>(n)
                      : 0.5;

  d.confidence = ShapeConfidence(d.raw_confidence, d.agreement, market, streak);
  d.recovery_mode = SelectRecoveryMode(streak, market);
  d.label = ApplyRecoveryMode(d.raw_label, d.recovery_mode);

  d.tier = ClassifyTier(d.confidence * 100.0, d.agreement);
  d.recommendation = TierRecommendation(d.tier);
  d.confidence_percent = static_cast<int>(std::lround(d.confidence * 100.0));
  d.agreement_percent = static_cast<int>(std::lround(d.agreement * 100.0));
  d.market_condition = market.recent_trend;

  d.reasons = BuildReasons(market, d.agreement, streak, d.recovery_mode);
  for (std::size_t i = 0; i < d.reasons.size(); ++i) {
    if (i > 0) d.reasoning += "; ";
    d.reasoning += d.reasons[i];
  }
  d.reasoning += ".";

  d.model_outputs = std::move(votes);
  d.weights = weights;
  return d;
}

EnsembleAggregator::EnsembleAggregator(const EngineConfig& cfg)
    : pattern_lengths_(cfg.pattern_lengths),
      markov_order_(cfg.markov_order),
      frequency_windows_(cfg.frequency_windows),
      recurrent_{cfg.lstm_input_size, cfg.lstm_hidden_size, cfg.lstm_seed},
      default_weight_(cfg.default_model_weight) {}

std::vector<ModelVote> EnsembleAggregator::RunModels(
    ForecastContext& ctx) const {
  const DataBuffer& buf = ctx.buffer;
  const ModelState& m = ctx.models;

  std::vector<ModelVote> votes;
  votes.reserve(kAllModels.size());
  for (ModelId id : kAllModels) {
    switch (id) {
      case ModelId::Pattern:
        votes.push_back({id, PredictPattern(buf, m.patterns, pattern_lengths_)});
        break;
      case ModelId::Markov:
        votes.push_back({id, PredictMarkov(buf, m.markov, markov_order_)});
        break;
      case ModelId::Frequency:
        votes.push_back({id, PredictFrequency(buf, frequency_windows_)});
        break;
      case ModelId::Neural:
        votes.push_back({id, PredictRecurrent(buf, ctx.recurrent, recurrent_)});
        break;
      case ModelId::Trend:
        votes.push_back({id, PredictTrend(m.trend)});
        break;
      case ModelId::Quantum:
        votes.push_back({id, PredictQuantum(buf, m.market)});
        break;
    }
  }
  return votes;
}

EnsembleDecision EnsembleAggregator::Predict(ForecastContext& ctx) const {
  DRAWCAST_SCOPE_TIMER("ensemble_predict");
  return CombineVotes(RunModels(ctx), ctx.adapter.weights(), default_weight_,
                      ctx.models.market, ctx.streak);
}

}  // namespace drawcast
