#pragma once
#include <memory>
#include <string>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/engine_config.hpp"
#include "drawcast/market_state.hpp"
#include "drawcast/model_tables.hpp"
#include "drawcast/predictors.hpp"
#include "drawcast/recurrent_cell.hpp"
#include "drawcast/weight_adapter.hpp"

namespace drawcast {

// Consecutive outcome counters; only outcome resolution mutates them.
struct RunStreak {
  int consecutive_wins = 0;
  int consecutive_losses = 0;

  void RecordWin() {
    ++consecutive_wins;
    consecutive_losses = 0;
  }
  void RecordLoss() {
    ++consecutive_losses;
    consecutive_wins = 0;
  }
};

enum class RecoveryMode { Normal, MartingaleSafe, Caution, AntiTrend };
enum class Tier { UltraHigh, High, Medium, Low, VeryLow };

const char* RecoveryModeName(RecoveryMode m);
const char* TierName(Tier t);
const char* TierRecommendation(Tier t);

struct ModelVote {
  ModelId model;
  ModelOutput output;
};

// One ensemble forecast. Built fresh per request and never mutated after.
struct EnsembleDecision {
  Label label = Label::Big;       // after recovery mode
  Label raw_label = Label::Big;   // weighted vote before recovery mode
  double raw_confidence = 0.5;    // winning score / total score
  double confidence = 0.5;        // shaped, in [0.50, 0.92]
  int confidence_percent = 50;
  Tier tier = Tier::VeryLow;
  std::string recommendation;
  double agreement = 0.0;         // share of models on the majority side
  int agreement_percent = 0;
  TrendLabel market_condition = TrendLabel::Neutral;
  RecoveryMode recovery_mode = RecoveryMode::Normal;
  std::vector<ModelVote> model_outputs;
  ModelWeights weights;           // snapshot used for this vote
  std::vector<std::string> reasons;
  std::string reasoning;          // reasons joined with "; " plus "."
};

// All process-wide mutable forecasting state, owned in one place so several
// engines can coexist (e.g. in tests).
struct ForecastContext {
  explicit ForecastContext(const EngineConfig& cfg);

  DataBuffer buffer;
  ModelState models;
  std::unique_ptr<RecurrentCell> recurrent;  // created on first use
  WeightAdapter adapter;
  RunStreak streak;
};

constexpr double kMinEnsembleConfidence = 0.50;
constexpr double kMaxEnsembleConfidence = 0.92;

// Precedence: MARTINGALE_SAFE, CAUTION, ANTI_TREND, NORMAL.
RecoveryMode SelectRecoveryMode(const RunStreak& streak,
                                const MarketState& market);

// Only ANTI_TREND changes the label (flips it).
Label ApplyRecoveryMode(Label raw, RecoveryMode mode);

// First match wins, top-down. `confidence_pct` is in [0, 100].
Tier ClassifyTier(double confidence_pct, double agreement);

// Agreement bonus, market damping, streak adjustment and final clamp.
double ShapeConfidence(double raw_confidence,
                       double agreement,
                       const MarketState& market,
                       const RunStreak& streak);

// Always non-empty.
std::vector<std::string> BuildReasons(const MarketState& market,
                                      double agreement,
                                      const RunStreak& streak,
                                      RecoveryMode mode);

// Weighted vote over already computed model outputs. Models missing from
// `weights` count with `default_weight`.
EnsembleDecision CombineVotes(std::vector<ModelVote> votes,
                              const ModelWeights& weights,
                              double default_weight,
                              const MarketState& market,
                              const RunStreak& streak);

// Runs every ensemble member over the context and combines the votes.
// Total: never throws for a non-empty buffer.
class EnsembleAggregator {
 public:
  explicit EnsembleAggregator(const EngineConfig& cfg);

  EnsembleDecision Predict(ForecastContext& ctx) const;

  std::vector<ModelVote> RunModels(ForecastContext& ctx) const;

 private:
  std::vector<int> pattern_lengths_;
  int markov_order_;
  std::vector<int> frequency_windows_;
  RecurrentParams recurrent_;
  double default_weight_;
};

}  // namespace drawcast
