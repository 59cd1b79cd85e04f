// drawcast_engine/include/drawcast/forecast_engine.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "drawcast/engine_config.hpp"
#include "drawcast/ensemble.hpp"
#include "drawcast/trainer.hpp"

namespace drawcast {

enum class PredictionStatus { Pending, Win, Loss };

const char* PredictionStatusName(PredictionStatus s);

// One issued forecast and, once the draw is known, its outcome.
struct PredictionRecord {
  std::uint64_t id = 0;            // Sequence number within this engine
  std::string period;              // Period the forecast targets
  EnsembleDecision decision;
  PredictionStatus status = PredictionStatus::Pending;
  std::optional<Label> actual;     // Set on resolution
  int actual_digit = -1;           // Set on resolution
  std::uint64_t created_at_ms = 0;
  std::uint64_t resolved_at_ms = 0;
};

struct EngineStats {
  std::uint64_t total_predictions = 0;  // resolved predictions
  std::uint64_t total_wins = 0;
  std::uint64_t total_losses = 0;
  int consecutive_wins = 0;
  int consecutive_losses = 0;

  double win_rate() const {
    return total_predictions > 0
               ? static_cast<double>(total_wins) /
                     static_cast<double>(total_predictions)
               : 0.0;
  }
};

// Drives one prediction cycle over an owned ForecastContext:
//
//   Ingest -> (Maybe)Retrain -> Predict -> ... -> ResolvePending
//
// ResolvePending closes the learning loop: every model's vote on a resolved
// period is scored and handed to the WeightAdapter, and the run streak
// advances. Not thread-safe; callers serialize the cycle on one worker. Only
// Train() is guarded against overlapping triggers.
class ForecastEngine {
 public:
  explicit ForecastEngine(EngineConfig cfg);

  // `newest_first` as delivered by the feed. Records are inserted oldest
  // first so the newest ends up at the buffer head. Returns records added.
  std::size_t Ingest(const std::vector<OutcomeRecord>& newest_first);

  // Full retrain. False if a pass was already running or the pass failed.
  bool Train(std::uint64_t now_ms);

  bool ShouldRetrain(std::uint64_t now_ms) const;
  bool MaybeRetrain(std::uint64_t now_ms);

  // Period desync recovery. `latest_period` is the newest period reported by
  // the feed. If the newest ledger entry does not target the period right
  // after it, pending records are discarded and the set of predicted periods
  // is cleared. Returns true when that happened.
  bool SyncPeriods(const std::string& latest_period);

  // Forecast for `period`. Empty when the buffer holds fewer than
  // min_records_for_prediction records. A period already predicted returns
  // the existing ledger record unchanged.
  std::optional<PredictionRecord> Predict(const std::string& period,
                                          std::uint64_t now_ms);

  // Resolve every pending record whose period is now in the buffer.
  std::vector<PredictionRecord> ResolvePending(std::uint64_t now_ms);

  const EngineStats& stats() const { return stats_; }
  const std::deque<PredictionRecord>& history() const { return history_; }
  std::size_t PendingCount() const;

  const ForecastContext& context() const { return ctx_; }
  ForecastContext& context() { return ctx_; }
  const EngineConfig& config() const { return cfg_; }
  const Trainer& trainer() const { return trainer_; }

  int resolved_since_training() const { return resolved_since_training_; }

 private:
  PredictionRecord* FindRecord(const std::string& period);

  EngineConfig cfg_;
  ForecastContext ctx_;
  Trainer trainer_;
  EnsembleAggregator aggregator_;

  std::deque<PredictionRecord> history_;  // newest first, bounded
  std::unordered_set<std::string> predicted_periods_;
  std::uint64_t next_id_ = 1;

  EngineStats stats_;
  int resolved_since_training_ = 0;
  std::optional<std::uint64_t> last_training_ms_;
};

}  // namespace drawcast
