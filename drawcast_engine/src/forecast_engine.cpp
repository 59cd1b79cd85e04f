// drawcast_engine/src/forecast_engine.cpp
#include "drawcast/forecast_engine.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "drawcast/period_utils.hpp"
#include "drawcast/timing.hpp"

namespace drawcast {

const char* PredictionStatusName(PredictionStatus s) {
  switch (s) {
    case PredictionStatus::Win:
      return "Win";
    case PredictionStatus::Loss:
      return "Loss";
    case PredictionStatus::Pending:
    default:
      return "Pending";
  }
}

ForecastEngine::ForecastEngine(EngineConfig cfg)
    : cfg_((ValidateEngineConfig(cfg), std::move(cfg))),
      ctx_(cfg_),
      trainer_(cfg_.pattern_lengths, cfg_.markov_order),
      aggregator_(cfg_) {}

std::size_t ForecastEngine::Ingest(
    const std::vector<OutcomeRecord>& newest_first) {
  std::vector<OutcomeRecord> arrival(newest_first.rbegin(),
                                     newest_first.rend());
  return ctx_.buffer.Ingest(arrival);
}

bool ForecastEngine::Train(std::uint64_t now_ms) {
  if (!trainer_.Run(ctx_.buffer, ctx_.models, now_ms)) return false;
  resolved_since_training_ = 0;
  last_training_ms_ = now_ms;
  return true;
}

bool ForecastEngine::ShouldRetrain(std::uint64_t now_ms) const {
  if (ctx_.buffer.empty()) return false;
  if (!last_training_ms_) return true;
  if (resolved_since_training_ >= cfg_.model_update_after_predictions) {
    return true;
  }
  return now_ms >= *last_training_ms_ &&
         now_ms - *last_training_ms_ >= cfg_.retrain_interval_ms;
}

bool ForecastEngine::MaybeRetrain(std::uint64_t now_ms) {
  if (!ShouldRetrain(now_ms)) return false;
  return Train(now_ms);
}

bool ForecastEngine::SyncPeriods(const std::string& latest_period) {
  if (history_.empty() || !is_period_id(latest_period)) return false;

  const PredictionRecord& newest = history_.front();
  const std::string expected = NextPeriod(latest_period);
  if (newest.period == expected ||
      newest.status != PredictionStatus::Pending) {
    return false;
  }

  std::cerr << "Warning: period mismatch, expected " << expected
            << ", newest prediction targets " << newest.period << "\n";

  history_.erase(std::remove_if(history_.begin(), history_.end(),
                                [](const PredictionRecord& r) {
                                  return r.status == PredictionStatus::Pending;
                                }),
                 history_.end());
  predicted_periods_.clear();
  return true;
}

PredictionRecord* ForecastEngine::FindRecord(const std::string& period) {
  auto it = std::find_if(
      history_.begin(), history_.end(),
      [&](const PredictionRecord& r) { return r.period == period; });
  return it == history_.end() ? nullptr : &*it;
}

std::optional<PredictionRecord> ForecastEngine::Predict(
    const std::string& period, std::uint64_t now_ms) {
  if (ctx_.buffer.empty() ||
      ctx_.buffer.size() < cfg_.min_records_for_prediction) {
    return std::nullopt;
  }

  if (predicted_periods_.count(period) > 0) {
    if (const PredictionRecord* existing = FindRecord(period)) {
      return *existing;
    }
  }

  PredictionRecord rec;
  rec.id = next_id_++;
  rec.period = period;
  rec.decision = aggregator_.Predict(ctx_);
  rec.created_at_ms = now_ms;

  predicted_periods_.insert(period);
  history_.push_front(rec);
  while (history_.size() > cfg_.max_history) {
    predicted_periods_.erase(history_.back().period);
    history_.pop_back();
  }
  return rec;
}

std::vector<PredictionRecord> ForecastEngine::ResolvePending(
    std::uint64_t now_ms) {
  DRAWCAST_SCOPE_TIMER("resolve_pending");
  std::vector<PredictionRecord> resolved;

  // Oldest first, so the streak advances in draw order.
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    PredictionRecord& rec = *it;
    if (rec.status != PredictionStatus::Pending) continue;

    const OutcomeRecord* actual = ctx_.buffer.Find(rec.period);
    if (!actual) continue;

    const bool win = rec.decision.label == actual->label;
    rec.status = win ? PredictionStatus::Win : PredictionStatus::Loss;
    rec.actual = actual->label;
    rec.actual_digit = actual->digit;
    rec.resolved_at_ms = now_ms;

    ++stats_.total_predictions;
    if (win) {
      ++stats_.total_wins;
      ctx_.streak.RecordWin();
    } else {
      ++stats_.total_losses;
      ctx_.streak.RecordLoss();
    }
    stats_.consecutive_wins = ctx_.streak.consecutive_wins;
    stats_.consecutive_losses = ctx_.streak.consecutive_losses;

    for (const auto& vote : rec.decision.model_outputs) {
      ctx_.adapter.Update(ModelName(vote.model),
                          vote.output.label == actual->label);
    }

    ++resolved_since_training_;
    resolved.push_back(rec);
  }
  return resolved;
}

std::size_t ForecastEngine::PendingCount() const {
  return static_cast<std::size_t>(
      std::count_if(history_.begin(), history_.end(),
                    [](const PredictionRecord& r) {
                      return r.status == PredictionStatus::Pending;
                    }));
}

}  // namespace drawcast
