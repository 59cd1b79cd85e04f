#include <catch2/catch.hpp>

#include "drawcast/forecast_engine.hpp"
#include "drawcast/period_utils.hpp"
#include "test_helpers.hpp"

using namespace drawcast;
using drawcast::testing::NewestFirst;
using drawcast::testing::PeriodAt;
using drawcast::testing::ScrambledDigits;

namespace {

// Feed page of `n` draws ending at index `n`, newest first.
std::vector<OutcomeRecord> Page(std::size_t n, unsigned seed = 3) {
  return NewestFirst(ScrambledDigits(n, seed));
}

double WeightSum(const ForecastEngine& engine) {
  double s = 0.0;
  for (const auto& kv : engine.context().adapter.weights()) s += kv.second;
  return s;
}

}  // namespace

TEST_CASE("Ingest puts the newest feed record at the buffer head",
          "[engine]") {
  ForecastEngine engine(EngineConfig{});
  const auto page = Page(5);
  CHECK(engine.Ingest(page) == 5);
  CHECK(engine.context().buffer.newest().period_id == PeriodAt(5));
  CHECK(engine.context().buffer.Digits() == ScrambledDigits(5, 3));

  // The next poll overlaps the previous page by all but one record.
  auto next = NewestFirst({4}, 6);
  next.insert(next.end(), page.begin(), page.end());
  CHECK(engine.Ingest(next) == 1);
  CHECK(engine.context().buffer.newest().period_id == PeriodAt(6));
}

TEST_CASE("Predict refuses below the minimum record count", "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(99));
  CHECK_FALSE(engine.Predict(PeriodAt(100), 0).has_value());
  CHECK(engine.history().empty());

  engine.Ingest(Page(100));
  CHECK(engine.Predict(PeriodAt(101), 0).has_value());
}

TEST_CASE("A period is predicted at most once", "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(120));
  engine.Train(1000);

  const auto first = engine.Predict(PeriodAt(121), 2000);
  REQUIRE(first);
  CHECK(first->id == 1);
  CHECK(first->status == PredictionStatus::Pending);
  CHECK(first->created_at_ms == 2000u);
  CHECK(first->decision.confidence >= kMinEnsembleConfidence);
  CHECK(first->decision.confidence <= kMaxEnsembleConfidence);

  const auto again = engine.Predict(PeriodAt(121), 3000);
  REQUIRE(again);
  CHECK(again->id == 1);
  CHECK(again->created_at_ms == 2000u);
  CHECK(engine.history().size() == 1);
  CHECK(engine.PendingCount() == 1);
}

TEST_CASE("Resolution scores the forecast and adapts the weights",
          "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(120));
  engine.Train(0);

  const auto rec = engine.Predict(PeriodAt(121), 10);
  REQUIRE(rec);

  // Nothing to resolve until the draw shows up.
  CHECK(engine.ResolvePending(20).empty());

  const int actual_digit = rec->decision.label == Label::Big ? 7 : 2;
  engine.Ingest(NewestFirst({actual_digit}, 121));
  const auto resolved = engine.ResolvePending(30);
  REQUIRE(resolved.size() == 1);

  const auto& r = resolved.front();
  CHECK(r.status == PredictionStatus::Win);
  CHECK(r.actual_digit == actual_digit);
  REQUIRE(r.actual.has_value());
  CHECK(*r.actual == rec->decision.label);
  CHECK(r.resolved_at_ms == 30u);

  CHECK(engine.stats().total_predictions == 1);
  CHECK(engine.stats().total_wins == 1);
  CHECK(engine.stats().consecutive_wins == 1);
  CHECK(engine.stats().win_rate() == Approx(1.0));
  CHECK(engine.context().streak.consecutive_wins == 1);
  CHECK(engine.resolved_since_training() == 1);
  CHECK(engine.PendingCount() == 0);

  for (const auto& kv : engine.context().adapter.performance()) {
    CHECK(kv.second.total == 1);
  }
  CHECK(WeightSum(engine) == Approx(1.0));

  // Already resolved: a second pass finds nothing.
  CHECK(engine.ResolvePending(40).empty());
}

TEST_CASE("A wrong forecast counts as a loss and breaks the streak",
          "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(120));

  const auto rec = engine.Predict(PeriodAt(121), 0);
  REQUIRE(rec);
  const int wrong_digit = rec->decision.label == Label::Big ? 1 : 8;
  engine.Ingest(NewestFirst({wrong_digit}, 121));

  const auto resolved = engine.ResolvePending(1);
  REQUIRE(resolved.size() == 1);
  CHECK(resolved.front().status == PredictionStatus::Loss);
  CHECK(engine.stats().total_losses == 1);
  CHECK(engine.stats().consecutive_losses == 1);
  CHECK(engine.stats().consecutive_wins == 0);
  CHECK(engine.stats().win_rate() == 0.0);
}

TEST_CASE("Retrain cadence", "[engine]") {
  EngineConfig cfg;
  cfg.model_update_after_predictions = 2;
  cfg.retrain_interval_ms = 1000;
  ForecastEngine engine(cfg);

  CHECK_FALSE(engine.ShouldRetrain(0));  // nothing buffered yet

  engine.Ingest(Page(120));
  CHECK(engine.ShouldRetrain(0));  // never trained
  CHECK(engine.MaybeRetrain(0));
  CHECK_FALSE(engine.ShouldRetrain(500));
  CHECK_FALSE(engine.MaybeRetrain(500));
  CHECK(engine.ShouldRetrain(1000));

  CHECK(engine.Train(1000));
  for (int i = 0; i < 2; ++i) {
    const std::string period = PeriodAt(121 + i);
    REQUIRE(engine.Predict(period, 1000));
    engine.Ingest(NewestFirst({i}, 121 + i));
    REQUIRE(engine.ResolvePending(1000).size() == 1);
  }
  CHECK(engine.resolved_since_training() == 2);
  CHECK(engine.ShouldRetrain(1001));
  CHECK(engine.MaybeRetrain(1001));
  CHECK(engine.resolved_since_training() == 0);
  CHECK(engine.trainer().passes_completed() == 3);
}

TEST_CASE("Period desync discards pending forecasts", "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(120));

  REQUIRE(engine.Predict(PeriodAt(121), 0));
  // Feed still at 120: the pending forecast targets the next period.
  CHECK_FALSE(engine.SyncPeriods(PeriodAt(120)));
  CHECK(engine.PendingCount() == 1);

  // Feed jumped to 130 without ever reporting 121.
  CHECK(engine.SyncPeriods(PeriodAt(130)));
  CHECK(engine.PendingCount() == 0);
  CHECK(engine.history().empty());

  // The de-duplication set was cleared too, so 121 can be issued again.
  const auto reissued = engine.Predict(PeriodAt(121), 0);
  REQUIRE(reissued);
  CHECK(reissued->id == 2);
}

TEST_CASE("Resolved history survives a period desync", "[engine]") {
  ForecastEngine engine(EngineConfig{});
  engine.Ingest(Page(120));

  REQUIRE(engine.Predict(PeriodAt(121), 0));
  engine.Ingest(NewestFirst({3}, 121));
  REQUIRE(engine.ResolvePending(0).size() == 1);

  // Newest ledger entry is resolved: consistent whatever the feed says.
  CHECK_FALSE(engine.SyncPeriods(PeriodAt(140)));

  REQUIRE(engine.Predict(PeriodAt(150), 0));
  CHECK(engine.SyncPeriods(PeriodAt(140)));
  REQUIRE(engine.history().size() == 1);
  CHECK(engine.history().front().status != PredictionStatus::Pending);
  CHECK_FALSE(engine.SyncPeriods(""));
}

TEST_CASE("Ledger keeps only the newest max_history records", "[engine]") {
  EngineConfig cfg;
  cfg.max_history = 3;
  ForecastEngine engine(cfg);
  engine.Ingest(Page(120));

  for (int i = 0; i < 5; ++i) {
    REQUIRE(engine.Predict(PeriodAt(200 + i), 0));
  }
  REQUIRE(engine.history().size() == 3);
  CHECK(engine.history().front().period == PeriodAt(204));
  CHECK(engine.history().back().period == PeriodAt(202));
}

TEST_CASE("Engine rejects an invalid configuration", "[engine]") {
  EngineConfig cfg;
  cfg.markov_order = 0;
  CHECK_THROWS_AS(ForecastEngine(cfg), std::runtime_error);
}

TEST_CASE("Prediction status names", "[engine]") {
  CHECK(std::string(PredictionStatusName(PredictionStatus::Pending)) ==
        "Pending");
  CHECK(std::string(PredictionStatusName(PredictionStatus::Win)) == "Win");
  CHECK(std::string(PredictionStatusName(PredictionStatus::Loss)) == "Loss");
}
