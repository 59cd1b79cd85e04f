// drawcast_engine/src/run_replay.cpp
//
// Replays a stored draw history through ForecastEngine.
//
// Per step:
//   fetch page -> ingest -> resolve pending -> sync periods
//   -> maybe retrain -> predict next period -> sink
//
// The clock is simulated: step k runs at k * step_ms, so the time based
// retrain trigger behaves as it would against a live endpoint.

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "drawcast/decision_sink.hpp"
#include "drawcast/engine_config.hpp"
#include "drawcast/feed_source.hpp"
#include "drawcast/forecast_engine.hpp"
#include "drawcast/period_utils.hpp"
#include "drawcast/timing.hpp"

namespace {

struct ReplayArgs {
  std::string history_path;
  std::string out_path;
  std::string config_path;
  std::string weights_out;
  std::string timing_log = "data/profile/timing_log.txt";
  uint64_t max_steps = 0;  // 0 = until the history is exhausted
  uint64_t step_ms = 60000;
};

void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s --history <draws.parquet|draws.csv.gz> --out <decisions.parquet>
       [--config <engine_params.json>] [--weights-out <weights.json>]
       [--steps N] [--step-ms MS] [--timing-log <path>]

Description:
  Replays a draw history (oldest first, columns period/number) as a
  "latest 100 draws" feed. Each step reveals one draw, resolves pending
  forecasts, retrains when due and forecasts the next period. Resolved
  forecasts are written to the decisions parquet file; the final model
  weights and performance go to --weights-out when given.

Example:
  %s --history data/history/draws.csv.gz \
     --out data/replay/decisions.parquet \
     --config drawcast_engine/config/engine_params.json \
     --weights-out data/replay/weights.json
)",
               argv0, argv0);
  std::exit(2);
}

ReplayArgs parse_args(int argc, char** argv) {
  ReplayArgs a;
  for (int i = 1; i < argc; ++i) {
    std::string s = argv[i];
    if (s == "--history" && i + 1 < argc) {
      a.history_path = argv[++i];
    } else if (s == "--out" && i + 1 < argc) {
      a.out_path = argv[++i];
    } else if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (s == "--weights-out" && i + 1 < argc) {
      a.weights_out = argv[++i];
    } else if (s == "--steps" && i + 1 < argc) {
      a.max_steps = std::stoull(argv[++i]);
    } else if (s == "--step-ms" && i + 1 < argc) {
      a.step_ms = std::stoull(argv[++i]);
    } else if (s == "--timing-log" && i + 1 < argc) {
      a.timing_log = argv[++i];
    } else if (s == "--help" || s == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", s.c_str());
      usage_and_exit(argv[0]);
    }
  }
  if (a.history_path.empty() || a.out_path.empty()) usage_and_exit(argv[0]);
  return a;
}

// One polling cycle. Returns false when the feed has nothing new.
bool RunCycle(drawcast::HistoryReplayFeed& feed,
              drawcast::ForecastEngine& engine,
              drawcast::DecisionSink& sink,
              uint64_t now_ms) {
  DRAWCAST_SCOPE_TIMER("replay_cycle");

  if (feed.Exhausted() && feed.revealed() > 0) return false;

  const auto page = feed.FetchLatest(now_ms);
  if (page.empty()) return false;

  engine.Ingest(page);

  for (const auto& rec : engine.ResolvePending(now_ms)) {
    sink.OnResolution(rec, engine.stats(), engine.context().adapter.weights());
  }

  const std::string latest = feed.LatestPeriod();
  engine.SyncPeriods(latest);
  engine.MaybeRetrain(now_ms);

  if (auto rec = engine.Predict(drawcast::NextPeriod(latest), now_ms)) {
    sink.OnDecision(*rec, engine.context().adapter.weights());
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  using Clock = std::chrono::steady_clock;
  const auto program_start = Clock::now();

  try {
    const ReplayArgs args = parse_args(argc, argv);

    drawcast::EngineConfig cfg;
    if (!args.config_path.empty()) {
      DRAWCAST_SCOPE_TIMER("load_engine_config");
      cfg = drawcast::LoadEngineConfig(args.config_path);
    }

    std::vector<drawcast::RawRecord> history;
    {
      DRAWCAST_SCOPE_TIMER("load_history");
      history = drawcast::LoadHistory(args.history_path);
    }

    drawcast::HistoryReplayFeed feed(history);
    drawcast::ForecastEngine engine(cfg);
    drawcast::ParquetDecisionWriter writer(args.out_path);

    std::cout << "=== run_replay ===\n";
    std::cout << "  history = " << args.history_path << "\n";
    std::cout << "  out = " << args.out_path << "\n";
    std::cout << "  draws = " << feed.size() << " (of " << history.size()
              << " rows)\n";
    std::cout << "  window = " << feed.window() << "\n";
    std::cout << "  config = " << drawcast::EngineConfigToJson(cfg).dump()
              << "\n";

    uint64_t steps = 0;
    while (args.max_steps == 0 || steps < args.max_steps) {
      const uint64_t now_ms = (steps + 1) * args.step_ms;
      if (!RunCycle(feed, engine, writer, now_ms)) break;
      ++steps;
    }
    writer.close();

    const drawcast::EngineStats& st = engine.stats();
    std::cout << "  steps = " << steps << "\n";
    std::cout << "  decisions = " << writer.decisions_seen() << "\n";
    std::cout << "  resolved = " << st.total_predictions << "\n";
    std::cout << "  wins = " << st.total_wins << "\n";
    std::cout << "  losses = " << st.total_losses << "\n";
    std::cout << "  win_rate = " << std::fixed << std::setprecision(4)
              << st.win_rate() << "\n";
    std::cout << "  training_passes = " << engine.trainer().passes_completed()
              << " (failed " << engine.trainer().passes_failed() << ")\n";
    for (const auto& kv : engine.context().adapter.weights()) {
      std::cout << "  weight[" << kv.first << "] = " << kv.second << "\n";
    }

    if (!args.weights_out.empty()) {
      drawcast::WriteWeightsSnapshot(args.weights_out,
                                     engine.context().adapter.weights(),
                                     engine.context().adapter.performance(),
                                     st);
      std::cout << "  weights_out = " << args.weights_out << "\n";
    }

    drawcast::TimingRegistry::Instance().Add("program_wall_clock",
                                             Clock::now() - program_start);

    std::vector<std::string> argv_copy;
    argv_copy.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
    for (int i = 1; i < argc; ++i) argv_copy.emplace_back(argv[i]);
    drawcast::WriteTimingReport(args.timing_log, argv[0], argv_copy);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
