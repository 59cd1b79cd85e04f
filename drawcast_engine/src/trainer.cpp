#include "drawcast/trainer.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include "drawcast/market_state.hpp"
#include "drawcast/timing.hpp"

namespace drawcast {

namespace {

// Clears the in-flight flag on every exit path.
class FlightGuard {
 public:
  explicit FlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~FlightGuard() { flag_.store(false); }

  FlightGuard(const FlightGuard&) = delete;
  FlightGuard& operator=(const FlightGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

}  // namespace

Trainer::Trainer(std::vector<int> pattern_lengths, int markov_order)
    : pattern_lengths_(std::move(pattern_lengths)),
      markov_order_(markov_order) {}

void Trainer::RebuildTables(const DataBuffer& buffer, ModelState& staged) {
  staged.patterns = BuildPatternTable(buffer, pattern_lengths_);
  staged.markov = BuildMarkovTable(buffer, markov_order_);
  staged.trend = BuildTrendWindows(buffer);
}

bool Trainer::Run(const DataBuffer& buffer,
                  ModelState& state,
                  std::uint64_t now_ms) {
  bool expected = false;
  if (!training_.compare_exchange_strong(expected, true)) {
    return false;
  }
  FlightGuard guard(training_);

  const auto start = std::chrono::steady_clock::now();
  try {
    DRAWCAST_SCOPE_TIMER("train_all_models");

    ModelState staged;
    staged.market = state.market;
    RebuildTables(buffer, staged);
    AnalyzeMarketState(buffer, staged.market, now_ms);

    state = std::move(staged);
  } catch (const std::exception& e) {
    ++passes_failed_;
    std::cerr << "Trainer: training pass failed: " << e.what() << "\n";
    return false;
  }

  ++passes_completed_;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - start)
                      .count();
  std::cout << "  [train] records = " << buffer.size()
            << ", patterns = " << state.patterns.size()
            << ", markov_states = " << state.markov.size()
            << ", ms = " << ms << "\n";
  return true;
}

}  // namespace drawcast
