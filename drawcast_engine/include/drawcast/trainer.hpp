#pragma once
#include <atomic>
#include <cstdint>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/model_tables.hpp"

namespace drawcast {

// Rebuilds pattern/Markov tables and trend windows from the buffer, then
// re-runs the market analyzer.
//
// Single-flight: a Run() issued while another pass is in flight (from another
// thread, or re-entrantly from inside a pass) returns false immediately and
// touches nothing. A pass that throws is logged and discarded; `state` keeps
// its previous contents and the in-flight flag is always released.
class Trainer {
 public:
  Trainer(std::vector<int> pattern_lengths, int markov_order);
  virtual ~Trainer() = default;

  Trainer(const Trainer&) = delete;
  Trainer& operator=(const Trainer&) = delete;

  // Returns true when `state` was replaced by a fresh build.
  bool Run(const DataBuffer& buffer, ModelState& state, std::uint64_t now_ms);

  bool IsTraining() const { return training_.load(); }

  std::uint64_t passes_completed() const { return passes_completed_; }
  std::uint64_t passes_failed() const { return passes_failed_; }

 protected:
  // Fills `staged` from `buffer`. `staged.market` arrives holding the current
  // market state so the analyzer's small-sample no-op keeps it.
  virtual void RebuildTables(const DataBuffer& buffer, ModelState& staged);

 private:
  std::vector<int> pattern_lengths_;
  int markov_order_;

  std::atomic<bool> training_{false};
  std::uint64_t passes_completed_ = 0;
  std::uint64_t passes_failed_ = 0;
};

}  // namespace drawcast
