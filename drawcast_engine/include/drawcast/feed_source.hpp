#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "drawcast/outcome_types.hpp"

namespace drawcast {

// Unvalidated draw as delivered by a results endpoint or a history file.
struct RawRecord {
  std::string period_id;
  std::string number;  // decimal text, expected "0".."9"
};

// Drop records whose id is not a digit string (see is_period_id), whose number
// is not a single decimal value in [0, 9], or whose id was already seen
// earlier in the batch. Order is kept.
std::vector<OutcomeRecord> ValidateRawRecords(const std::vector<RawRecord>& raw,
                                              uint64_t observed_at_ms);

// Source of recent draws, newest first.
class FeedSource {
 public:
  virtual ~FeedSource() = default;

  // May throw std::runtime_error on transport or format failures; the caller
  // skips the cycle.
  virtual std::vector<OutcomeRecord> FetchLatest(uint64_t now_ms) = 0;
};

// History loaders. Rows are returned in file order (oldest first).
//
// Parquet: columns `period` (utf8 or integer) and `number` (integer).
std::vector<RawRecord> LoadHistoryParquet(const std::string& path);

// Gzip CSV with a `period,number` header line.
std::vector<RawRecord> LoadHistoryCsvGz(const std::string& path);

// Dispatch on the extension: ".parquet" or ".csv.gz".
std::vector<RawRecord> LoadHistory(const std::string& path);

// Replays a stored history as if polling a "last N draws" endpoint.
//
// Each FetchLatest() reveals one more draw and returns the newest `window`
// revealed draws, newest first. The first call reveals `window` draws at once
// so the engine starts with a full page.
class HistoryReplayFeed : public FeedSource {
 public:
  static constexpr std::size_t kDefaultWindow = 100;

  // `history` oldest first; invalid rows are dropped up front.
  explicit HistoryReplayFeed(const std::vector<RawRecord>& history,
                             std::size_t window = kDefaultWindow);

  std::vector<OutcomeRecord> FetchLatest(uint64_t now_ms) override;

  // True once every draw has been revealed.
  bool Exhausted() const { return revealed_ >= history_.size(); }

  // Period of the newest revealed draw, empty before the first fetch.
  std::string LatestPeriod() const;

  std::size_t revealed() const { return revealed_; }
  std::size_t size() const { return history_.size(); }
  std::size_t window() const { return window_; }

 private:
  std::vector<OutcomeRecord> history_;  // oldest first
  std::size_t window_;
  std::size_t revealed_ = 0;
};

}  // namespace drawcast
