#pragma once

#include <cstddef>
#include <deque>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include "drawcast/outcome_types.hpp"

namespace drawcast {

// Bounded, de-duplicated window of recent outcomes, newest first.
//
// Invariants:
//   - no two records share a period_id
//   - size() <= capacity()
//   - records are never reordered; overflow evicts from the tail (oldest)
class DataBuffer {
 public:
  static constexpr std::size_t kDefaultCapacity = 200;
  static constexpr std::size_t kAll = std::numeric_limits<std::size_t>::max();

  explicit DataBuffer(std::size_t capacity = kDefaultCapacity);

  // Insert each record not already present at the head, in the given order
  // (so the last element of `records` becomes the newest), then truncate to
  // capacity. Returns the number of records inserted.
  std::size_t Ingest(const std::vector<OutcomeRecord>& records);

  bool Contains(const std::string& period_id) const;

  // Pointer into the buffer, or nullptr. Invalidated by the next Ingest.
  const OutcomeRecord* Find(const std::string& period_id) const;

  // Newest-first views of the first min(n, size()) records.
  std::vector<int> Digits(std::size_t n = kAll) const;
  std::vector<int> Bits(std::size_t n = kAll) const;

  const OutcomeRecord& operator[](std::size_t i) const { return records_[i]; }
  const OutcomeRecord& newest() const { return records_.front(); }

  const std::deque<OutcomeRecord>& records() const { return records_; }
  std::size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }
  std::size_t capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  std::deque<OutcomeRecord> records_;  // index 0 = newest
  std::unordered_set<std::string> periods_;
};

}  // namespace drawcast
