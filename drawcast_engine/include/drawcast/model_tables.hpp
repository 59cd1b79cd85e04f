#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/market_state.hpp"

namespace drawcast {

// Next-digit histogram for one context key.
struct DigitCounts {
  std::array<std::uint32_t, 10> counts{};  // occurrences of each next digit
  std::uint32_t total = 0;                 // sum of counts

  void Add(int digit);

  // Lowest digit among those with the maximum count.
  int MajorityDigit() const;

  // counts[MajorityDigit()] / total, 0 when empty.
  double MajorityShare() const;
};

// Key: concatenated digits ("5213"), one entry per (window length, context).
using PatternTable = std::unordered_map<std::string, DigitCounts>;

// Key: dash-joined digits ("5-2-1"), orders 1..K.
using MarkovTable = std::unordered_map<std::string, DigitCounts>;

// Bit slices from the buffer head.
struct TrendWindows {
  std::vector<int> short_term;   // newest 10
  std::vector<int> medium_term;  // newest 30
  std::vector<int> long_term;    // newest 60
};

// Everything the Trainer rebuilds. Replaced as a unit on a successful pass.
struct ModelState {
  PatternTable patterns;
  MarkovTable markov;
  TrendWindows trend;
  MarketState market;
};

constexpr std::size_t kTrendShort = 10;
constexpr std::size_t kTrendMedium = 30;
constexpr std::size_t kTrendLong = 60;

// Context keys over digits[start, start + len).
std::string PatternKey(const std::vector<int>& digits,
                       std::size_t start,
                       std::size_t len);
std::string MarkovKey(const std::vector<int>& digits,
                      std::size_t start,
                      std::size_t len);

// Full rebuilds from the current buffer. Both walk the newest-first digit
// sequence: the context is digits[i, i + L) and the counted digit is
// digits[i + L].
PatternTable BuildPatternTable(const DataBuffer& buffer,
                               const std::vector<int>& window_lengths);
MarkovTable BuildMarkovTable(const DataBuffer& buffer, int max_order);
TrendWindows BuildTrendWindows(const DataBuffer& buffer);

}  // namespace drawcast
