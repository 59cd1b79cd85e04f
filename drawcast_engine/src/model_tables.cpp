// model_tables.cpp
//
// Count tables behind the pattern and Markov models, and the trend bit
// windows. Tables are always rebuilt from scratch so that contexts which fell
// out of the buffer cannot survive a retrain.

#include "drawcast/model_tables.hpp"

#include <algorithm>
#include <stdexcept>

namespace drawcast {

void DigitCounts::Add(int digit) {
  if (digit < 0 || digit > 9) {
    throw std::out_of_range("DigitCounts::Add: digit " +
                            std::to_string(digit));
  }
  ++counts[static_cast<std::size_t>(digit)];
  ++total;
}

int DigitCounts::MajorityDigit() const {
  auto it = std::max_element(counts.begin(), counts.end());
  return static_cast<int>(it - counts.begin());
}

double DigitCounts::MajorityShare() const {
  if (total == 0) return 0.0;
  return static_cast<double>(counts[static_cast<std::size_t>(MajorityDigit())]) /
         static_cast<double>(total);
}

std::string PatternKey(const std::vector<int>& digits,
                       std::size_t start,
                       std::size_t len) {
  std::string key;
  key.reserve(len);
  for (std::size_t i = start; i < start + len; ++i) {
    key.push_back(static_cast<char>('0' + digits[i]));
  }
  return key;
}

std::string MarkovKey(const std::vector<int>& digits,
                      std::size_t start,
                      std::size_t len) {
  std::string key;
  key.reserve(2 * len);
  for (std::size_t i = start; i < start + len; ++i) {
    if (i != start) key.push_back('-');
    key.push_back(static_cast<char>('0' + digits[i]));
  }
  return key;
}

PatternTable BuildPatternTable(const DataBuffer& buffer,
                               const std::vector<int>& window_lengths) {
  const std::vector<int> digits = buffer.Digits();
  const std::size_t n = digits.size();

  PatternTable table;
  for (int len_i : window_lengths) {
    if (len_i <= 0) continue;
    const auto len = static_cast<std::size_t>(len_i);
    if (n < len + 1) continue;

    for (std::size_t i = 0; i + len < n; ++i) {
      table[PatternKey(digits, i, len)].Add(digits[i + len]);
    }
  }
  return table;
}

MarkovTable BuildMarkovTable(const DataBuffer& buffer, int max_order) {
  const std::vector<int> digits = buffer.Digits();
  const std::size_t n = digits.size();

  MarkovTable table;
  for (int order_i = 1; order_i <= max_order; ++order_i) {
    const auto order = static_cast<std::size_t>(order_i);
    if (n < order + 1) break;

    for (std::size_t i = 0; i + order < n; ++i) {
      table[MarkovKey(digits, i, order)].Add(digits[i + order]);
    }
  }
  return table;
}

TrendWindows BuildTrendWindows(const DataBuffer& buffer) {
  TrendWindows w;
  w.short_term = buffer.Bits(kTrendShort);
  w.medium_term = buffer.Bits(kTrendMedium);
  w.long_term = buffer.Bits(kTrendLong);
  return w;
}

}  // namespace drawcast
