#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "drawcast/data_buffer.hpp"

namespace drawcast {

// Direction of the 10 most recent outcomes.
enum class TrendLabel { Neutral, StrongBig, BiasBig, StrongSmall, BiasSmall };

const char* TrendLabelName(TrendLabel t);
bool IsStrongTrend(TrendLabel t);

// Regime descriptor consumed by the quantum model and the aggregator.
// Replaced wholesale by AnalyzeMarketState; never partially updated.
struct MarketState {
  double volatility = 0.0;         // std / (mean + eps) of digits
  double bias = 0.5;               // fraction of BIG in the window
  double entropy = 0.0;            // Shannon entropy (bits) of the bit sequence
  TrendLabel recent_trend = TrendLabel::Neutral;
  double confidence = 0.5;         // clamp(1 - 2|bias - 0.5|, 0.3, 0.9)
  double randomness_quality = 1.0; // 1 - entropy
  bool is_exploitable = false;     // entropy < 0.92 && |runs z| > 1.96
  uint64_t last_update_ms = 0;
};

struct SampleStats {
  double mean = 0.0;
  double std = 0.0;
  double variance = 0.0;  // population variance
};

struct RunsTestResult {
  int runs = 0;
  double expected = 0.0;
  double variance = 0.0;
  double z_score = 0.0;
};

struct RandomnessReport {
  double entropy = 0.0;
  double runs_z = 0.0;
  double spectral_bias = 0.0;
  bool is_exploitable = false;
  double quality = 1.0;
};

constexpr std::size_t kMarketMinRecords = 30;
constexpr std::size_t kMarketWindow = 50;
constexpr double kExploitableEntropy = 0.92;
constexpr double kExploitableRunsZ = 1.96;

SampleStats ComputeSampleStats(const std::vector<int>& values);

// Shannon entropy in bits of the empirical symbol distribution.
double ShannonEntropy(const std::vector<int>& values);

// Wald-Wolfowitz style runs test on a 0/1 sequence. z = 0 for sequences
// shorter than 10 or when the variance term is not positive.
RunsTestResult RunsTest(const std::vector<int>& bits);

// Fraction of consecutive differences with |d| >= 3.
double SpectralBias(const std::vector<int>& digits);

// Classify the count of BIG outcomes among the 10 most recent.
TrendLabel ClassifyTrend(int big_in_last_10);

RandomnessReport AssessRandomness(const std::vector<int>& bits,
                                  const std::vector<int>& digits);

// Recompute `state` from the newest min(50, size) records. Leaves `state`
// untouched and returns false when the buffer holds fewer than 30 records.
bool AnalyzeMarketState(const DataBuffer& buffer,
                        MarketState& state,
                        uint64_t now_ms);

}  // namespace drawcast
