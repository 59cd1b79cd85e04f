// market_analyzer.cpp
//
// Randomness statistics over the recent outcome window (entropy, runs test,
// spectral bias) and the MarketState regime descriptor built from them.

#include "drawcast/market_state.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <numeric>

namespace drawcast {

const char* TrendLabelName(TrendLabel t) {
  switch (t) {
    case TrendLabel::StrongBig:
      return "STRONG_BIG";
    case TrendLabel::BiasBig:
      return "BIAS_BIG";
    case TrendLabel::StrongSmall:
      return "STRONG_SMALL";
    case TrendLabel::BiasSmall:
      return "BIAS_SMALL";
    case TrendLabel::Neutral:
    default:
      return "NEUTRAL";
  }
}

bool IsStrongTrend(TrendLabel t) {
  return t == TrendLabel::StrongBig || t == TrendLabel::StrongSmall;
}

SampleStats ComputeSampleStats(const std::vector<int>& values) {
  SampleStats s;
  if (values.empty()) return s;

  const double n = static_cast<double>(values.size());
  s.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

  double ss = 0.0;
  for (int v : values) {
    const double d = static_cast<double>(v) - s.mean;
    ss += d * d;
  }
  s.variance = ss / n;
  s.std = std::sqrt(s.variance);
  return s;
}

double ShannonEntropy(const std::vector<int>& values) {
  if (values.empty()) return 0.0;

  std::map<int, std::size_t> freq;
  for (int v : values) ++freq[v];

  const double n = static_cast<double>(values.size());
  double h = 0.0;
  for (const auto& kv : freq) {
    const double p = static_cast<double>(kv.second) / n;
    if (p > 0.0) h -= p * std::log2(p);
  }
  return h;
}

RunsTestResult RunsTest(const std::vector<int>& bits) {
  RunsTestResult r;
  if (bits.size() < 10) return r;

  r.runs = 1;
  for (std::size_t i = 1; i < bits.size(); ++i) {
    if (bits[i] != bits[i - 1]) ++r.runs;
  }

  const double n = static_cast<double>(bits.size());
  const double n1 =
      static_cast<double>(std::count(bits.begin(), bits.end(), 1));
  const double n0 = n - n1;

  r.expected = (2.0 * n0 * n1) / n + 1.0;
  r.variance = (2.0 * n0 * n1 * (2.0 * n0 * n1 - n)) / (n * n * (n - 1.0));
  r.z_score = r.variance > 0.0
                  ? (static_cast<double>(r.runs) - r.expected) /
                        std::sqrt(r.variance)
                  : 0.0;
  return r;
}

double SpectralBias(const std::vector<int>& digits) {
  if (digits.size() < 2) return 0.0;

  std::size_t high = 0;
  for (std::size_t i = 1; i < digits.size(); ++i) {
    if (std::abs(digits[i] - digits[i - 1]) >= 3) ++high;
  }
  return static_cast<double>(high) / static_cast<double>(digits.size() - 1);
}

TrendLabel ClassifyTrend(int big_in_last_10) {
  // Fixed priority: STRONG before BIAS, BIG before SMALL.
  if (big_in_last_10 >= 7) return TrendLabel::StrongBig;
  if (big_in_last_10 >= 6) return TrendLabel::BiasBig;
  if (big_in_last_10 <= 3) return TrendLabel::StrongSmall;
  if (big_in_last_10 <= 4) return TrendLabel::BiasSmall;
  return TrendLabel::Neutral;
}

RandomnessReport AssessRandomness(const std::vector<int>& bits,
                                  const std::vector<int>& digits) {
  RandomnessReport rep;
  rep.entropy = ShannonEntropy(bits);
  rep.runs_z = RunsTest(bits).z_score;
  rep.spectral_bias = SpectralBias(digits);
  rep.is_exploitable = rep.entropy < kExploitableEntropy &&
                       std::abs(rep.runs_z) > kExploitableRunsZ;
  // Binary alphabet: maximum entropy is log2(2) = 1.
  rep.quality = 1.0 - rep.entropy;
  return rep;
}

bool AnalyzeMarketState(const DataBuffer& buffer,
                        MarketState& state,
                        uint64_t now_ms) {
  if (buffer.size() < kMarketMinRecords) return false;

  const std::vector<int> bits = buffer.Bits(kMarketWindow);
  const std::vector<int> digits = buffer.Digits(kMarketWindow);

  const SampleStats stats = ComputeSampleStats(digits);
  const RandomnessReport rnd = AssessRandomness(bits, digits);

  const double big =
      static_cast<double>(std::count(bits.begin(), bits.end(), 1));
  const double bias = big / static_cast<double>(bits.size());

  const std::size_t recent_n = std::min<std::size_t>(10, bits.size());
  const int big_recent = static_cast<int>(
      std::count(bits.begin(), bits.begin() + recent_n, 1));

  MarketState next;
  next.volatility = stats.std / (stats.mean + 0.001);
  next.bias = bias;
  next.entropy = rnd.entropy;
  next.recent_trend = ClassifyTrend(big_recent);
  next.confidence =
      std::clamp(1.0 - std::abs(bias - 0.5) * 2.0, 0.3, 0.9);
  next.randomness_quality = rnd.quality;
  next.is_exploitable = rnd.is_exploitable;
  next.last_update_ms = now_ms;

  state = next;
  return true;
}

}  // namespace drawcast
