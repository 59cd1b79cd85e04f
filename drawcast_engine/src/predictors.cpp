// predictors.cpp
//
// The five table/frequency based ensemble members. Each is total over any
// non-empty buffer: when history is too short the model returns a low,
// fixed confidence and a *_fallback / *_insufficient source tag instead of
// failing.

#include "drawcast/predictors.hpp"

#include <algorithm>
#include <cmath>

namespace drawcast {

const char* ModelName(ModelId id) {
  switch (id) {
    case ModelId::Pattern:
      return "pattern";
    case ModelId::Markov:
      return "markov";
    case ModelId::Frequency:
      return "frequency";
    case ModelId::Neural:
      return "neural";
    case ModelId::Trend:
      return "trend";
    case ModelId::Quantum:
      return "quantum";
  }
  return "unknown";
}

std::optional<ModelId> ModelFromName(std::string_view name) {
  for (ModelId id : kAllModels) {
    if (name == ModelName(id)) return id;
  }
  return std::nullopt;
}

namespace {

double BigRatio(const std::vector<int>& bits) {
  const double big =
      static_cast<double>(std::count(bits.begin(), bits.end(), 1));
  // An empty window reads as ratio 0.
  return big / static_cast<double>(bits.empty() ? 1 : bits.size());
}

}  // namespace

ModelOutput PredictPattern(const DataBuffer& buffer,
                           const PatternTable& table,
                           const std::vector<int>& window_lengths) {
  const std::vector<int> digits = buffer.Digits();

  double best_conf = 0.0;
  std::optional<Label> best_label;

  for (int len_i : window_lengths) {
    if (len_i <= 0) continue;
    const auto len = static_cast<std::size_t>(len_i);
    if (digits.size() < len + 1) continue;

    auto it = table.find(PatternKey(digits, 0, len));
    if (it == table.end() || it->second.total < 3) continue;

    const double conf = it->second.MajorityShare();
    // Strict '>' keeps the earlier length on ties.
    if (conf > best_conf) {
      best_conf = conf;
      best_label = LabelOf(it->second.MajorityDigit());
    }
  }

  if (best_label) {
    return {*best_label, best_conf, "pattern"};
  }

  const std::vector<int> recent = buffer.Bits(10);
  const auto recent_big = std::count(recent.begin(), recent.end(), 1);
  return {recent_big >= 5 ? Label::Big : Label::Small, 0.52,
          "pattern_fallback"};
}

ModelOutput PredictMarkov(const DataBuffer& buffer,
                          const MarkovTable& table,
                          int max_order) {
  const std::vector<int> digits = buffer.Digits();

  for (int order_i = max_order; order_i >= 1; --order_i) {
    const auto order = static_cast<std::size_t>(order_i);
    if (digits.size() < order + 1) continue;

    auto it = table.find(MarkovKey(digits, 0, order));
    if (it == table.end() || it->second.total < 2) continue;

    return {LabelOf(it->second.MajorityDigit()), it->second.MajorityShare(),
            "markov_order" + std::to_string(order_i)};
  }

  // Anti-persistence heuristic: bet against the newest outcome.
  const Label last = buffer.empty() ? Label::Small : buffer.newest().label;
  return {Opposite(last), 0.51, "markov_fallback"};
}

ModelOutput PredictFrequency(const DataBuffer& buffer,
                             const std::vector<int>& windows) {
  double big_score = 0.0;
  double small_score = 0.0;
  bool any = false;

  for (int window : windows) {
    if (window <= 0 || buffer.size() < static_cast<std::size_t>(window)) {
      continue;
    }
    any = true;

    const std::vector<int> bits = buffer.Bits(static_cast<std::size_t>(window));
    const auto big = std::count(bits.begin(), bits.end(), 1);
    const double ratio = static_cast<double>(big) / window;
    const double conf = std::abs(ratio - 0.5) * 2.0;
    const double weight = 1.0 / window;

    if (2 * big >= window) {
      big_score += conf * weight;
    } else {
      small_score += conf * weight;
    }
  }

  if (!any) {
    return {Label::Big, 0.50, "frequency_insufficient"};
  }

  const double total = big_score + small_score;
  const double final_conf =
      total > 0.0 ? std::max(big_score, small_score) / total : 0.5;
  return {big_score > small_score ? Label::Big : Label::Small,
          std::min(final_conf + 0.05, kFrequencyCap), "frequency"};
}

ModelOutput PredictTrend(const TrendWindows& windows) {
  const double short_ratio = BigRatio(windows.short_term);
  const double medium_ratio = BigRatio(windows.medium_term);
  const double long_ratio = BigRatio(windows.long_term);

  const double deviation = std::abs(short_ratio - medium_ratio);

  Label label;
  double conf;
  if (deviation > 0.3) {
    // Momentum reversal: bet against the short-term excursion.
    label = short_ratio > medium_ratio ? Label::Small : Label::Big;
    conf = std::min(deviation + 0.20, 0.75);
  } else {
    const double blend =
        short_ratio * 0.5 + medium_ratio * 0.3 + long_ratio * 0.2;
    label = blend >= 0.5 ? Label::Big : Label::Small;
    conf = std::abs(blend - 0.5) * 2.0 + 0.05;
  }

  return {label, std::clamp(conf, kTrendFloor, kTrendCap), "trend"};
}

ModelOutput PredictQuantum(const DataBuffer& buffer,
                           const MarketState& market) {
  const std::vector<int> bits = buffer.Bits();
  const double p_big = bits.empty() ? 0.5 : BigRatio(bits);

  const double amp_big = std::sqrt(p_big);
  const double decoherence = 1.0 - market.entropy;
  const double observed_p =
      amp_big * amp_big * decoherence + 0.5 * (1.0 - decoherence);

  const double conf = std::abs(observed_p - 0.5) * 2.0 + 0.05;
  return {observed_p >= 0.5 ? Label::Big : Label::Small,
          std::min(conf, kQuantumCap), "quantum"};
}

}  // namespace drawcast
