#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/market_state.hpp"
#include "drawcast/model_tables.hpp"
#include "drawcast/outcome_types.hpp"

namespace drawcast {

// Ensemble members, in the order the aggregator runs them.
enum class ModelId { Pattern, Markov, Frequency, Neural, Trend, Quantum };

inline constexpr std::array<ModelId, 6> kAllModels = {
    ModelId::Pattern, ModelId::Markov, ModelId::Frequency,
    ModelId::Neural,  ModelId::Trend,  ModelId::Quantum};

// Weight-table key of a model ("pattern", "markov", ...).
const char* ModelName(ModelId id);
std::optional<ModelId> ModelFromName(std::string_view name);

// One model's vote. `source` tags which path produced it, e.g. "pattern" vs
// "pattern_fallback", so low-information fallbacks are identifiable.
struct ModelOutput {
  Label label = Label::Big;
  double confidence = 0.5;
  std::string source;
};

// Confidence caps documented per model.
constexpr double kFrequencyCap = 0.75;
constexpr double kTrendFloor = 0.52;
constexpr double kTrendCap = 0.78;
constexpr double kQuantumCap = 0.80;

// Longest-context lookup over the configured window lengths. Among lengths
// with a qualifying context (total >= 3), the strictly highest majority share
// wins; on a tie the first qualifying length tried (lengths are tried in the
// given order) is kept. Falls back to the majority of the newest 10 records
// at 0.52.
ModelOutput PredictPattern(const DataBuffer& buffer,
                           const PatternTable& table,
                           const std::vector<int>& window_lengths);

// Highest order first; first order whose context has total >= 2 wins.
// Fallback: the opposite of the newest label at 0.51.
ModelOutput PredictMarkov(const DataBuffer& buffer,
                          const MarkovTable& table,
                          int max_order);

// Inverse-window-weighted BIG ratio over windows that fit in the buffer.
ModelOutput PredictFrequency(const DataBuffer& buffer,
                             const std::vector<int>& windows);

ModelOutput PredictTrend(const TrendWindows& windows);

// Entropy-damped frequency signal: the empirical P(BIG) blended towards 0.5
// by the market's decoherence factor (1 - entropy).
ModelOutput PredictQuantum(const DataBuffer& buffer, const MarketState& market);

}  // namespace drawcast
