#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace drawcast {

// Model name -> ensemble weight. Sums to 1 after every WeightAdapter update.
using ModelWeights = std::map<std::string, double, std::less<>>;

struct ModelPerformance {
  std::uint64_t wins = 0;
  std::uint64_t total = 0;
  double recent_accuracy = 0.5;  // EWMA of correctness, decay 0.9
};

using PerformanceTable = std::map<std::string, ModelPerformance, std::less<>>;

// Online re-weighting from resolved outcomes.
//
// Per update of model m with correctness c in {0,1}:
//   acc_m  <- 0.9 * acc_m + 0.1 * c
//   target_k = acc_k / sum(acc)              for every model k
//   w_k    <- 0.7 * w_k + 0.3 * target_k
//   w      <- w / sum(w)   (every w_k = 0.15 when the sum is zero)
class WeightAdapter {
 public:
  static constexpr double kAccuracyDecay = 0.9;
  static constexpr double kKeepShare = 0.7;
  static constexpr double kUniformWeight = 0.15;

  explicit WeightAdapter(ModelWeights initial, bool verbose = false);

  // Returns false (and changes nothing) for an unknown model name.
  bool Update(std::string_view model, bool was_correct);

  double WeightOf(std::string_view model, double fallback) const;

  const ModelWeights& weights() const { return weights_; }
  const PerformanceTable& performance() const { return performance_; }

 private:
  ModelWeights weights_;
  PerformanceTable performance_;
  bool verbose_;
};

}  // namespace drawcast
