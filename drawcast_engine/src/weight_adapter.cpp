#include "drawcast/weight_adapter.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace drawcast {

WeightAdapter::WeightAdapter(ModelWeights initial, bool verbose)
    : weights_(std::move(initial)), verbose_(verbose) {
  for (const auto& kv : weights_) {
    performance_.emplace(kv.first, ModelPerformance{});
  }
}

bool WeightAdapter::Update(std::string_view model, bool was_correct) {
  auto perf_it = performance_.find(model);
  if (perf_it == performance_.end()) return false;

  ModelPerformance& perf = perf_it->second;
  ++perf.total;
  if (was_correct) ++perf.wins;
  perf.recent_accuracy = perf.recent_accuracy * kAccuracyDecay +
                         (was_correct ? 1.0 : 0.0) * (1.0 - kAccuracyDecay);

  double acc_sum = 0.0;
  for (const auto& [name, p] : performance_) acc_sum += p.recent_accuracy;

  // Blend each live weight towards its accuracy share.
  const double n = static_cast<double>(performance_.size());
  for (const auto& [name, p] : performance_) {
    const double target = acc_sum > 0.0 ? p.recent_accuracy / acc_sum : 1.0 / n;
    double& w = weights_[name];
    w = w * kKeepShare + target * (1.0 - kKeepShare);
  }

  double w_sum = 0.0;
  for (const auto& [name, w] : weights_) w_sum += w;
  for (auto& [name, w] : weights_) {
    w = w_sum > 0.0 ? w / w_sum : kUniformWeight;
  }

  if (verbose_) {
    // Formatted locally so std::cout keeps its own float format.
    std::ostringstream line;
    line << "  [weights] " << model << " -> " << std::fixed
         << std::setprecision(1) << weights_.find(model)->second * 100.0
         << "%\n";
    std::cout << line.str();
  }
  return true;
}

double WeightAdapter::WeightOf(std::string_view model, double fallback) const {
  auto it = weights_.find(model);
  return it == weights_.end() ? fallback : it->second;
}

}  // namespace drawcast
