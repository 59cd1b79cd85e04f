#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/predictors.hpp"

namespace drawcast {

// Numerically guarded logistic: saturates to exactly 0/1 beyond |x| > 700.
double Sigmoid(double x);

// Gated recurrent cell (input/forget/output/candidate gates) with randomly
// initialised, never-trained weights.
//
// This is a heuristic signal generator, not a learned predictor: weights are
// fixed at construction (uniform in [-0.1, 0.1) from `seed`) and only the
// hidden/cell vectors evolve. Every Forward() call continues from the state
// left by the previous call, so the output depends on the whole call history.
class RecurrentCell {
 public:
  RecurrentCell(int input_size, int hidden_size, std::uint32_t seed);

  // Advance one step. `input` must have input_size() elements.
  const std::vector<double>& Forward(const std::vector<double>& input);

  const std::vector<double>& hidden() const { return hidden_; }
  const std::vector<double>& cell() const { return cell_; }
  int input_size() const { return input_size_; }
  int hidden_size() const { return hidden_size_; }

 private:
  // act(W x + U h_prev + b) pre-activation for one gate.
  struct Gate {
    std::vector<double> w;  // hidden x input, row-major
    std::vector<double> u;  // hidden x hidden, row-major
    std::vector<double> b;  // hidden

    double Affine(int j,
                  const std::vector<double>& x,
                  const std::vector<double>& h_prev) const;
  };

  int input_size_;
  int hidden_size_;

  Gate input_gate_;
  Gate forget_gate_;
  Gate output_gate_;
  Gate candidate_;

  std::vector<double> hidden_;
  std::vector<double> cell_;
};

struct RecurrentParams {
  int input_size = 20;
  int hidden_size = 15;
  std::uint32_t seed = 42;
};

// Ensemble member backed by a lazily created RecurrentCell.
//
//   - fewer than input_size bits: {BIG, 0.50, "lstm_insufficient"}
//   - first call with enough bits creates the cell and returns
//     {BIG, 0.50, "lstm_uninitialized"} without stepping it
//   - otherwise feeds the newest input_size bits through one step;
//     p = sigmoid(mean(hidden)), confidence = min(|p - 0.5| * 2 + 0.10, 0.80)
ModelOutput PredictRecurrent(const DataBuffer& buffer,
                             std::unique_ptr<RecurrentCell>& cell,
                             const RecurrentParams& params);

}  // namespace drawcast
