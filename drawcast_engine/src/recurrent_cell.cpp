#include "drawcast/recurrent_cell.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace drawcast {

double Sigmoid(double x) {
  if (x > 700.0) return 1.0;
  if (x < -700.0) return 0.0;
  return 1.0 / (1.0 + std::exp(-x));
}

double RecurrentCell::Gate::Affine(int j,
                                   const std::vector<double>& x,
                                   const std::vector<double>& h_prev) const {
  const std::size_t nx = x.size();
  const std::size_t nh = h_prev.size();
  const std::size_t row = static_cast<std::size_t>(j);

  double acc = b[row];
  for (std::size_t i = 0; i < nx; ++i) acc += w[row * nx + i] * x[i];
  for (std::size_t i = 0; i < nh; ++i) acc += u[row * nh + i] * h_prev[i];
  return acc;
}

RecurrentCell::RecurrentCell(int input_size, int hidden_size,
                             std::uint32_t seed)
    : input_size_(input_size), hidden_size_(hidden_size) {
  if (input_size_ <= 0 || hidden_size_ <= 0) {
    throw std::invalid_argument("RecurrentCell: sizes must be positive");
  }

  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> init(-0.1, 0.1);

  const auto nx = static_cast<std::size_t>(input_size_);
  const auto nh = static_cast<std::size_t>(hidden_size_);

  for (Gate* g : {&input_gate_, &forget_gate_, &output_gate_, &candidate_}) {
    g->w.resize(nh * nx);
    g->u.resize(nh * nh);
    g->b.assign(nh, 0.0);
    for (double& v : g->w) v = init(gen);
    for (double& v : g->u) v = init(gen);
  }

  hidden_.assign(nh, 0.0);
  cell_.assign(nh, 0.0);
}

const std::vector<double>& RecurrentCell::Forward(
    const std::vector<double>& input) {
  if (input.size() != static_cast<std::size_t>(input_size_)) {
    throw std::invalid_argument("RecurrentCell::Forward: expected " +
                                std::to_string(input_size_) + " inputs, got " +
                                std::to_string(input.size()));
  }

  const std::vector<double> h_prev = hidden_;
  const std::vector<double> c_prev = cell_;

  for (int j = 0; j < hidden_size_; ++j) {
    const auto k = static_cast<std::size_t>(j);
    const double i_g = Sigmoid(input_gate_.Affine(j, input, h_prev));
    const double f_g = Sigmoid(forget_gate_.Affine(j, input, h_prev));
    const double c_tilde = std::tanh(candidate_.Affine(j, input, h_prev));
    const double o_g = Sigmoid(output_gate_.Affine(j, input, h_prev));

    cell_[k] = f_g * c_prev[k] + i_g * c_tilde;
    hidden_[k] = o_g * std::tanh(cell_[k]);
  }
  return hidden_;
}

ModelOutput PredictRecurrent(const DataBuffer& buffer,
                             std::unique_ptr<RecurrentCell>& cell,
                             const RecurrentParams& params) {
  const auto n_in = static_cast<std::size_t>(params.input_size);
  if (buffer.size() < n_in) {
    return {Label::Big, 0.50, "lstm_insufficient"};
  }

  if (!cell) {
    cell = std::make_unique<RecurrentCell>(params.input_size,
                                           params.hidden_size, params.seed);
    return {Label::Big, 0.50, "lstm_uninitialized"};
  }

  const std::vector<int> bits = buffer.Bits(n_in);
  const std::vector<double> x(bits.begin(), bits.end());

  const std::vector<double>& h = cell->Forward(x);
  const double mean_h =
      std::accumulate(h.begin(), h.end(), 0.0) / static_cast<double>(h.size());
  const double p = Sigmoid(mean_h);
  const double conf = std::abs(p - 0.5) * 2.0;

  return {p >= 0.5 ? Label::Big : Label::Small, std::min(conf + 0.10, 0.80),
          "lstm"};
}

}  // namespace drawcast
