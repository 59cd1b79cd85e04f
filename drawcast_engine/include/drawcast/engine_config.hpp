#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drawcast {

// Tunables of the forecasting engine.
// Loaded from config/engine_params.json by LoadEngineConfig; every key is
// optional and falls back to the defaults below.
struct EngineConfig {
  // DataBuffer capacity (newest records kept).
  std::size_t buffer_capacity = 200;

  // Predict() refuses to issue a decision below this many buffered records.
  std::size_t min_records_for_prediction = 100;

  // Retrain after this many resolved predictions...
  int model_update_after_predictions = 10;
  // ...or when this much time passed since the last pass.
  std::uint64_t retrain_interval_ms = 180000;

  // Pattern model context lengths, tried in this order.
  std::vector<int> pattern_lengths = {3, 4, 5, 6, 7, 8};

  // Highest Markov order (tables hold orders 1..markov_order).
  int markov_order = 3;

  // Frequency model windows.
  std::vector<int> frequency_windows = {10, 20, 30};

  // Recurrent cell shape and weight seed.
  int lstm_input_size = 20;
  int lstm_hidden_size = 15;
  std::uint32_t lstm_seed = 42;

  // Weight used for a model missing from the weight table.
  double default_model_weight = 0.15;

  std::map<std::string, double> initial_weights = {
      {"pattern", 0.15}, {"markov", 0.15}, {"frequency", 0.15},
      {"neural", 0.20},  {"trend", 0.15},  {"quantum", 0.20}};

  // Ledger size (newest kept).
  std::size_t max_history = 500;

  // Per-update weight logging.
  bool verbose = false;
};

// Throws std::runtime_error if the file can't be opened, isn't valid JSON, or
// holds structurally invalid values.
EngineConfig LoadEngineConfig(const std::string& path);

// Same rules, from an already parsed document.
EngineConfig EngineConfigFromJson(const nlohmann::json& j);

nlohmann::json EngineConfigToJson(const EngineConfig& cfg);

// Throws std::runtime_error describing the first invalid field.
void ValidateEngineConfig(const EngineConfig& cfg);

}  // namespace drawcast
