// engine_config.cpp
//
// JSON (de)serialization of EngineConfig. Unknown keys are ignored.

#include "drawcast/engine_config.hpp"

#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace drawcast {

EngineConfig EngineConfigFromJson(const json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("engine config: top level must be an object");
  }

  EngineConfig cfg;
  try {
    cfg.buffer_capacity = j.value("buffer_capacity", cfg.buffer_capacity);
    cfg.min_records_for_prediction =
        j.value("min_records_for_prediction", cfg.min_records_for_prediction);
    cfg.model_update_after_predictions = j.value(
        "model_update_after_predictions", cfg.model_update_after_predictions);
    cfg.retrain_interval_ms =
        j.value("retrain_interval_ms", cfg.retrain_interval_ms);
    cfg.pattern_lengths = j.value("pattern_lengths", cfg.pattern_lengths);
    cfg.markov_order = j.value("markov_order", cfg.markov_order);
    cfg.frequency_windows =
        j.value("frequency_windows", cfg.frequency_windows);
    cfg.lstm_input_size = j.value("lstm_input_size", cfg.lstm_input_size);
    cfg.lstm_hidden_size = j.value("lstm_hidden_size", cfg.lstm_hidden_size);
    cfg.lstm_seed = j.value("lstm_seed", cfg.lstm_seed);
    cfg.default_model_weight =
        j.value("default_model_weight", cfg.default_model_weight);
    cfg.max_history = j.value("max_history", cfg.max_history);
    cfg.verbose = j.value("verbose", cfg.verbose);

    // A partial weight object overrides only the models it names.
    if (j.contains("initial_weights")) {
      const auto& jw = j.at("initial_weights");
      if (!jw.is_object()) {
        throw std::runtime_error("'initial_weights' must be an object");
      }
      for (auto it = jw.begin(); it != jw.end(); ++it) {
        cfg.initial_weights[it.key()] = it.value().get<double>();
      }
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("engine config: ") + e.what());
  }

  ValidateEngineConfig(cfg);
  return cfg;
}

EngineConfig LoadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open engine config: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Failed to parse engine config " + path + ": " +
                             e.what());
  }
  return EngineConfigFromJson(j);
}

json EngineConfigToJson(const EngineConfig& cfg) {
  json j;
  j["buffer_capacity"] = cfg.buffer_capacity;
  j["min_records_for_prediction"] = cfg.min_records_for_prediction;
  j["model_update_after_predictions"] = cfg.model_update_after_predictions;
  j["retrain_interval_ms"] = cfg.retrain_interval_ms;
  j["pattern_lengths"] = cfg.pattern_lengths;
  j["markov_order"] = cfg.markov_order;
  j["frequency_windows"] = cfg.frequency_windows;
  j["lstm_input_size"] = cfg.lstm_input_size;
  j["lstm_hidden_size"] = cfg.lstm_hidden_size;
  j["lstm_seed"] = cfg.lstm_seed;
  j["default_model_weight"] = cfg.default_model_weight;
  j["initial_weights"] = cfg.initial_weights;
  j["max_history"] = cfg.max_history;
  j["verbose"] = cfg.verbose;
  return j;
}

void ValidateEngineConfig(const EngineConfig& cfg) {
  if (cfg.buffer_capacity == 0) {
    throw std::runtime_error("engine config: buffer_capacity must be > 0");
  }
  if (cfg.pattern_lengths.empty()) {
    throw std::runtime_error("engine config: pattern_lengths is empty");
  }
  for (int len : cfg.pattern_lengths) {
    if (len <= 0) {
      throw std::runtime_error("engine config: pattern length must be > 0");
    }
  }
  if (cfg.markov_order < 1) {
    throw std::runtime_error("engine config: markov_order must be >= 1");
  }
  if (cfg.frequency_windows.empty()) {
    throw std::runtime_error("engine config: frequency_windows is empty");
  }
  for (int w : cfg.frequency_windows) {
    if (w <= 0) {
      throw std::runtime_error("engine config: frequency window must be > 0");
    }
  }
  if (cfg.lstm_input_size <= 0 || cfg.lstm_hidden_size <= 0) {
    throw std::runtime_error("engine config: lstm sizes must be > 0");
  }
  if (cfg.model_update_after_predictions <= 0) {
    throw std::runtime_error(
        "engine config: model_update_after_predictions must be > 0");
  }
  if (cfg.initial_weights.empty()) {
    throw std::runtime_error("engine config: initial_weights is empty");
  }
  for (const auto& [name, w] : cfg.initial_weights) {
    if (w < 0.0) {
      throw std::runtime_error("engine config: negative weight for " + name);
    }
  }
  if (cfg.max_history == 0) {
    throw std::runtime_error("engine config: max_history must be > 0");
  }
}

}  // namespace drawcast
