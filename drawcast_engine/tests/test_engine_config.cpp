#include <catch2/catch.hpp>

#include <fstream>

#include "drawcast/engine_config.hpp"
#include "test_helpers.hpp"

using namespace drawcast;
using drawcast::testing::TempPath;
using nlohmann::json;

TEST_CASE("Shipped engine_params.json matches the built-in defaults",
          "[config]") {
  const EngineConfig file_cfg =
      LoadEngineConfig(std::string(DRAWCAST_CONFIG_DIR) + "/engine_params.json");
  CHECK(EngineConfigToJson(file_cfg) == EngineConfigToJson(EngineConfig{}));

  CHECK(file_cfg.buffer_capacity == 200);
  CHECK(file_cfg.min_records_for_prediction == 100);
  CHECK(file_cfg.retrain_interval_ms == 180000u);
  CHECK(file_cfg.pattern_lengths == std::vector<int>{3, 4, 5, 6, 7, 8});
  CHECK(file_cfg.initial_weights.at("neural") == Approx(0.20));
}

TEST_CASE("Partial documents override only the keys they name", "[config]") {
  const json j = {
      {"markov_order", 2},
      {"verbose", true},
      {"initial_weights", {{"neural", 0.3}}},
      {"some_future_key", "ignored"},
  };
  const EngineConfig cfg = EngineConfigFromJson(j);

  CHECK(cfg.markov_order == 2);
  CHECK(cfg.verbose);
  CHECK(cfg.initial_weights.at("neural") == Approx(0.3));
  CHECK(cfg.initial_weights.at("pattern") == Approx(0.15));
  CHECK(cfg.initial_weights.size() == 6);
  CHECK(cfg.buffer_capacity == 200);
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
  CHECK_THROWS_AS(EngineConfigFromJson(json::array()), std::runtime_error);
  CHECK_THROWS_AS(EngineConfigFromJson({{"markov_order", 0}}),
                  std::runtime_error);
  CHECK_THROWS_AS(EngineConfigFromJson({{"markov_order", "three"}}),
                  std::runtime_error);
  CHECK_THROWS_AS(EngineConfigFromJson({{"buffer_capacity", 0}}),
                  std::runtime_error);
  CHECK_THROWS_AS(EngineConfigFromJson({{"frequency_windows", json::array()}}),
                  std::runtime_error);
  CHECK_THROWS_AS(
      EngineConfigFromJson({{"initial_weights", {{"trend", -0.1}}}}),
      std::runtime_error);
  CHECK_THROWS_AS(EngineConfigFromJson({{"initial_weights", 1.0}}),
                  std::runtime_error);
}

TEST_CASE("Config file errors are reported as runtime errors", "[config]") {
  CHECK_THROWS_AS(LoadEngineConfig("/nonexistent/engine_params.json"),
                  std::runtime_error);

  TempPath path("bad_config.json");
  {
    std::ofstream out(path.str());
    out << "{ \"markov_order\": ";
  }
  CHECK_THROWS_AS(LoadEngineConfig(path.str()), std::runtime_error);
}

TEST_CASE("Serialized config loads back unchanged", "[config]") {
  EngineConfig cfg;
  cfg.pattern_lengths = {4, 6};
  cfg.lstm_seed = 7;
  cfg.initial_weights["trend"] = 0.5;

  const EngineConfig back = EngineConfigFromJson(EngineConfigToJson(cfg));
  CHECK(back.pattern_lengths == cfg.pattern_lengths);
  CHECK(back.lstm_seed == 7u);
  CHECK(back.initial_weights == cfg.initial_weights);
}
