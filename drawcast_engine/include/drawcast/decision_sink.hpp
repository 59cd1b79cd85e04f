#pragma once

#include <arrow/api.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "drawcast/forecast_engine.hpp"
#include "drawcast/weight_adapter.hpp"

namespace drawcast {

// Receives ledger events from the replay/serving loop.
class DecisionSink {
 public:
  virtual ~DecisionSink() = default;

  // A new forecast was issued.
  virtual void OnDecision(const PredictionRecord& rec,
                          const ModelWeights& weights) = 0;

  // A pending forecast was scored against the actual draw.
  virtual void OnResolution(const PredictionRecord& rec,
                            const EngineStats& stats,
                            const ModelWeights& weights) = 0;
};

// Writes one row per resolved prediction into a parquet file.
class ParquetDecisionWriter : public DecisionSink {
 public:
  explicit ParquetDecisionWriter(const std::string& out_path,
                                 int64_t batch_rows = kDefaultBatch);
  ~ParquetDecisionWriter() override;

  ParquetDecisionWriter(const ParquetDecisionWriter&) = delete;
  ParquetDecisionWriter& operator=(const ParquetDecisionWriter&) = delete;

  void OnDecision(const PredictionRecord& rec,
                  const ModelWeights& weights) override;
  void OnResolution(const PredictionRecord& rec,
                    const EngineStats& stats,
                    const ModelWeights& weights) override;

  // Flush buffered rows and close the file. Idempotent.
  void close();

  uint64_t total_rows() const { return total_rows_; }
  uint64_t decisions_seen() const { return decisions_seen_; }

  static constexpr int64_t kDefaultBatch = 4096;

 private:
  void append(const PredictionRecord& rec);
  void flush_batch();

  std::shared_ptr<arrow::Schema> schema_;
  std::unique_ptr<parquet::arrow::FileWriter> writer_;
  bool closed_ = false;

  // Column builders
  arrow::UInt64Builder idb_;
  arrow::StringBuilder periodb_, predb_, actualb_, statusb_, tierb_, marketb_,
      recoveryb_;
  arrow::Int32Builder digitb_;
  arrow::DoubleBuilder confb_, agreeb_;
  arrow::UInt64Builder createdb_, resolvedb_;

  int64_t batch_limit_;
  int64_t batch_rows_ = 0;
  uint64_t total_rows_ = 0;
  uint64_t decisions_seen_ = 0;
};

nlohmann::json DecisionToJson(const EnsembleDecision& d);

// Weights, per-model performance and ledger stats as one JSON document.
nlohmann::json WeightsSnapshotToJson(const ModelWeights& weights,
                                     const PerformanceTable& performance,
                                     const EngineStats& stats);

// Throws std::runtime_error if the file can't be written.
void WriteWeightsSnapshot(const std::string& path,
                          const ModelWeights& weights,
                          const PerformanceTable& performance,
                          const EngineStats& stats);

}  // namespace drawcast
