// decision_writer.cpp
//
// Parquet ledger of resolved predictions and the JSON weights snapshot.

#include <arrow/io/api.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "drawcast/arrow_utils.hpp"
#include "drawcast/decision_sink.hpp"

using nlohmann::json;
namespace fs = std::filesystem;

namespace drawcast {

namespace {

void EnsureParentDir(const std::string& path) {
  fs::path parent = fs::path(path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("create directory failed: " + parent.string() +
                             ": " + ec.message());
  }
}

}  // namespace

ParquetDecisionWriter::ParquetDecisionWriter(const std::string& out_path,
                                             int64_t batch_rows)
    : idb_(arrow::default_memory_pool()),
      periodb_(arrow::default_memory_pool()),
      predb_(arrow::default_memory_pool()),
      actualb_(arrow::default_memory_pool()),
      statusb_(arrow::default_memory_pool()),
      tierb_(arrow::default_memory_pool()),
      marketb_(arrow::default_memory_pool()),
      recoveryb_(arrow::default_memory_pool()),
      digitb_(arrow::default_memory_pool()),
      confb_(arrow::default_memory_pool()),
      agreeb_(arrow::default_memory_pool()),
      createdb_(arrow::default_memory_pool()),
      resolvedb_(arrow::default_memory_pool()),
      batch_limit_(batch_rows > 0 ? batch_rows : kDefaultBatch) {
  schema_ = arrow::schema({
      arrow::field("id", arrow::uint64()),
      arrow::field("period", arrow::utf8()),
      arrow::field("prediction", arrow::utf8()),
      arrow::field("actual", arrow::utf8()),
      arrow::field("actual_digit", arrow::int32()),
      arrow::field("status", arrow::utf8()),
      arrow::field("confidence", arrow::float64()),
      arrow::field("tier", arrow::utf8()),
      arrow::field("agreement", arrow::float64()),
      arrow::field("market_condition", arrow::utf8()),
      arrow::field("recovery_mode", arrow::utf8()),
      arrow::field("created_at_ms", arrow::uint64()),
      arrow::field("resolved_at_ms", arrow::uint64()),
  });

  EnsureParentDir(out_path);

  auto of_res = arrow::io::FileOutputStream::Open(out_path);
  if (!of_res.ok()) {
    throw std::runtime_error("open output failed: " +
                             of_res.status().ToString());
  }
  auto outfile = *of_res;

  auto fw_res = parquet::arrow::FileWriter::Open(
      *schema_, arrow::default_memory_pool(), outfile);
  if (!fw_res.ok()) {
    throw std::runtime_error("create writer failed: " +
                             fw_res.status().ToString());
  }
  writer_ = std::move(fw_res).ValueOrDie();
}

ParquetDecisionWriter::~ParquetDecisionWriter() {
  // Errors are only reported here; call close() to have them thrown.
  if (!closed_) {
    try {
      close();
    } catch (const std::exception& e) {
      std::fprintf(stderr, "ParquetDecisionWriter: close failed: %s\n",
                   e.what());
    }
  }
}

void ParquetDecisionWriter::OnDecision(const PredictionRecord&,
                                       const ModelWeights&) {
  ++decisions_seen_;
}

void ParquetDecisionWriter::OnResolution(const PredictionRecord& rec,
                                         const EngineStats&,
                                         const ModelWeights&) {
  if (rec.status == PredictionStatus::Pending) return;
  append(rec);
}

void ParquetDecisionWriter::append(const PredictionRecord& rec) {
  if (closed_) throw std::runtime_error("ParquetDecisionWriter: closed");

  const EnsembleDecision& d = rec.decision;
  ARROW_OK(idb_.Append(rec.id));
  ARROW_OK(periodb_.Append(rec.period));
  ARROW_OK(predb_.Append(LabelName(d.label)));
  if (rec.actual) {
    ARROW_OK(actualb_.Append(LabelName(*rec.actual)));
  } else {
    ARROW_OK(actualb_.AppendNull());
  }
  ARROW_OK(digitb_.Append(rec.actual_digit));
  ARROW_OK(statusb_.Append(PredictionStatusName(rec.status)));
  ARROW_OK(confb_.Append(d.confidence));
  ARROW_OK(tierb_.Append(TierName(d.tier)));
  ARROW_OK(agreeb_.Append(d.agreement));
  ARROW_OK(marketb_.Append(TrendLabelName(d.market_condition)));
  ARROW_OK(recoveryb_.Append(RecoveryModeName(d.recovery_mode)));
  ARROW_OK(createdb_.Append(rec.created_at_ms));
  ARROW_OK(resolvedb_.Append(rec.resolved_at_ms));

  if (++batch_rows_ >= batch_limit_) {
    flush_batch();
  }
}

void ParquetDecisionWriter::close() {
  if (closed_) return;
  flush_batch();
  closed_ = true;
  if (writer_) {
    ARROW_OK(writer_->Close());
  }
}

void ParquetDecisionWriter::flush_batch() {
  if (batch_rows_ == 0) return;

  auto batch = arrow::RecordBatch::Make(schema_, batch_rows_,
                                        {
                                            idb_.Finish().ValueOrDie(),
                                            periodb_.Finish().ValueOrDie(),
                                            predb_.Finish().ValueOrDie(),
                                            actualb_.Finish().ValueOrDie(),
                                            digitb_.Finish().ValueOrDie(),
                                            statusb_.Finish().ValueOrDie(),
                                            confb_.Finish().ValueOrDie(),
                                            tierb_.Finish().ValueOrDie(),
                                            agreeb_.Finish().ValueOrDie(),
                                            marketb_.Finish().ValueOrDie(),
                                            recoveryb_.Finish().ValueOrDie(),
                                            createdb_.Finish().ValueOrDie(),
                                            resolvedb_.Finish().ValueOrDie(),
                                        });

  ARROW_OK(writer_->WriteRecordBatch(*batch));
  total_rows_ += static_cast<uint64_t>(batch_rows_);
  batch_rows_ = 0;
}

json DecisionToJson(const EnsembleDecision& d) {
  json j;
  j["prediction"] = LabelName(d.label);
  j["raw_prediction"] = LabelName(d.raw_label);
  j["confidence"] = d.confidence;
  j["confidence_percent"] = d.confidence_percent;
  j["raw_confidence"] = d.raw_confidence;
  j["tier"] = TierName(d.tier);
  j["recommendation"] = d.recommendation;
  j["agreement"] = d.agreement;
  j["agreement_percent"] = d.agreement_percent;
  j["market_condition"] = TrendLabelName(d.market_condition);
  j["recovery_mode"] = RecoveryModeName(d.recovery_mode);
  j["reasoning"] = d.reasoning;

  json models = json::object();
  for (const auto& v : d.model_outputs) {
    models[ModelName(v.model)] = {
        {"prediction", LabelName(v.output.label)},
        {"confidence", v.output.confidence},
        {"source", v.output.source},
    };
  }
  j["models"] = std::move(models);

  json weights = json::object();
  for (const auto& kv : d.weights) weights[kv.first] = kv.second;
  j["weights"] = std::move(weights);
  return j;
}

json WeightsSnapshotToJson(const ModelWeights& weights,
                           const PerformanceTable& performance,
                           const EngineStats& stats) {
  json j;
  json jw = json::object();
  for (const auto& kv : weights) jw[kv.first] = kv.second;
  j["weights"] = std::move(jw);

  json jp = json::object();
  for (const auto& kv : performance) {
    jp[kv.first] = {
        {"wins", kv.second.wins},
        {"total", kv.second.total},
        {"recent_accuracy", kv.second.recent_accuracy},
    };
  }
  j["performance"] = std::move(jp);

  j["stats"] = {
      {"total_predictions", stats.total_predictions},
      {"total_wins", stats.total_wins},
      {"total_losses", stats.total_losses},
      {"consecutive_wins", stats.consecutive_wins},
      {"consecutive_losses", stats.consecutive_losses},
      {"win_rate", stats.win_rate()},
  };
  return j;
}

void WriteWeightsSnapshot(const std::string& path,
                          const ModelWeights& weights,
                          const PerformanceTable& performance,
                          const EngineStats& stats) {
  EnsureParentDir(path);
  std::ofstream ofs(path);
  if (!ofs.is_open()) {
    throw std::runtime_error("cannot open weights snapshot output: " + path);
  }
  ofs << WeightsSnapshotToJson(weights, performance, stats).dump(2) << "\n";
  if (!ofs) {
    throw std::runtime_error("failed writing weights snapshot: " + path);
  }
}

}  // namespace drawcast
