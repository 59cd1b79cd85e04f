// feed_source.cpp
//
// Draw validation, history loaders (Parquet via Arrow, gzip CSV via zlib) and
// the replay feed used by run_replay and the tests.

#include "drawcast/feed_source.hpp"

#include <zlib.h>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <string_view>
#include <system_error>
#include <unordered_set>

#include "drawcast/arrow_utils.hpp"
#include "drawcast/period_utils.hpp"

namespace drawcast {

namespace {

bool ParseDigit(std::string_view s, int& out) {
  const char* b = s.data();
  const char* e = b + s.size();
  int v = 0;
  auto r = std::from_chars(b, e, v);
  if (r.ec != std::errc() || r.ptr != e) return false;
  if (v < 0 || v > 9) return false;
  out = v;
  return true;
}

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Line reader over a gzip stream.
struct GzLine {
  gzFile f{nullptr};
  std::string buf;
  explicit GzLine(const std::string& path) {
    f = gzopen(path.c_str(), "rb");
    if (f) gzbuffer(f, 1 << 16);
    buf.resize(1 << 12);
  }
  ~GzLine() {
    if (f) gzclose(f);
  }
  GzLine(const GzLine&) = delete;
  GzLine& operator=(const GzLine&) = delete;

  bool good() const { return f != nullptr; }

  bool getline(std::string& out) {
    out.clear();
    if (!f) return false;
    for (;;) {
      char* r = gzgets(f, buf.data(), static_cast<int>(buf.size()));
      if (!r) return !out.empty();
      std::size_t n = std::strlen(r);
      if (n && r[n - 1] == '\n') {
        out.append(r, n - 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
      }
      out.append(r, n);
    }
  }
};

}  // namespace

std::vector<OutcomeRecord> ValidateRawRecords(const std::vector<RawRecord>& raw,
                                              uint64_t observed_at_ms) {
  std::vector<OutcomeRecord> out;
  out.reserve(raw.size());
  std::unordered_set<std::string> seen;

  for (const auto& r : raw) {
    if (!is_period_id(r.period_id)) continue;
    int digit = 0;
    if (!ParseDigit(r.number, digit)) continue;
    if (!seen.insert(r.period_id).second) continue;
    out.push_back(MakeOutcome(r.period_id, digit, observed_at_ms));
  }
  return out;
}

std::vector<RawRecord> LoadHistoryParquet(const std::string& path) {
  std::shared_ptr<arrow::Schema> schema;
  auto reader = open_parquet_reader(path, schema);

  std::shared_ptr<arrow::Table> table;
  ARROW_OK(reader->ReadTable(&table));
  auto combined = table->CombineChunks(arrow::default_memory_pool());
  if (!combined.ok()) {
    throw std::runtime_error("combine chunks failed: " +
                             combined.status().ToString());
  }
  table = std::move(combined).ValueOrDie();

  auto period_col = table->GetColumnByName("period");
  auto number_col = table->GetColumnByName("number");
  if (!period_col || !number_col) {
    throw std::runtime_error("history parquet missing 'period' or 'number': " +
                             path);
  }

  std::vector<RawRecord> rows;
  rows.reserve(static_cast<std::size_t>(table->num_rows()));
  for (int c = 0; c < period_col->num_chunks(); ++c) {
    auto periods = period_col->chunk(c);
    auto numbers = number_col->chunk(c);
    for (int64_t i = 0; i < periods->length(); ++i) {
      if (periods->IsNull(i) || numbers->IsNull(i)) continue;
      rows.push_back({ValueAt<std::string>(periods, i),
                      std::to_string(ValueAt<int64_t>(numbers, i))});
    }
  }
  return rows;
}

std::vector<RawRecord> LoadHistoryCsvGz(const std::string& path) {
  GzLine gz(path);
  if (!gz.good()) throw std::runtime_error("open gzip failed: " + path);

  std::string line;
  if (!gz.getline(line)) {
    throw std::runtime_error("empty history file: " + path);
  }
  if (line != "period,number") {
    throw std::runtime_error("unexpected history header '" + line +
                             "' in " + path);
  }

  std::vector<RawRecord> rows;
  while (gz.getline(line)) {
    if (line.empty()) continue;
    auto comma = line.find(',');
    if (comma == std::string::npos) {
      rows.push_back({line, ""});
      continue;
    }
    rows.push_back({line.substr(0, comma), line.substr(comma + 1)});
  }
  return rows;
}

std::vector<RawRecord> LoadHistory(const std::string& path) {
  if (EndsWith(path, ".parquet")) return LoadHistoryParquet(path);
  if (EndsWith(path, ".csv.gz")) return LoadHistoryCsvGz(path);
  throw std::runtime_error("unsupported history format (want .parquet or "
                           ".csv.gz): " + path);
}

HistoryReplayFeed::HistoryReplayFeed(const std::vector<RawRecord>& history,
                                     std::size_t window)
    : history_(ValidateRawRecords(history, 0)), window_(window) {
  if (window_ == 0) {
    throw std::invalid_argument("HistoryReplayFeed: window must be > 0");
  }
}

std::vector<OutcomeRecord> HistoryReplayFeed::FetchLatest(uint64_t now_ms) {
  if (revealed_ == 0) {
    revealed_ = std::min(window_, history_.size());
  } else if (!Exhausted()) {
    ++revealed_;
  }

  const std::size_t first = revealed_ > window_ ? revealed_ - window_ : 0;
  std::vector<OutcomeRecord> page;
  page.reserve(revealed_ - first);
  for (std::size_t i = revealed_; i-- > first;) {
    OutcomeRecord r = history_[i];
    r.observed_at_ms = now_ms;
    page.push_back(std::move(r));
  }
  return page;
}

std::string HistoryReplayFeed::LatestPeriod() const {
  return revealed_ == 0 ? std::string() : history_[revealed_ - 1].period_id;
}

}  // namespace drawcast
