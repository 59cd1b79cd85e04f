#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "drawcast/data_buffer.hpp"
#include "drawcast/outcome_types.hpp"

namespace drawcast::testing {

// "2025010110001" + 4-digit draw index.
inline std::string PeriodAt(int index) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%04d", index);
  return std::string("2025010110001") + buf;
}

// Records for `digits` given newest first; the newest gets the highest index.
inline std::vector<OutcomeRecord> NewestFirst(const std::vector<int>& digits,
                                              int first_index = 1) {
  std::vector<OutcomeRecord> out;
  out.reserve(digits.size());
  const int n = static_cast<int>(digits.size());
  for (int i = 0; i < n; ++i) {
    out.push_back(MakeOutcome(PeriodAt(first_index + n - 1 - i),
                              digits[static_cast<std::size_t>(i)]));
  }
  return out;
}

// Buffer whose Digits() equals `digits` (newest first).
inline DataBuffer BufferFromDigits(const std::vector<int>& digits,
                                   std::size_t capacity = 200) {
  auto newest_first = NewestFirst(digits);
  std::vector<OutcomeRecord> arrival(newest_first.rbegin(),
                                     newest_first.rend());
  DataBuffer buf(capacity);
  buf.Ingest(arrival);
  return buf;
}

inline std::vector<int> Repeat(const std::vector<int>& cycle, std::size_t n) {
  std::vector<int> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) out.push_back(cycle[i % cycle.size()]);
  return out;
}

// Deterministic digit stream (LCG), newest first.
inline std::vector<int> ScrambledDigits(std::size_t n, unsigned seed = 7) {
  std::vector<int> out;
  out.reserve(n);
  unsigned x = seed;
  for (std::size_t i = 0; i < n; ++i) {
    x = x * 1103515245u + 12345u;
    out.push_back(static_cast<int>((x >> 16) % 10));
  }
  return out;
}

// Unique path under the system temp dir, removed on destruction.
class TempPath {
 public:
  explicit TempPath(const std::string& name)
      : path_(std::filesystem::temp_directory_path() /
              ("drawcast_test_" + name)) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  std::string str() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace drawcast::testing
