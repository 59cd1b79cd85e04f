#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace drawcast {

struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration;
};

// Process-wide list of named step durations (training passes, predictions,
// replay steps).
class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void Add(std::string name, std::chrono::steady_clock::duration d);

  // Copy taken under the lock; safe while other threads keep adding.
  std::vector<TimingEntry> Entries() const;

  // Total duration recorded under `name`.
  std::chrono::steady_clock::duration Total(const std::string& name) const;

 private:
  TimingRegistry() = default;

  mutable std::mutex mu_;
  std::vector<TimingEntry> entries_;
};

class ScopeTimer {
 public:
  explicit ScopeTimer(std::string name)
      : name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopeTimer() {
    const auto end = std::chrono::steady_clock::now();
    TimingRegistry::Instance().Add(name_, end - start_);
  }

  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

#define DRAWCAST_CONCAT_INNER(a, b) a##b
#define DRAWCAST_CONCAT(a, b) DRAWCAST_CONCAT_INNER(a, b)

/// Helper macro so you can write: DRAWCAST_SCOPE_TIMER("step_name");
#define DRAWCAST_SCOPE_TIMER(label) \
  ::drawcast::ScopeTimer DRAWCAST_CONCAT(drawcast_scope_timer_, __LINE__)(label)

/// Append a timing report for the current run to a log file.
///
/// Entries recorded under the same name are summed into one row with a call
/// count, so per-step timers from a long replay stay readable.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       bool append = true);

}  // namespace drawcast
