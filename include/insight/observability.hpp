#pragma once

// insight/observability.hpp — Pipeline observability layer.
//
// DESIGN:
//   PipelineEvent is the canonical observable unit. Every job transition
//   (accepted or rejected) emits one PipelineEvent, which is:
//     - recorded in the process-wide PipelineStats (always),
//     - forwarded to a registered hook if one is set, otherwise
//     - appended as one JSON line to the event log, if a path is configured
//       (set_event_log_path() or INSIGHT_EVENT_LOG).
//
//   Operator warnings go to stderr as "[component] warning: message" and are
//   counted in PipelineStats::warnings.
//
// INVARIANT: emission never fails the transition that produced it. A log
// file that cannot be opened is skipped.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "insight/types.hpp"

namespace insight {

// ---------------------------------------------------------------------------
// PipelineEvent — per-transition observable unit
// ---------------------------------------------------------------------------
struct PipelineEvent {
  std::uint64_t job_id{0};       // 0 when no job was created (admission reject)
  std::string category;
  std::string transition;        // submit | begin_processing | submit_result |
                                 // finalize | cancel | timeout | restore
  JobState state{JobState::pending};
  ErrorCode error{ErrorCode::none};
  Epsilon epsilon;
  std::uint64_t duration_ns{0};  // for finalize: submit -> verified wall time

  bool ok() const { return error == ErrorCode::none; }
};

std::string event_to_json(const PipelineEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0: [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // up to ~6 days, enough for pending jobs

  void record(uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// PipelineStats — global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure histogram uses a mutex.
class PipelineStats {
 public:
  void record_event(const PipelineEvent& ev);
  void record_failure(ErrorCode code);
  uint64_t failures_for(ErrorCode code) const;
  std::string to_json() const;

  std::atomic<uint64_t> submissions{0};
  std::atomic<uint64_t> admissions{0};
  std::atomic<uint64_t> rejections{0};          // admission errors
  std::atomic<uint64_t> jobs_verified{0};
  std::atomic<uint64_t> jobs_failed{0};
  std::atomic<uint64_t> proof_rejections{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> cancellations{0};
  std::atomic<uint64_t> epsilon_committed_micros{0};

  std::atomic<uint64_t> challenges_issued{0};
  std::atomic<uint64_t> challenges_passed{0};
  std::atomic<uint64_t> challenges_failed{0};

  std::atomic<uint64_t> cas_puts{0};
  std::atomic<uint64_t> cas_gets{0};
  std::atomic<uint64_t> cas_hits{0};

  std::atomic<uint64_t> warnings{0};

  // submit -> verified
  LatencyHistogram job_latency;

 private:
  mutable std::mutex failure_mu_;
  std::map<ErrorCode, uint64_t> failures_;
};

PipelineStats& global_pipeline_stats();

// Emit a pipeline event (non-blocking for the caller's locks: call it after
// releasing job/ledger mutexes).
void emit_pipeline_event(const PipelineEvent& ev);

using PipelineEventHook = void (*)(const PipelineEvent&);
void set_pipeline_event_hook(PipelineEventHook hook);

// Overrides INSIGHT_EVENT_LOG. Empty string disables the file sink.
void set_event_log_path(const std::string& path);
std::string event_log_path();

// "[component] warning: message" on stderr.
void log_warning(const std::string& component, const std::string& message);
void log_info(const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace insight
