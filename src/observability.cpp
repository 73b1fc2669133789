#include "insight/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace insight {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<PipelineEventHook> g_event_hook{nullptr};

std::mutex g_log_path_mu;
bool g_log_path_overridden = false;
std::string g_log_path;

// Serializes stderr lines and event-log appends across threads.
std::mutex g_sink_mu;

}  // namespace

// ---------------------------------------------------------------------------
// PipelineEvent
// ---------------------------------------------------------------------------

std::string event_to_json(const PipelineEvent& ev) {
  jsonlite::Object o;
  o["job_id"] = ev.job_id;
  o["category"] = ev.category;
  o["transition"] = ev.transition;
  o["state"] = to_string(ev.state);
  o["ok"] = ev.ok();
  o["error_code"] = to_string(ev.error);
  o["error_class"] = to_string(error_class(ev.error));
  o["epsilon"] = epsilon_to_json(ev.epsilon);
  o["duration_ns"] = ev.duration_ns;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  const double ps[] = {0.50, 0.95, 0.99};
  const char* names[] = {"p50_ms", "p95_ms", "p99_ms"};
  for (size_t i = 0; i < 3; ++i) {
    out += ",\"";
    out += names[i];
    out += "\":";
    std::snprintf(buf, sizeof(buf), "%.3f", percentile(ps[i]) / 1000.0);
    out += buf;
  }
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// PipelineStats
// ---------------------------------------------------------------------------

void PipelineStats::record_failure(ErrorCode code) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_[code];
}

uint64_t PipelineStats::failures_for(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  auto it = failures_.find(code);
  return it == failures_.end() ? 0 : it->second;
}

void PipelineStats::record_event(const PipelineEvent& ev) {
  if (ev.transition == "submit") {
    submissions.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok()) {
      admissions.fetch_add(1, std::memory_order_relaxed);
    } else if (error_class(ev.error) == ErrorClass::admission) {
      rejections.fetch_add(1, std::memory_order_relaxed);
    }
  }
  if (!ev.ok()) record_failure(ev.error);

  if (ev.error == ErrorCode::proof_rejected) proof_rejections.fetch_add(1, std::memory_order_relaxed);
  if (ev.error == ErrorCode::timeout) timeouts.fetch_add(1, std::memory_order_relaxed);
  if (ev.error == ErrorCode::cancelled) cancellations.fetch_add(1, std::memory_order_relaxed);

  // Only count transitions that actually moved a job into a terminal state.
  if (ev.job_id != 0 && ev.state == JobState::failed && !ev.ok() &&
      error_class(ev.error) != ErrorClass::transition) {
    jobs_failed.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.transition == "finalize" && ev.ok()) {
    jobs_verified.fetch_add(1, std::memory_order_relaxed);
    epsilon_committed_micros.fetch_add(ev.epsilon.micros(), std::memory_order_relaxed);
    job_latency.record(ev.duration_ns);
  }
}

std::string PipelineStats::to_json() const {
  jsonlite::Object o;
  auto ld = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };
  o["submissions"] = ld(submissions);
  o["admissions"] = ld(admissions);
  o["rejections"] = ld(rejections);
  o["jobs_verified"] = ld(jobs_verified);
  o["jobs_failed"] = ld(jobs_failed);
  o["proof_rejections"] = ld(proof_rejections);
  o["timeouts"] = ld(timeouts);
  o["cancellations"] = ld(cancellations);
  o["epsilon_committed"] = epsilon_to_json(Epsilon::from_micros(ld(epsilon_committed_micros)));

  jsonlite::Object challenges;
  challenges["issued"] = ld(challenges_issued);
  challenges["passed"] = ld(challenges_passed);
  challenges["failed"] = ld(challenges_failed);
  o["challenges"] = std::move(challenges);

  jsonlite::Object cas;
  cas["puts"] = ld(cas_puts);
  cas["gets"] = ld(cas_gets);
  cas["hits"] = ld(cas_hits);
  o["cas"] = std::move(cas);

  o["warnings"] = ld(warnings);

  jsonlite::Object failures;
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    for (const auto& [code, n] : failures_) failures[to_string(code)] = n;
  }
  o["failures"] = std::move(failures);

  // Histogram is already serialized; splice it in.
  std::string out = jsonlite::to_json(o);
  out.pop_back();
  out += ",\"job_latency\":" + job_latency.to_json() + "}";
  return out;
}

PipelineStats& global_pipeline_stats() {
  static PipelineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

void set_pipeline_event_hook(PipelineEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_path_mu);
  g_log_path_overridden = true;
  g_log_path = path;
}

std::string event_log_path() {
  std::lock_guard<std::mutex> lk(g_log_path_mu);
  if (g_log_path_overridden) return g_log_path;
  const char* env = std::getenv("INSIGHT_EVENT_LOG");
  return env ? std::string(env) : std::string();
}

void emit_pipeline_event(const PipelineEvent& ev) {
  global_pipeline_stats().record_event(ev);

  PipelineEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string path = event_log_path();
  if (path.empty()) return;

  const std::string line = event_to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void log_warning(const std::string& component, const std::string& message) {
  global_pipeline_stats().warnings.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::cerr << "[" << component << "] warning: " << message << "\n";
}

void log_info(const std::string& component, const std::string& message) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::cerr << "[" << component << "] " << message << "\n";
}

}  // namespace insight
