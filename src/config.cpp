#include "insight/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "insight/clock.hpp"

namespace insight {

namespace {

bool parse_u64(const std::string& text, uint64_t* out) {
  if (text.empty() || text[0] < '0' || text[0] > '9') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') return false;
  *out = v;
  return true;
}

bool valid_compression(const std::string& c) { return c == "off" || c == "zstd"; }

}  // namespace

std::string PipelineConfig::resolved_ledger_path() const {
  if (!ledger_path.empty()) return ledger_path;
  return storage_root + "/ledger.ndjson";
}

uint64_t PipelineConfig::budget_period_ms() const { return budget_period_days * kMsPerDay; }

jsonlite::Object config_to_json(const PipelineConfig& c) {
  jsonlite::Object o;
  o["storage_root"] = c.storage_root;
  o["ledger_path"] = c.resolved_ledger_path();
  o["event_log"] = c.event_log;
  o["budget_period_days"] = c.budget_period_days;
  o["processing_deadline_ms"] = c.processing_deadline_ms;
  o["pending_deadline_ms"] = c.pending_deadline_ms;
  o["max_dataset_bytes"] = c.max_dataset_bytes;
  o["cas_compression"] = c.cas_compression;
  o["watchdog_interval_ms"] = c.watchdog_interval_ms;
  o["possession_sweep_ms"] = c.possession_sweep_ms;
  jsonlite::Array fws;
  for (const auto& f : c.frameworks) fws.emplace_back(f.id);
  o["frameworks"] = std::move(fws);
  jsonlite::Array pols;
  for (const auto& p : c.policies) pols.emplace_back(p.category);
  o["policies"] = std::move(pols);
  jsonlite::Array circuits;
  for (const auto& [id, vk] : c.circuits) circuits.emplace_back(id);
  o["circuits"] = std::move(circuits);
  return o;
}

ConfigResult parse_config(const std::string& text, PipelineConfig base) {
  ConfigResult r;
  r.config = std::move(base);
  auto fail = [&](const std::string& msg) {
    r.error = ErrorCode::config_invalid;
    r.detail = msg;
    return r;
  };

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return fail("config: " + err->code + ": " + err->message);

  PipelineConfig& c = r.config;
  c.storage_root = jsonlite::get_string(obj, "storage_root", c.storage_root);
  c.ledger_path = jsonlite::get_string(obj, "ledger_path", c.ledger_path);
  c.event_log = jsonlite::get_string(obj, "event_log", c.event_log);
  c.budget_period_days = jsonlite::get_u64(obj, "budget_period_days", c.budget_period_days);
  c.processing_deadline_ms = jsonlite::get_u64(obj, "processing_deadline_ms", c.processing_deadline_ms);
  c.pending_deadline_ms = jsonlite::get_u64(obj, "pending_deadline_ms", c.pending_deadline_ms);
  c.max_dataset_bytes = jsonlite::get_u64(obj, "max_dataset_bytes", c.max_dataset_bytes);
  c.cas_compression = jsonlite::get_string(obj, "cas_compression", c.cas_compression);
  c.watchdog_interval_ms = jsonlite::get_u64(obj, "watchdog_interval_ms", c.watchdog_interval_ms);
  c.possession_sweep_ms = jsonlite::get_u64(obj, "possession_sweep_ms", c.possession_sweep_ms);

  if (c.storage_root.empty()) return fail("storage_root must not be empty");
  if (c.budget_period_days == 0) return fail("budget_period_days must be positive");
  if (c.processing_deadline_ms == 0) return fail("processing_deadline_ms must be positive");
  if (c.pending_deadline_ms == 0) return fail("pending_deadline_ms must be positive");
  if (c.watchdog_interval_ms == 0) return fail("watchdog_interval_ms must be positive");
  if (!valid_compression(c.cas_compression)) return fail("cas_compression must be off or zstd");

  if (const auto* fws = jsonlite::get_array(obj, "frameworks")) {
    for (const auto& v : *fws) {
      const auto* fo = std::get_if<jsonlite::Object>(&v.v);
      if (!fo) return fail("frameworks: entry is not an object");
      std::string why;
      auto f = framework_from_json(*fo, &why);
      if (!f) return fail("frameworks: " + why);
      c.frameworks.push_back(std::move(*f));
    }
  }
  if (const auto* pols = jsonlite::get_array(obj, "policies")) {
    for (const auto& v : *pols) {
      const auto* po = std::get_if<jsonlite::Object>(&v.v);
      if (!po) return fail("policies: entry is not an object");
      std::string why;
      auto p = policy_from_json(*po, &why);
      if (!p) return fail("policies: " + why);
      c.policies.push_back(std::move(*p));
    }
  }
  if (const auto* circuits = jsonlite::get_array(obj, "circuits")) {
    for (const auto& v : *circuits) {
      const auto* co = std::get_if<jsonlite::Object>(&v.v);
      if (!co) return fail("circuits: entry is not an object");
      auto vk = verifying_key_from_json(*co);
      if (!vk) return fail("circuits: circuit_id and public_input_arity are required");
      c.circuits.push_back(std::move(*vk));
    }
  }
  return r;
}

ConfigResult load_config_file(const std::string& path) {
  if (path.empty()) return ConfigResult{};
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigResult r;
    r.error = ErrorCode::config_invalid;
    r.detail = "cannot open config file: " + path;
    return r;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_config(ss.str());
}

Outcome apply_env_overrides(PipelineConfig& c) {
  auto env = [](const char* name) -> const char* {
    const char* v = std::getenv(name);
    return (v && v[0]) ? v : nullptr;
  };

  if (const char* v = env("INSIGHT_STORAGE_ROOT")) c.storage_root = v;
  if (const char* v = env("INSIGHT_LEDGER_PATH")) c.ledger_path = v;
  if (const char* v = env("INSIGHT_EVENT_LOG")) c.event_log = v;
  if (const char* v = env("INSIGHT_CAS_COMPRESSION")) {
    if (!valid_compression(v)) {
      return Outcome::fail(ErrorCode::config_invalid, "INSIGHT_CAS_COMPRESSION must be off or zstd");
    }
    c.cas_compression = v;
  }

  const std::pair<const char*, uint64_t*> numeric[] = {
      {"INSIGHT_BUDGET_PERIOD_DAYS", &c.budget_period_days},
      {"INSIGHT_PROCESSING_DEADLINE_MS", &c.processing_deadline_ms},
      {"INSIGHT_PENDING_DEADLINE_MS", &c.pending_deadline_ms},
      {"INSIGHT_MAX_DATASET_BYTES", &c.max_dataset_bytes},
      {"INSIGHT_WATCHDOG_INTERVAL_MS", &c.watchdog_interval_ms},
      {"INSIGHT_POSSESSION_SWEEP_MS", &c.possession_sweep_ms},
  };
  for (const auto& [name, slot] : numeric) {
    const char* v = env(name);
    if (!v) continue;
    uint64_t parsed = 0;
    if (!parse_u64(v, &parsed)) {
      return Outcome::fail(ErrorCode::config_invalid, std::string(name) + " is not an unsigned integer");
    }
    // Only the byte limit and the sweep interval may be zero (off).
    if (parsed == 0 && slot != &c.max_dataset_bytes && slot != &c.possession_sweep_ms) {
      return Outcome::fail(ErrorCode::config_invalid, std::string(name) + " must be positive");
    }
    *slot = parsed;
  }
  return Outcome::success();
}

ConfigResult load_config(const std::string& path) {
  std::string resolved = path;
  if (resolved.empty()) {
    if (const char* v = std::getenv("INSIGHT_CONFIG")) resolved = v;
  }
  ConfigResult r = load_config_file(resolved);
  if (r.error != ErrorCode::none) return r;
  Outcome env = apply_env_overrides(r.config);
  if (!env.ok()) {
    r.error = env.error;
    r.detail = env.detail;
  }
  return r;
}

}  // namespace insight
