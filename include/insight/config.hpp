#pragma once

// insight/config.hpp — Pipeline configuration.
//
// Resolution order (later wins):
//   1. Built-in defaults below.
//   2. JSON file (path from --config or INSIGHT_CONFIG).
//   3. Environment overrides:
//        INSIGHT_STORAGE_ROOT, INSIGHT_LEDGER_PATH, INSIGHT_EVENT_LOG,
//        INSIGHT_BUDGET_PERIOD_DAYS, INSIGHT_PROCESSING_DEADLINE_MS,
//        INSIGHT_PENDING_DEADLINE_MS, INSIGHT_MAX_DATASET_BYTES,
//        INSIGHT_CAS_COMPRESSION (off|zstd), INSIGHT_WATCHDOG_INTERVAL_MS,
//        INSIGHT_POSSESSION_SWEEP_MS
//
// Extra frameworks, policies and circuits from the file are registered
// after the built-ins. Nothing here aborts: a bad file or value yields
// config_invalid with a message.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "insight/compliance.hpp"
#include "insight/policy.hpp"
#include "insight/proof_verifier.hpp"
#include "insight/types.hpp"

namespace insight {

struct PipelineConfig {
  std::string storage_root{".insight"};
  std::string ledger_path;  // empty = <storage_root>/ledger.ndjson
  std::string event_log;    // empty = no JSONL event log
  uint64_t budget_period_days{30};
  uint64_t processing_deadline_ms{10 * 60 * 1000};
  uint64_t pending_deadline_ms{60 * 60 * 1000};
  uint64_t max_dataset_bytes{0};  // 0 = unlimited
  std::string cas_compression{"off"};
  uint64_t watchdog_interval_ms{1000};
  uint64_t possession_sweep_ms{0};  // 0 = no periodic possession challenges

  std::vector<Framework> frameworks;
  std::vector<PrivacyPolicy> policies;
  std::vector<std::pair<std::string, VerifyingKey>> circuits;

  std::string resolved_ledger_path() const;
  uint64_t budget_period_ms() const;
};

jsonlite::Object config_to_json(const PipelineConfig& c);

struct ConfigResult {
  ErrorCode error{ErrorCode::none};
  std::string detail;
  PipelineConfig config;
};

// Parse a config document on top of `base`.
ConfigResult parse_config(const std::string& text, PipelineConfig base = {});

// Read and parse a config file. An empty path returns the defaults.
ConfigResult load_config_file(const std::string& path);

// Apply INSIGHT_* environment overrides in place.
Outcome apply_env_overrides(PipelineConfig& c);

// load_config_file(path or INSIGHT_CONFIG) + apply_env_overrides.
ConfigResult load_config(const std::string& path = "");

}  // namespace insight
