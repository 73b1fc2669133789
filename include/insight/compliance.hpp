#pragma once

// insight/compliance.hpp — Compliance engine: named rule collections
// (frameworks) evaluated against job metadata.
//
// SCORING:
//   Each rule carries a severity worth critical=30, high=20, medium=15,
//   low=10 points. score = round(100 * earned / max), where max is the sum
//   over all rules of the framework. A framework with no rules scores 100.
//
// VERDICT:
//   compliant iff zero critical violations AND at most one high violation.
//   Medium and low violations only lower the score.
//
// IMMUTABILITY:
//   A registered framework is never replaced. A revised rule set is
//   registered under a new id, so every policy that referenced the old id
//   keeps evaluating the rules it was approved with.
//
// Predicates are declarative (Condition) rather than code, so frameworks
// round-trip through JSON configs and the journal.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "insight/types.hpp"

namespace insight {

enum class Severity { critical, high, medium, low };

std::string to_string(Severity s);
std::optional<Severity> severity_from_string(const std::string& s);
uint32_t severity_points(Severity s);

// ---------------------------------------------------------------------------
// Condition — predicate over metadata
// ---------------------------------------------------------------------------
//   all_true:  every key holds boolean true
//   any_true:  at least one key holds boolean true
//   non_empty: every key holds a non-empty string or array
//   equals:    keys[0] holds a string equal to `value`
struct Condition {
  enum class Op { all_true, any_true, non_empty, equals };
  Op op{Op::all_true};
  std::vector<std::string> keys;
  std::string value;
};

bool evaluate_condition(const Condition& c, const jsonlite::Object& metadata);

struct ComplianceRule {
  std::string id;
  std::string description;
  Condition condition;
  Severity severity{Severity::medium};
  std::string remedy;
  std::string penalty;
};

// Recommendation added when `key` is not boolean true. Never affects score.
struct Advisory {
  std::string key;
  std::string recommendation;
};

struct Framework {
  std::string id;
  std::string name;
  std::vector<ComplianceRule> rules;
  std::vector<Advisory> advisories;
  std::vector<std::string> best_practices;
};

jsonlite::Object framework_to_json(const Framework& f);
// nullopt + error on malformed input.
std::optional<Framework> framework_from_json(const jsonlite::Object& o, std::string* error = nullptr);

// GDPR, CCPA, HIPAA, SOX, PCI_DSS, ISO27001.
std::vector<Framework> builtin_frameworks();

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------
struct Violation {
  std::string rule_id;
  std::string description;
  Severity severity{Severity::medium};
  std::string remedy;
};

struct ComplianceResult {
  std::string framework;
  bool is_compliant{false};
  uint32_t score{0};  // 0..100
  std::vector<Violation> violations;
  std::vector<std::string> recommendations;

  size_t count(Severity s) const;
};

jsonlite::Object compliance_result_to_json(const ComplianceResult& r);

struct FrameworkRequirements {
  std::string framework;
  std::vector<std::string> requirements;
  std::vector<std::string> remedies;
  std::vector<std::string> penalties;
  std::vector<std::string> best_practices;
};

jsonlite::Object requirements_to_json(const FrameworkRequirements& r);

struct ComplianceReport {
  std::vector<ComplianceResult> results;
  bool overall_compliance{false};
  uint32_t average_score{0};
  std::vector<std::string> critical_issues;   // "FRAMEWORK: rule_id: description"
  std::vector<std::string> recommendations;   // de-duplicated, first-seen order
  std::vector<std::string> unknown_frameworks;
  std::string summary;
};

jsonlite::Object compliance_report_to_json(const ComplianceReport& r);

// ---------------------------------------------------------------------------
// ComplianceEngine
// ---------------------------------------------------------------------------
// Thread-safe. Frameworks are immutable after registration and shared by
// pointer with evaluations in flight.
class ComplianceEngine {
 public:
  // already_registered | config_invalid (empty id)
  Outcome register_framework(Framework f);

  bool has_framework(const std::string& id) const;
  std::optional<Framework> framework(const std::string& id) const;
  std::vector<std::string> framework_ids() const;

  struct EvalResult {
    ErrorCode error{ErrorCode::none};
    std::string detail;
    ComplianceResult result;
  };
  // unknown_framework is distinct from a known framework that is not compliant.
  EvalResult evaluate(const std::string& framework_id, const jsonlite::Object& metadata) const;

  struct ManyResult {
    ErrorCode error{ErrorCode::none};  // unknown_framework if any id is unknown
    std::string detail;
    std::vector<ComplianceResult> results;  // one per id, in order
    std::vector<std::string> unknown;

    bool all_compliant() const;
  };
  // Every id is evaluated even after one fails. An unknown id yields a
  // non-compliant result with score 0 and is listed in `unknown`; the known
  // frameworks are still evaluated.
  ManyResult evaluate_many(const std::vector<std::string>& framework_ids,
                           const jsonlite::Object& metadata) const;

  std::optional<FrameworkRequirements> requirements(const std::string& framework_id) const;

  // Unknown ids appear as failed results and in unknown_frameworks.
  ComplianceReport report(const std::vector<std::string>& framework_ids,
                      const jsonlite::Object& metadata) const;

 private:
  std::shared_ptr<const Framework> find(const std::string& id) const;

  mutable std::shared_mutex mu_;
  std::map<std::string, std::shared_ptr<const Framework>> frameworks_;
};

}  // namespace insight
