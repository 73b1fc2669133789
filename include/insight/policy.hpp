#pragma once

// insight/policy.hpp — Per-category privacy policies.
//
// A policy binds a data category to an encryption method, a privacy level,
// a TEE requirement, the compliance frameworks every job must satisfy and
// the category's epsilon limit.
//
// INVARIANTS:
//   1. privacy_level in 1..10, epsilon_limit > 0, at least one framework,
//      every framework registered with the ComplianceEngine.
//   2. privacy_level >= 8 without tee_required is accepted with a warning.

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "insight/compliance.hpp"
#include "insight/types.hpp"

namespace insight {

enum class EncryptionMethod { rsa2048, rsa4096, aes256, chacha20, ecdh, hybrid };

std::string to_string(EncryptionMethod m);
std::optional<EncryptionMethod> encryption_method_from_string(const std::string& s);

// Level at and above which a TEE is expected.
inline constexpr uint32_t kTeeExpectedLevel = 8;

struct PrivacyPolicy {
  std::string category;
  EncryptionMethod encryption{EncryptionMethod::aes256};
  uint32_t privacy_level{1};
  bool tee_required{false};
  std::set<std::string> frameworks;
  Epsilon epsilon_limit;
};

jsonlite::Object policy_to_json(const PrivacyPolicy& p);
std::optional<PrivacyPolicy> policy_from_json(const jsonlite::Object& o, std::string* error = nullptr);

// invalid_policy | unknown_framework. Logs the TEE warning.
Outcome validate_policy(const PrivacyPolicy& p, const ComplianceEngine& engine);

// healthcare, financial, personal, general.
std::vector<PrivacyPolicy> default_policies();

// Nominal strength of an encryption method, 0..100.
uint32_t encryption_strength(EncryptionMethod m);

// Averages over a policy set, each capped at 100. An empty set divides by 1.
//   encryption_strength:    mean method strength
//   tee_verification_level: mean of (tee_required ? privacy_level : 0), x10
//   data_leakage_risk:      mean of (10 - privacy_level) x 10
//   compliance_score:       mean of frameworks x 20
struct PrivacyMetrics {
  double encryption_strength{0};
  double tee_verification_level{0};
  double data_leakage_risk{0};
  double compliance_score{0};
};

PrivacyMetrics privacy_metrics(const std::vector<PrivacyPolicy>& policies);
jsonlite::Object privacy_metrics_to_json(const PrivacyMetrics& m);

// "Good" above 80, "Adequate" above 60, otherwise "Needs Improvement".
std::string compliance_status(double compliance_score);

}  // namespace insight
