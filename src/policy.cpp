#include "insight/policy.hpp"

#include <algorithm>

#include "insight/observability.hpp"

namespace insight {

std::string to_string(EncryptionMethod m) {
  switch (m) {
    case EncryptionMethod::rsa2048: return "RSA2048";
    case EncryptionMethod::rsa4096: return "RSA4096";
    case EncryptionMethod::aes256: return "AES256";
    case EncryptionMethod::chacha20: return "ChaCha20";
    case EncryptionMethod::ecdh: return "ECDH";
    case EncryptionMethod::hybrid: return "Hybrid";
  }
  return "";
}

std::optional<EncryptionMethod> encryption_method_from_string(const std::string& s) {
  if (s == "RSA2048") return EncryptionMethod::rsa2048;
  if (s == "RSA4096") return EncryptionMethod::rsa4096;
  if (s == "AES256") return EncryptionMethod::aes256;
  if (s == "ChaCha20") return EncryptionMethod::chacha20;
  if (s == "ECDH") return EncryptionMethod::ecdh;
  if (s == "Hybrid") return EncryptionMethod::hybrid;
  return std::nullopt;
}

jsonlite::Object policy_to_json(const PrivacyPolicy& p) {
  jsonlite::Object o;
  o["category"] = p.category;
  o["encryption"] = to_string(p.encryption);
  o["privacy_level"] = static_cast<std::uint64_t>(p.privacy_level);
  o["tee_required"] = p.tee_required;
  jsonlite::Array fws;
  for (const auto& f : p.frameworks) fws.emplace_back(f);
  o["frameworks"] = std::move(fws);
  o["epsilon_limit"] = epsilon_to_json(p.epsilon_limit);
  return o;
}

std::optional<PrivacyPolicy> policy_from_json(const jsonlite::Object& o, std::string* error) {
  auto fail = [&](const std::string& msg) -> std::optional<PrivacyPolicy> {
    if (error) *error = msg;
    return std::nullopt;
  };
  PrivacyPolicy p;
  p.category = jsonlite::get_string(o, "category");
  if (p.category.empty()) return fail("policy category missing");
  auto enc = encryption_method_from_string(jsonlite::get_string(o, "encryption", "AES256"));
  if (!enc) return fail("policy " + p.category + ": unknown encryption method");
  p.encryption = *enc;
  const auto level = jsonlite::get_u64(o, "privacy_level", 0);
  if (level > 10) return fail("policy " + p.category + ": privacy_level out of range");
  p.privacy_level = static_cast<uint32_t>(level);
  p.tee_required = jsonlite::get_bool(o, "tee_required", false);
  for (const auto& f : jsonlite::get_string_array(o, "frameworks")) p.frameworks.insert(f);
  auto limit = epsilon_from_json(o, "epsilon_limit");
  if (!limit) return fail("policy " + p.category + ": epsilon_limit invalid");
  p.epsilon_limit = *limit;
  return p;
}

Outcome validate_policy(const PrivacyPolicy& p, const ComplianceEngine& engine) {
  if (p.category.empty()) return Outcome::fail(ErrorCode::invalid_policy, "empty category");
  if (p.privacy_level < 1 || p.privacy_level > 10) {
    return Outcome::fail(ErrorCode::invalid_policy,
                         p.category + ": privacy level must be in 1..10");
  }
  if (p.epsilon_limit.is_zero()) {
    return Outcome::fail(ErrorCode::invalid_policy, p.category + ": epsilon limit must be positive");
  }
  if (p.frameworks.empty()) {
    return Outcome::fail(ErrorCode::invalid_policy, p.category + ": no compliance framework");
  }
  for (const auto& f : p.frameworks) {
    if (!engine.has_framework(f)) return Outcome::fail(ErrorCode::unknown_framework, f);
  }
  if (p.privacy_level >= kTeeExpectedLevel && !p.tee_required) {
    log_warning("policy", p.category + ": privacy level " + std::to_string(p.privacy_level) +
                              " without TEE requirement");
  }
  return Outcome::success();
}

namespace {

PrivacyPolicy make_policy(std::string category, EncryptionMethod enc, uint32_t level, bool tee,
                          std::set<std::string> frameworks, const char* limit) {
  PrivacyPolicy p;
  p.category = std::move(category);
  p.encryption = enc;
  p.privacy_level = level;
  p.tee_required = tee;
  p.frameworks = std::move(frameworks);
  p.epsilon_limit = Epsilon::parse(limit).value_or(Epsilon::whole(1));
  return p;
}

}  // namespace

std::vector<PrivacyPolicy> default_policies() {
  return {
      make_policy("healthcare", EncryptionMethod::aes256, 9, true, {"HIPAA"}, "0.1"),
      make_policy("financial", EncryptionMethod::rsa4096, 10, true, {"PCI_DSS", "SOX"}, "0.05"),
      make_policy("personal", EncryptionMethod::hybrid, 8, true, {"GDPR", "CCPA"}, "0.2"),
      make_policy("general", EncryptionMethod::aes256, 6, false, {"ISO27001"}, "0.5"),
  };
}

uint32_t encryption_strength(EncryptionMethod m) {
  switch (m) {
    case EncryptionMethod::rsa2048: return 75;
    case EncryptionMethod::rsa4096: return 90;
    case EncryptionMethod::aes256: return 95;
    case EncryptionMethod::chacha20: return 92;
    case EncryptionMethod::ecdh: return 88;
    case EncryptionMethod::hybrid: return 98;
  }
  return 0;
}

PrivacyMetrics privacy_metrics(const std::vector<PrivacyPolicy>& policies) {
  double strength = 0;
  double tee = 0;
  double leakage = 0;
  double compliance = 0;
  for (const auto& p : policies) {
    strength += encryption_strength(p.encryption);
    tee += p.tee_required ? p.privacy_level : 0;
    leakage += (10.0 - p.privacy_level) * 10.0;
    compliance += static_cast<double>(p.frameworks.size()) * 20.0;
  }
  const double n = policies.empty() ? 1.0 : static_cast<double>(policies.size());
  PrivacyMetrics m;
  m.encryption_strength = std::min(100.0, strength / n);
  m.tee_verification_level = std::min(100.0, tee / n * 10.0);
  m.data_leakage_risk = std::min(100.0, leakage / n);
  m.compliance_score = std::min(100.0, compliance / n);
  return m;
}

jsonlite::Object privacy_metrics_to_json(const PrivacyMetrics& m) {
  jsonlite::Object o;
  o["encryption_strength"] = m.encryption_strength;
  o["tee_verification_level"] = m.tee_verification_level;
  o["data_leakage_risk"] = m.data_leakage_risk;
  o["compliance_score"] = m.compliance_score;
  return o;
}

std::string compliance_status(double compliance_score) {
  if (compliance_score > 80) return "Good";
  if (compliance_score > 60) return "Adequate";
  return "Needs Improvement";
}

}  // namespace insight
