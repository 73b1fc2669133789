#include "insight/compliance.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace insight {

std::string to_string(Severity s) {
  switch (s) {
    case Severity::critical: return "critical";
    case Severity::high: return "high";
    case Severity::medium: return "medium";
    case Severity::low: return "low";
  }
  return "";
}

std::optional<Severity> severity_from_string(const std::string& s) {
  if (s == "critical") return Severity::critical;
  if (s == "high") return Severity::high;
  if (s == "medium") return Severity::medium;
  if (s == "low") return Severity::low;
  return std::nullopt;
}

uint32_t severity_points(Severity s) {
  switch (s) {
    case Severity::critical: return 30;
    case Severity::high: return 20;
    case Severity::medium: return 15;
    case Severity::low: return 10;
  }
  return 0;
}

namespace {

bool is_true(const jsonlite::Object& md, const std::string& key) {
  auto it = md.find(key);
  if (it == md.end()) return false;
  const bool* b = std::get_if<bool>(&it->second.v);
  return b && *b;
}

bool is_non_empty(const jsonlite::Object& md, const std::string& key) {
  auto it = md.find(key);
  if (it == md.end()) return false;
  if (const auto* s = std::get_if<std::string>(&it->second.v)) return !s->empty();
  if (const auto* a = std::get_if<jsonlite::Array>(&it->second.v)) return !a->empty();
  return false;
}

const char* op_name(Condition::Op op) {
  switch (op) {
    case Condition::Op::all_true: return "all_true";
    case Condition::Op::any_true: return "any_true";
    case Condition::Op::non_empty: return "non_empty";
    case Condition::Op::equals: return "equals";
  }
  return "";
}

std::optional<Condition::Op> op_from_string(const std::string& s) {
  if (s == "all_true") return Condition::Op::all_true;
  if (s == "any_true") return Condition::Op::any_true;
  if (s == "non_empty") return Condition::Op::non_empty;
  if (s == "equals") return Condition::Op::equals;
  return std::nullopt;
}

jsonlite::Array string_array(const std::vector<std::string>& v) {
  jsonlite::Array a;
  for (const auto& s : v) a.emplace_back(s);
  return a;
}

ComplianceRule rule(std::string id, std::string description, Condition::Op op,
                    std::vector<std::string> keys, Severity severity, std::string remedy,
                    std::string penalty) {
  ComplianceRule r;
  r.id = std::move(id);
  r.description = std::move(description);
  r.condition.op = op;
  r.condition.keys = std::move(keys);
  r.severity = severity;
  r.remedy = std::move(remedy);
  r.penalty = std::move(penalty);
  return r;
}

using Op = Condition::Op;

}  // namespace

bool evaluate_condition(const Condition& c, const jsonlite::Object& metadata) {
  if (c.keys.empty()) return false;
  switch (c.op) {
    case Op::all_true:
      return std::all_of(c.keys.begin(), c.keys.end(),
                         [&](const std::string& k) { return is_true(metadata, k); });
    case Op::any_true:
      return std::any_of(c.keys.begin(), c.keys.end(),
                         [&](const std::string& k) { return is_true(metadata, k); });
    case Op::non_empty:
      return std::all_of(c.keys.begin(), c.keys.end(),
                         [&](const std::string& k) { return is_non_empty(metadata, k); });
    case Op::equals:
      return jsonlite::has_key(metadata, c.keys.front()) &&
             jsonlite::get_string(metadata, c.keys.front(), "\x01") == c.value;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Framework JSON
// ---------------------------------------------------------------------------

jsonlite::Object framework_to_json(const Framework& f) {
  jsonlite::Object o;
  o["id"] = f.id;
  o["name"] = f.name;
  jsonlite::Array rules;
  for (const auto& r : f.rules) {
    jsonlite::Object ro;
    ro["id"] = r.id;
    ro["description"] = r.description;
    ro["severity"] = to_string(r.severity);
    ro["remedy"] = r.remedy;
    ro["penalty"] = r.penalty;
    jsonlite::Object cond;
    cond["op"] = op_name(r.condition.op);
    cond["keys"] = string_array(r.condition.keys);
    if (r.condition.op == Op::equals) cond["value"] = r.condition.value;
    ro["condition"] = std::move(cond);
    rules.emplace_back(std::move(ro));
  }
  o["rules"] = std::move(rules);
  jsonlite::Array adv;
  for (const auto& a : f.advisories) {
    jsonlite::Object ao;
    ao["key"] = a.key;
    ao["recommendation"] = a.recommendation;
    adv.emplace_back(std::move(ao));
  }
  o["advisories"] = std::move(adv);
  o["best_practices"] = string_array(f.best_practices);
  return o;
}

std::optional<Framework> framework_from_json(const jsonlite::Object& o, std::string* error) {
  auto fail = [&](const std::string& msg) -> std::optional<Framework> {
    if (error) *error = msg;
    return std::nullopt;
  };
  Framework f;
  f.id = jsonlite::get_string(o, "id");
  if (f.id.empty()) return fail("framework id missing");
  f.name = jsonlite::get_string(o, "name", f.id);

  const auto* rules = jsonlite::get_array(o, "rules");
  if (!rules) return fail("framework " + f.id + ": rules missing");
  for (const auto& rv : *rules) {
    const auto* ro = std::get_if<jsonlite::Object>(&rv.v);
    if (!ro) return fail("framework " + f.id + ": rule is not an object");
    ComplianceRule r;
    r.id = jsonlite::get_string(*ro, "id");
    r.description = jsonlite::get_string(*ro, "description");
    r.remedy = jsonlite::get_string(*ro, "remedy");
    r.penalty = jsonlite::get_string(*ro, "penalty");
    auto sev = severity_from_string(jsonlite::get_string(*ro, "severity"));
    if (r.id.empty() || !sev) return fail("framework " + f.id + ": rule id or severity invalid");
    r.severity = *sev;
    const auto* cond = jsonlite::get_object(*ro, "condition");
    if (!cond) return fail("rule " + r.id + ": condition missing");
    auto op = op_from_string(jsonlite::get_string(*cond, "op"));
    if (!op) return fail("rule " + r.id + ": unknown condition op");
    r.condition.op = *op;
    r.condition.keys = jsonlite::get_string_array(*cond, "keys");
    r.condition.value = jsonlite::get_string(*cond, "value");
    if (r.condition.keys.empty()) return fail("rule " + r.id + ": condition has no keys");
    f.rules.push_back(std::move(r));
  }

  if (const auto* adv = jsonlite::get_array(o, "advisories")) {
    for (const auto& av : *adv) {
      const auto* ao = std::get_if<jsonlite::Object>(&av.v);
      if (!ao) return fail("framework " + f.id + ": advisory is not an object");
      f.advisories.push_back(Advisory{jsonlite::get_string(*ao, "key"),
                                      jsonlite::get_string(*ao, "recommendation")});
    }
  }
  f.best_practices = jsonlite::get_string_array(o, "best_practices");
  return f;
}

// ---------------------------------------------------------------------------
// Built-in frameworks
// ---------------------------------------------------------------------------

std::vector<Framework> builtin_frameworks() {
  std::vector<Framework> out;

  Framework gdpr;
  gdpr.id = "GDPR";
  gdpr.name = "EU General Data Protection Regulation";
  gdpr.rules = {
      rule("gdpr_consent", "Data processing requires explicit consent", Op::all_true, {"hasConsent"},
           Severity::critical, "Obtain and record explicit consent before processing",
           "Up to 4% of annual revenue or EUR 20M"),
      rule("gdpr_anonymization", "Personal data must be anonymized when possible", Op::any_true,
           {"isAnonymized", "pseudonymized"}, Severity::high,
           "Anonymize or pseudonymize personal data before analysis",
           "Up to 2% of annual revenue or EUR 10M"),
      rule("gdpr_purpose_limitation", "Data processing must be for specified purposes only",
           Op::non_empty, {"purpose"}, Severity::high, "Declare a processing purpose",
           "Administrative fine"),
      rule("gdpr_data_minimization", "Only necessary data should be processed", Op::all_true,
           {"dataMinimized"}, Severity::medium, "Restrict the dataset to the fields the analysis needs",
           "Warning or fine"),
  };
  gdpr.advisories = {
      {"dataProtectionOfficer", "Consider appointing a Data Protection Officer (DPO)"},
      {"privacyByDesign", "Implement privacy-by-design principles"},
  };
  gdpr.best_practices = {"Implement privacy by design",
                         "Conduct Data Protection Impact Assessments (DPIA)",
                         "Maintain records of processing activities",
                         "Ensure data portability mechanisms"};
  out.push_back(std::move(gdpr));

  Framework ccpa;
  ccpa.id = "CCPA";
  ccpa.name = "California Consumer Privacy Act";
  ccpa.rules = {
      rule("ccpa_notice", "Consumers must be notified of data collection", Op::all_true, {"hasNotice"},
           Severity::critical, "Publish a notice at collection", "Up to $7,500 per violation"),
      rule("ccpa_opt_out", "Consumers must have opt-out rights", Op::all_true, {"optOutAvailable"},
           Severity::high, "Provide an opt-out mechanism", "Up to $2,500 per violation"),
      rule("ccpa_deletion", "Data deletion mechanisms must be available", Op::all_true,
           {"deletionMechanism"}, Severity::medium, "Provide a deletion request workflow",
           "Civil penalty"),
  };
  ccpa.advisories = {{"privacyPolicy", "Update privacy policy to include CCPA requirements"}};
  ccpa.best_practices = {"Provide clear privacy notices", "Implement data deletion procedures",
                         "Train staff on CCPA requirements", "Monitor third-party processors"};
  out.push_back(std::move(ccpa));

  Framework hipaa;
  hipaa.id = "HIPAA";
  hipaa.name = "Health Insurance Portability and Accountability Act";
  hipaa.rules = {
      rule("hipaa_encryption_in_transit", "PHI must be encrypted in transit", Op::all_true,
           {"encryptionInTransit"}, Severity::critical, "Enable transport encryption for PHI",
           "Up to $1.5M per violation"),
      rule("hipaa_encryption_at_rest", "PHI must be encrypted at rest", Op::all_true,
           {"encryptionAtRest"}, Severity::critical, "Encrypt PHI at rest",
           "Up to $1.5M per violation"),
      rule("hipaa_access_control", "Access to PHI must be controlled", Op::all_true, {"accessControl"},
           Severity::critical, "Restrict PHI access to authorized roles", "Criminal charges possible"),
      rule("hipaa_audit_logging", "Access to PHI must be logged", Op::all_true, {"auditLogging"},
           Severity::high, "Enable audit logging for PHI access", "Civil monetary penalty"),
      rule("hipaa_minimum_necessary", "Only minimum necessary PHI should be accessed", Op::all_true,
           {"minimumNecessary"}, Severity::high, "Limit PHI access to the minimum necessary",
           "Civil monetary penalty"),
  };
  hipaa.advisories = {
      {"businessAssociateAgreement", "Ensure Business Associate Agreements are in place"},
      {"riskAssessment", "Conduct regular HIPAA risk assessments"},
  };
  hipaa.best_practices = {"Conduct regular security risk assessments",
                          "Implement workforce training programs",
                          "Maintain business associate agreements",
                          "Establish incident response procedures"};
  out.push_back(std::move(hipaa));

  Framework sox;
  sox.id = "SOX";
  sox.name = "Sarbanes-Oxley Act";
  sox.rules = {
      rule("sox_audit_trail", "Financial data processing must have audit trails", Op::all_true,
           {"auditTrail"}, Severity::critical, "Record an audit trail for financial processing",
           "Criminal penalties up to 20 years"),
      rule("sox_internal_controls", "Internal controls must be documented and tested", Op::all_true,
           {"internalControls"}, Severity::high, "Document and test internal controls",
           "Civil and criminal penalties"),
  };
  sox.advisories = {{"segregationOfDuties", "Implement segregation of duties for financial controls"}};
  sox.best_practices = {"Document all financial processes", "Implement change management controls",
                        "Conduct regular internal audits", "Maintain segregation of duties"};
  out.push_back(std::move(sox));

  Framework pci;
  pci.id = "PCI_DSS";
  pci.name = "Payment Card Industry Data Security Standard";
  pci.rules = {
      rule("pci_encryption", "Payment card data must be encrypted", Op::all_true, {"cardDataEncrypted"},
           Severity::critical, "Encrypt stored and transmitted card data",
           "Fines up to $100,000 per month"),
      rule("pci_network_security", "Secure network architecture required", Op::all_true,
           {"secureNetwork"}, Severity::high, "Segment and firewall the cardholder data environment",
           "Card brand penalties"),
  };
  pci.advisories = {
      {"vulnerabilityScanning", "Implement regular vulnerability scanning"},
      {"penetrationTesting", "Conduct annual penetration testing"},
  };
  pci.best_practices = {"Regularly update security systems", "Implement network segmentation",
                        "Conduct quarterly vulnerability scans", "Maintain secure coding practices"};
  out.push_back(std::move(pci));

  Framework iso;
  iso.id = "ISO27001";
  iso.name = "ISO/IEC 27001";
  iso.rules = {
      rule("iso_risk_assessment", "Information security risk assessment required", Op::all_true,
           {"riskAssessment"}, Severity::medium, "Perform an information security risk assessment",
           "Certification loss"),
      rule("iso_security_controls", "Appropriate security controls must be implemented", Op::all_true,
           {"securityControls"}, Severity::medium, "Implement the Annex A controls in scope",
           "Audit findings"),
  };
  iso.advisories = {
      {"informationSecurityPolicy", "Develop comprehensive information security policy"},
      {"incidentResponsePlan", "Create incident response procedures"},
  };
  iso.best_practices = {"Establish information security management system",
                        "Conduct regular risk assessments", "Implement security awareness training",
                        "Maintain business continuity plans"};
  out.push_back(std::move(iso));

  return out;
}

// ---------------------------------------------------------------------------
// Result JSON
// ---------------------------------------------------------------------------

size_t ComplianceResult::count(Severity s) const {
  return static_cast<size_t>(std::count_if(violations.begin(), violations.end(),
                                           [s](const Violation& v) { return v.severity == s; }));
}

jsonlite::Object compliance_result_to_json(const ComplianceResult& r) {
  jsonlite::Object o;
  o["framework"] = r.framework;
  o["is_compliant"] = r.is_compliant;
  o["score"] = static_cast<std::uint64_t>(r.score);
  jsonlite::Array vs;
  for (const auto& v : r.violations) {
    jsonlite::Object vo;
    vo["rule_id"] = v.rule_id;
    vo["description"] = v.description;
    vo["severity"] = to_string(v.severity);
    vo["remedy"] = v.remedy;
    vs.emplace_back(std::move(vo));
  }
  o["violations"] = std::move(vs);
  o["recommendations"] = string_array(r.recommendations);
  return o;
}

jsonlite::Object requirements_to_json(const FrameworkRequirements& r) {
  jsonlite::Object o;
  o["framework"] = r.framework;
  o["requirements"] = string_array(r.requirements);
  o["remedies"] = string_array(r.remedies);
  o["penalties"] = string_array(r.penalties);
  o["best_practices"] = string_array(r.best_practices);
  return o;
}

jsonlite::Object compliance_report_to_json(const ComplianceReport& r) {
  jsonlite::Object o;
  jsonlite::Array results;
  for (const auto& res : r.results) results.emplace_back(compliance_result_to_json(res));
  o["results"] = std::move(results);
  o["overall_compliance"] = r.overall_compliance;
  o["average_score"] = static_cast<std::uint64_t>(r.average_score);
  o["critical_issues"] = string_array(r.critical_issues);
  o["recommendations"] = string_array(r.recommendations);
  if (!r.unknown_frameworks.empty()) o["unknown_frameworks"] = string_array(r.unknown_frameworks);
  o["summary"] = r.summary;
  return o;
}

// ---------------------------------------------------------------------------
// ComplianceEngine
// ---------------------------------------------------------------------------

namespace {

ComplianceResult evaluate_framework(const Framework& f, const jsonlite::Object& metadata) {
  ComplianceResult r;
  r.framework = f.id;
  uint32_t earned = 0;
  uint32_t max = 0;
  for (const auto& rule : f.rules) {
    const uint32_t pts = severity_points(rule.severity);
    max += pts;
    if (evaluate_condition(rule.condition, metadata)) {
      earned += pts;
      continue;
    }
    r.violations.push_back(Violation{rule.id, rule.description, rule.severity, rule.remedy});
    std::string rec = "Fix: " + rule.remedy;
    if (!rule.penalty.empty()) rec += " (Penalty: " + rule.penalty + ")";
    r.recommendations.push_back(std::move(rec));
  }
  for (const auto& adv : f.advisories) {
    if (!is_true(metadata, adv.key)) r.recommendations.push_back(adv.recommendation);
  }
  // Integer round-half-up of 100 * earned / max.
  r.score = max == 0 ? 100 : (200 * earned + max) / (2 * max);
  r.is_compliant = r.count(Severity::critical) == 0 && r.count(Severity::high) <= 1;
  return r;
}

}  // namespace

Outcome ComplianceEngine::register_framework(Framework f) {
  if (f.id.empty()) return Outcome::fail(ErrorCode::config_invalid, "framework id is empty");
  const std::string id = f.id;
  auto ptr = std::make_shared<const Framework>(std::move(f));
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (frameworks_.contains(id)) return Outcome::fail(ErrorCode::already_registered, id);
  frameworks_.emplace(id, std::move(ptr));
  return Outcome::success();
}

std::shared_ptr<const Framework> ComplianceEngine::find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = frameworks_.find(id);
  return it == frameworks_.end() ? nullptr : it->second;
}

bool ComplianceEngine::has_framework(const std::string& id) const { return find(id) != nullptr; }

std::optional<Framework> ComplianceEngine::framework(const std::string& id) const {
  auto f = find(id);
  if (!f) return std::nullopt;
  return *f;
}

std::vector<std::string> ComplianceEngine::framework_ids() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& [id, f] : frameworks_) out.push_back(id);
  return out;
}

ComplianceEngine::EvalResult ComplianceEngine::evaluate(const std::string& framework_id,
                                                        const jsonlite::Object& metadata) const {
  EvalResult r;
  auto f = find(framework_id);
  if (!f) {
    r.error = ErrorCode::unknown_framework;
    r.detail = framework_id;
    return r;
  }
  r.result = evaluate_framework(*f, metadata);
  return r;
}

bool ComplianceEngine::ManyResult::all_compliant() const {
  return error == ErrorCode::none &&
         std::all_of(results.begin(), results.end(),
                     [](const ComplianceResult& c) { return c.is_compliant; });
}

ComplianceEngine::ManyResult ComplianceEngine::evaluate_many(const std::vector<std::string>& framework_ids,
                                                             const jsonlite::Object& metadata) const {
  ManyResult r;
  for (const auto& id : framework_ids) {
    auto f = find(id);
    if (f) {
      r.results.push_back(evaluate_framework(*f, metadata));
      continue;
    }
    ComplianceResult failed;
    failed.framework = id;
    failed.violations.push_back(
        Violation{"unknown_framework", "Framework " + id + " is not registered", Severity::critical,
                  "Register the framework or remove it from the policy"});
    r.results.push_back(std::move(failed));
    r.unknown.push_back(id);
  }
  if (!r.unknown.empty()) {
    r.error = ErrorCode::unknown_framework;
    for (const auto& id : r.unknown) r.detail += (r.detail.empty() ? "" : ",") + id;
  }
  return r;
}

std::optional<FrameworkRequirements> ComplianceEngine::requirements(const std::string& framework_id) const {
  auto f = find(framework_id);
  if (!f) return std::nullopt;
  FrameworkRequirements req;
  req.framework = f->id;
  for (const auto& rule : f->rules) {
    req.requirements.push_back(rule.description);
    req.remedies.push_back(rule.remedy);
    req.penalties.push_back(rule.penalty);
  }
  req.best_practices = f->best_practices;
  return req;
}

ComplianceReport ComplianceEngine::report(const std::vector<std::string>& framework_ids,
                                          const jsonlite::Object& metadata) const {
  auto many = evaluate_many(framework_ids, metadata);
  ComplianceReport rep;
  rep.results = std::move(many.results);
  rep.unknown_frameworks = std::move(many.unknown);
  size_t compliant = 0;
  uint32_t score_sum = 0;
  std::set<std::string> seen;
  for (const auto& res : rep.results) {
    if (res.is_compliant) ++compliant;
    score_sum += res.score;
    for (const auto& v : res.violations) {
      if (v.severity == Severity::critical) {
        rep.critical_issues.push_back(res.framework + ": " + v.rule_id + ": " + v.description);
      }
    }
    for (const auto& rec : res.recommendations) {
      if (seen.insert(rec).second) rep.recommendations.push_back(rec);
    }
  }
  const size_t n = rep.results.size();
  rep.overall_compliance = compliant == n;
  rep.average_score = n == 0 ? 100 : static_cast<uint32_t>((2 * score_sum + n) / (2 * n));
  rep.summary = "Compliance validation completed for " + std::to_string(n) + " frameworks. " +
                std::to_string(compliant) + "/" + std::to_string(n) + " frameworks compliant.";
  return rep;
}

}  // namespace insight
