#include "insight/types.hpp"

#include <limits>

namespace insight {

namespace {

struct CodeName {
  ErrorCode code;
  const char* name;
};

constexpr CodeName kCodeNames[] = {
    {ErrorCode::unknown_category, "unknown_category"},
    {ErrorCode::unknown_framework, "unknown_framework"},
    {ErrorCode::compliance_violation, "compliance_violation"},
    {ErrorCode::insufficient_budget, "insufficient_budget"},
    {ErrorCode::invalid_epsilon, "invalid_epsilon"},
    {ErrorCode::unknown_handle, "unknown_handle"},
    {ErrorCode::storage_expired, "storage_expired"},
    {ErrorCode::challenge_failed, "challenge_failed"},
    {ErrorCode::challenge_already_answered, "challenge_already_answered"},
    {ErrorCode::unknown_challenge, "unknown_challenge"},
    {ErrorCode::already_exists, "already_exists"},
    {ErrorCode::size_exceeds_limit, "size_exceeds_limit"},
    {ErrorCode::backend_failure, "backend_failure"},
    {ErrorCode::timeout, "timeout"},
    {ErrorCode::cancelled, "cancelled"},
    {ErrorCode::interrupted, "interrupted"},
    {ErrorCode::proof_rejected, "proof_rejected"},
    {ErrorCode::already_registered, "already_registered"},
    {ErrorCode::unknown_circuit, "unknown_circuit"},
    {ErrorCode::invalid_policy, "invalid_policy"},
    {ErrorCode::budget_limit_conflict, "budget_limit_conflict"},
    {ErrorCode::unknown_reservation, "unknown_reservation"},
    {ErrorCode::reset_not_due, "reset_not_due"},
    {ErrorCode::invalid_transition, "invalid_transition"},
    {ErrorCode::unknown_job, "unknown_job"},
    {ErrorCode::cancel_not_permitted, "cancel_not_permitted"},
    {ErrorCode::persistence_failed, "persistence_failed"},
    {ErrorCode::config_invalid, "config_invalid"},
    {ErrorCode::json_parse_error, "json_parse_error"},
};

}  // namespace

std::string to_string(ErrorCode code) {
  for (const auto& cn : kCodeNames) {
    if (cn.code == code) return cn.name;
  }
  return "";
}

std::optional<ErrorCode> error_code_from_string(std::string_view s) {
  if (s.empty()) return ErrorCode::none;
  for (const auto& cn : kCodeNames) {
    if (s == cn.name) return cn.code;
  }
  return std::nullopt;
}

std::string to_string(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::none: return "";
    case ErrorClass::admission: return "admission";
    case ErrorClass::possession: return "possession";
    case ErrorClass::computation: return "computation";
    case ErrorClass::proof: return "proof";
    case ErrorClass::registry: return "registry";
    case ErrorClass::ledger: return "ledger";
    case ErrorClass::transition: return "transition";
    case ErrorClass::persistence: return "persistence";
  }
  return "";
}

ErrorClass error_class(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return ErrorClass::none;
    case ErrorCode::unknown_category:
    case ErrorCode::unknown_framework:
    case ErrorCode::compliance_violation:
    case ErrorCode::insufficient_budget:
    case ErrorCode::invalid_epsilon:
      return ErrorClass::admission;
    case ErrorCode::unknown_handle:
    case ErrorCode::storage_expired:
    case ErrorCode::challenge_failed:
    case ErrorCode::challenge_already_answered:
    case ErrorCode::unknown_challenge:
    case ErrorCode::already_exists:
    case ErrorCode::size_exceeds_limit:
      return ErrorClass::possession;
    case ErrorCode::backend_failure:
    case ErrorCode::timeout:
    case ErrorCode::cancelled:
    case ErrorCode::interrupted:
      return ErrorClass::computation;
    case ErrorCode::proof_rejected:
      return ErrorClass::proof;
    case ErrorCode::already_registered:
    case ErrorCode::unknown_circuit:
    case ErrorCode::invalid_policy:
    case ErrorCode::budget_limit_conflict:
      return ErrorClass::registry;
    case ErrorCode::unknown_reservation:
    case ErrorCode::reset_not_due:
      return ErrorClass::ledger;
    case ErrorCode::invalid_transition:
    case ErrorCode::unknown_job:
    case ErrorCode::cancel_not_permitted:
      return ErrorClass::transition;
    case ErrorCode::persistence_failed:
    case ErrorCode::config_invalid:
    case ErrorCode::json_parse_error:
      return ErrorClass::persistence;
  }
  return ErrorClass::none;
}

// ---------------------------------------------------------------------------
// Epsilon
// ---------------------------------------------------------------------------

std::optional<Epsilon> Epsilon::parse(std::string_view text) {
  if (text.empty()) return std::nullopt;
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

  std::uint64_t whole_part = 0;
  std::size_t i = 0;
  bool any_digit = false;
  for (; i < text.size() && text[i] != '.'; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') return std::nullopt;
    const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
    if (whole_part > (kMax - d) / 10) return std::nullopt;
    whole_part = whole_part * 10 + d;
    any_digit = true;
  }

  std::uint64_t frac = 0;
  int frac_digits = 0;
  if (i < text.size()) {
    ++i;  // '.'
    if (i == text.size()) return std::nullopt;
    for (; i < text.size(); ++i) {
      const char c = text[i];
      if (c < '0' || c > '9') return std::nullopt;
      if (++frac_digits > 6) return std::nullopt;
      frac = frac * 10 + static_cast<std::uint64_t>(c - '0');
    }
  }
  if (!any_digit) return std::nullopt;
  for (int k = frac_digits; k < 6; ++k) frac *= 10;

  if (whole_part > (kMax - frac) / kScale) return std::nullopt;
  return Epsilon(whole_part * kScale + frac);
}

std::string Epsilon::to_string() const {
  std::string out = std::to_string(micros_ / kScale);
  std::uint64_t frac = micros_ % kScale;
  if (frac == 0) return out;
  std::string digits = std::to_string(frac);
  digits.insert(0, 6 - digits.size(), '0');
  while (!digits.empty() && digits.back() == '0') digits.pop_back();
  return out + "." + digits;
}

double Epsilon::ratio_of(Epsilon whole) const {
  if (whole.micros_ == 0) return 0.0;
  return static_cast<double>(micros_) / static_cast<double>(whole.micros_);
}

jsonlite::Value epsilon_to_json(Epsilon e) { return jsonlite::Value{e.to_string()}; }

std::optional<Epsilon> epsilon_from_json(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (const auto* s = std::get_if<std::string>(&it->second.v)) return Epsilon::parse(*s);
  if (const auto* u = std::get_if<std::uint64_t>(&it->second.v)) {
    if (*u > std::numeric_limits<std::uint64_t>::max() / Epsilon::kScale) return std::nullopt;
    return Epsilon::whole(*u);
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// JobState
// ---------------------------------------------------------------------------

std::string to_string(JobState s) {
  switch (s) {
    case JobState::pending: return "pending";
    case JobState::processing: return "processing";
    case JobState::completed: return "completed";
    case JobState::failed: return "failed";
    case JobState::verified: return "verified";
  }
  return "";
}

std::optional<JobState> job_state_from_string(std::string_view s) {
  if (s == "pending") return JobState::pending;
  if (s == "processing") return JobState::processing;
  if (s == "completed") return JobState::completed;
  if (s == "failed") return JobState::failed;
  if (s == "verified") return JobState::verified;
  return std::nullopt;
}

bool is_terminal(JobState s) { return s == JobState::failed || s == JobState::verified; }

// ---------------------------------------------------------------------------
// JSON forms (journal records)
// ---------------------------------------------------------------------------

jsonlite::Object handle_to_json(const DatasetHandle& h) {
  jsonlite::Object o;
  o["digest"] = h.digest;
  o["owner"] = h.owner;
  o["size_bytes"] = h.size_bytes;
  o["encryption_meta_hash"] = h.encryption_meta_hash;
  return o;
}

DatasetHandle handle_from_json(const jsonlite::Object& o) {
  DatasetHandle h;
  h.digest = jsonlite::get_string(o, "digest");
  h.owner = jsonlite::get_string(o, "owner");
  h.size_bytes = jsonlite::get_u64(o, "size_bytes");
  h.encryption_meta_hash = jsonlite::get_string(o, "encryption_meta_hash");
  return h;
}

jsonlite::Object proof_to_json(const Proof& p) {
  jsonlite::Object o;
  o["circuit_id"] = p.circuit_id;
  o["proof_bytes"] = p.proof_bytes;
  jsonlite::Array inputs;
  for (const auto& in : p.public_inputs) inputs.emplace_back(in);
  o["public_inputs"] = std::move(inputs);
  o["result_hash"] = p.result_hash;
  return o;
}

Proof proof_from_json(const jsonlite::Object& o) {
  Proof p;
  p.circuit_id = jsonlite::get_string(o, "circuit_id");
  p.proof_bytes = jsonlite::get_string(o, "proof_bytes");
  p.public_inputs = jsonlite::get_string_array(o, "public_inputs");
  p.result_hash = jsonlite::get_string(o, "result_hash");
  return p;
}

jsonlite::Object job_to_json(const AnalyticsJob& j) {
  jsonlite::Object o;
  o["id"] = j.id;
  o["requester"] = j.requester;
  o["dataset"] = handle_to_json(j.dataset);
  o["category"] = j.category;
  o["circuit_id"] = j.circuit_id;
  o["epsilon"] = epsilon_to_json(j.epsilon);
  o["created_at_ms"] = j.created_at_ms;
  o["updated_at_ms"] = j.updated_at_ms;
  o["state"] = to_string(j.state);
  o["reservation_id"] = j.reservation_id;
  if (j.result_hash) o["result_hash"] = *j.result_hash;
  if (j.proof) o["proof"] = proof_to_json(*j.proof);
  if (j.failure != ErrorCode::none) {
    o["failure"] = to_string(j.failure);
    o["failure_class"] = to_string(error_class(j.failure));
    o["failure_detail"] = j.failure_detail;
  }
  return o;
}

std::optional<AnalyticsJob> job_from_json(const jsonlite::Object& o) {
  AnalyticsJob j;
  j.id = jsonlite::get_u64(o, "id");
  if (j.id == 0) return std::nullopt;
  auto state = job_state_from_string(jsonlite::get_string(o, "state"));
  if (!state) return std::nullopt;
  auto eps = epsilon_from_json(o, "epsilon");
  if (!eps) return std::nullopt;
  auto failure = error_code_from_string(jsonlite::get_string(o, "failure"));
  if (!failure) return std::nullopt;

  j.state = *state;
  j.epsilon = *eps;
  j.failure = *failure;
  j.requester = jsonlite::get_string(o, "requester");
  if (const auto* ds = jsonlite::get_object(o, "dataset")) j.dataset = handle_from_json(*ds);
  j.category = jsonlite::get_string(o, "category");
  j.circuit_id = jsonlite::get_string(o, "circuit_id");
  j.created_at_ms = jsonlite::get_u64(o, "created_at_ms");
  j.updated_at_ms = jsonlite::get_u64(o, "updated_at_ms");
  j.reservation_id = jsonlite::get_string(o, "reservation_id");
  if (jsonlite::has_key(o, "result_hash")) j.result_hash = jsonlite::get_string(o, "result_hash");
  if (const auto* p = jsonlite::get_object(o, "proof")) j.proof = proof_from_json(*p);
  j.failure_detail = jsonlite::get_string(o, "failure_detail");
  return j;
}

}  // namespace insight
