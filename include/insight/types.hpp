#pragma once

// insight/types.hpp — Core data structures for the analytics job pipeline.
//
// MEMORY OWNERSHIP:
//   - All types here are value types with owned string members.
//   - A job references its dataset by DatasetHandle value (digest + metadata);
//     the bytes themselves live only in the content store.
//
// NUMERIC SEMANTICS:
//   - Privacy budget is fixed point (Epsilon, micro-units). No floating point
//     participates in any budget comparison or sum.
//
// ERROR MODEL:
//   - Every rejected operation carries an ErrorCode. Codes are grouped into
//     ErrorClass values so callers can decide whether to retry, fix metadata,
//     renew storage, or treat the result as untrustworthy.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "insight/jsonlite.hpp"

namespace insight {

enum class ErrorCode {
  none,
  // admission
  unknown_category,
  unknown_framework,
  compliance_violation,
  insufficient_budget,
  invalid_epsilon,
  // possession
  unknown_handle,
  storage_expired,
  challenge_failed,
  challenge_already_answered,
  unknown_challenge,
  already_exists,
  size_exceeds_limit,
  // computation
  backend_failure,
  timeout,
  cancelled,
  interrupted,
  // proof
  proof_rejected,
  // registry
  already_registered,
  unknown_circuit,
  invalid_policy,
  budget_limit_conflict,
  // ledger
  unknown_reservation,
  reset_not_due,
  // transition
  invalid_transition,
  unknown_job,
  cancel_not_permitted,
  // persistence
  persistence_failed,
  config_invalid,
  json_parse_error,
};

enum class ErrorClass {
  none,
  admission,
  possession,
  computation,
  proof,
  registry,
  ledger,
  transition,
  persistence,
};

std::string to_string(ErrorCode code);
std::string to_string(ErrorClass cls);
ErrorClass error_class(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view s);

// Generic status value for operations without a payload.
struct Outcome {
  ErrorCode error{ErrorCode::none};
  std::string detail;

  bool ok() const { return error == ErrorCode::none; }

  static Outcome success() { return {}; }
  static Outcome fail(ErrorCode code, std::string detail = {}) {
    return Outcome{code, std::move(detail)};
  }
};

// ---------------------------------------------------------------------------
// Epsilon — fixed-point privacy budget, scale 10^6.
// ---------------------------------------------------------------------------
class Epsilon {
 public:
  static constexpr std::uint64_t kScale = 1'000'000;

  constexpr Epsilon() = default;
  static constexpr Epsilon from_micros(std::uint64_t micros) { return Epsilon(micros); }
  static constexpr Epsilon whole(std::uint64_t units) { return Epsilon(units * kScale); }

  // Decimal text: "10", "0.05", "1.234567". At most 6 fractional digits.
  // Rejects signs, exponents, empty input and values that overflow.
  static std::optional<Epsilon> parse(std::string_view text);

  constexpr std::uint64_t micros() const { return micros_; }
  constexpr bool is_zero() const { return micros_ == 0; }

  // Canonical decimal rendering ("6", "0.05").
  std::string to_string() const;

  // Fraction of `whole` as a ratio in [0, 1+], for reporting only.
  double ratio_of(Epsilon whole) const;

  friend constexpr Epsilon operator+(Epsilon a, Epsilon b) { return Epsilon(a.micros_ + b.micros_); }
  // Caller must have established a >= b.
  friend constexpr Epsilon operator-(Epsilon a, Epsilon b) { return Epsilon(a.micros_ - b.micros_); }
  friend constexpr auto operator<=>(Epsilon a, Epsilon b) = default;

 private:
  constexpr explicit Epsilon(std::uint64_t micros) : micros_(micros) {}
  std::uint64_t micros_{0};
};

// JSON: canonical decimal string. Accepts either a decimal string or an
// unsigned integer number of whole units on input.
jsonlite::Value epsilon_to_json(Epsilon e);
std::optional<Epsilon> epsilon_from_json(const jsonlite::Object& obj, const std::string& key);

// ---------------------------------------------------------------------------
// Datasets, jobs, proofs
// ---------------------------------------------------------------------------

struct DatasetHandle {
  std::string digest;                // content id, 64-char hex
  std::string owner;
  std::uint64_t size_bytes{0};
  std::string encryption_meta_hash;  // hash of the encryption metadata
};

jsonlite::Object handle_to_json(const DatasetHandle& h);
DatasetHandle handle_from_json(const jsonlite::Object& o);

enum class JobState {
  pending,
  processing,
  completed,
  failed,
  verified,
};

std::string to_string(JobState s);
std::optional<JobState> job_state_from_string(std::string_view s);
bool is_terminal(JobState s);

struct Proof {
  std::string circuit_id;
  std::string proof_bytes;                 // hex
  std::vector<std::string> public_inputs;  // ordered
  std::string result_hash;
};

jsonlite::Object proof_to_json(const Proof& p);
Proof proof_from_json(const jsonlite::Object& o);

struct AnalyticsJob {
  std::uint64_t id{0};
  std::string requester;
  DatasetHandle dataset;
  std::string category;
  std::string circuit_id;
  Epsilon epsilon;
  std::uint64_t created_at_ms{0};
  std::uint64_t updated_at_ms{0};
  JobState state{JobState::pending};
  std::string reservation_id;
  std::optional<std::string> result_hash;
  std::optional<Proof> proof;
  ErrorCode failure{ErrorCode::none};  // set when state == failed
  std::string failure_detail;
};

jsonlite::Object job_to_json(const AnalyticsJob& j);
std::optional<AnalyticsJob> job_from_json(const jsonlite::Object& o);

}  // namespace insight
