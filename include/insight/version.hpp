#pragma once

// insight/version.hpp — Version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift between the journal, the content store and
//   the proof commitment scheme. Every component that reads or writes a
//   versioned format checks its constant here before processing data.
//
// INVARIANT:
//   Never silently accept data written by a newer format version than the
//   binary was compiled against. check_journal_version() fails closed.

#include <cstdint>
#include <string>

namespace insight {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256 with domain prefixes ("cas:", "pdp:", "zkp:",
// "res:", "vk:"). Bump when a prefix or the primitive changes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CAS_FORMAT_VERSION
// Version 2 = AB/CD/<64-char-digest> sharding with JSON .meta sidecars and
// a pins.ndjson pin journal.
// ---------------------------------------------------------------------------
constexpr uint32_t CAS_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// Tracks the NDJSON record layout of the audit journal that backs the
// ledger client (kind/key/payload records, BLAKE3-chained).
// Adding or removing a required record field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// PROOF_COMMITMENT_VERSION
// Tracks the byte layout hashed by commit_proof(). Provers and verifiers
// must agree on it or every proof is rejected.
// ---------------------------------------------------------------------------
constexpr uint32_t PROOF_COMMITMENT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t journal_format{JOURNAL_FORMAT_VERSION};
  uint32_t proof_commitment{PROOF_COMMITMENT_VERSION};
  std::string semver;           // e.g. "0.3.0"
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;   // empty if ok
  std::string description;
};

// Validate a journal record's format version against this build.
CompatibilityResult check_journal_version(uint32_t recorded_version);

}  // namespace version
}  // namespace insight
