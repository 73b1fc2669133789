#pragma once

// insight/audit.hpp — Append-only, hash-chained journal.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: records are never modified or deleted.
//   2. SEQUENTIAL: each record carries a sequence number one greater than
//      its predecessor, continuing across process restarts.
//   3. STRUCTURED: every record is a single-line canonical JSON object.
//   4. CHAINED: record N carries prev = BLAKE3(line N-1); the first record
//      carries 64 zeros. Any edit, reorder or deletion breaks the chain.
//   5. FAIL-CLOSED: a journal whose existing chain does not verify is opened
//      read-only; append() then refuses every record.
//
// The journal is the durable store behind FileLedgerClient: job snapshots,
// budget snapshots, policies, frameworks and circuits are all records here.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "insight/clock.hpp"
#include "insight/jsonlite.hpp"

namespace insight {

inline constexpr char kGenesisDigest[] =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct AuditRecord {
  uint64_t sequence{0};           // assigned by append()
  std::string previous_digest;    // assigned by append()
  uint64_t timestamp_unix_ms{0};  // assigned by append()
  uint32_t format_version{0};     // assigned by append()
  std::string kind;               // job | budget | policy | framework | circuit
  std::string key;                // id within kind
  jsonlite::Object payload;
};

// Canonical single-line JSON.
std::string audit_record_to_json(const AuditRecord& r);
std::optional<AuditRecord> audit_record_from_json(const std::string& line, std::string* error = nullptr);

struct AuditChainReport {
  bool ok{true};
  uint64_t entries{0};
  uint64_t first_bad_sequence{0};  // 0 if ok
  std::string last_digest{kGenesisDigest};
  std::string error;
};

// Re-read a journal file and verify sequence continuity and chaining.
// A missing file verifies as an empty journal.
AuditChainReport verify_audit_chain(const std::string& path);

// Load every record of a journal, in order. Fails on the first unreadable line.
bool load_audit_records(const std::string& path, std::vector<AuditRecord>* out, std::string* error);

// ---------------------------------------------------------------------------
// ImmutableAuditLog — append-only NDJSON writer
// ---------------------------------------------------------------------------
// Thread-safe: an internal mutex serializes appends.
// Each write is followed by fflush() to minimize data loss on crash.
class ImmutableAuditLog {
 public:
  // Opens (or creates) `path`, verifying any existing chain so sequence and
  // chaining continue where the previous process stopped.
  explicit ImmutableAuditLog(const std::string& path, std::shared_ptr<IClock> clock = nullptr);
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, prev, timestamp and format version in place.
  // INVARIANT: if append() returns false, the record is not persisted and
  // the caller must not act as if it were.
  bool append(AuditRecord& record);

  // Empty when the journal is writable.
  const std::string& open_error() const;

  uint64_t last_sequence() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::shared_ptr<IClock> clock_;
  std::unique_ptr<Impl> impl_;
};

}  // namespace insight
