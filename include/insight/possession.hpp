#pragma once

// insight/possession.hpp — Possession store: registered dataset handles,
// storage deadlines and single-use possession challenges.
//
// INVARIANTS:
//   1. A challenge is answered at most once. Its nonce is invalidated under
//      the same lock that records the verification result, so two concurrent
//      answers can never both be evaluated.
//   2. A cancelled challenge can never be answered.
//   3. Once now >= deadline, issue_challenge() and read() fail with
//      storage_expired until renew() moves the deadline forward. Renewal
//      never erases challenge history or counters.
//
// CONCURRENCY:
//   The handle map is guarded by a shared_mutex; each handle carries its own
//   mutex. Operations on distinct handles never contend.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "insight/cas.hpp"
#include "insight/clock.hpp"
#include "insight/types.hpp"

namespace insight {

struct PossessionChallenge {
  std::string digest;
  std::string nonce;  // 64 hex chars, fresh per challenge
  uint64_t issued_at_ms{0};
  bool answered{false};
  bool cancelled{false};
  std::optional<std::string> proof;
  std::optional<bool> verified;
};

struct StorageStats {
  DatasetHandle handle;
  uint64_t created_at_ms{0};
  uint64_t deadline_ms{0};
  uint64_t last_verified_ms{0};  // 0 = never
  uint64_t challenges_issued{0};
  uint64_t challenges_passed{0};
  uint64_t challenges_failed{0};
  bool active{false};
};

jsonlite::Object storage_stats_to_json(const StorageStats& s);

// ---------------------------------------------------------------------------
// Possession scheme (pluggable)
// ---------------------------------------------------------------------------
// EXTENSION_POINT: possession_scheme
//   Current: response = BLAKE3("pdp:" || nonce || bytes).
//   A Merkle-sampled PDP scheme replaces both halves without touching the
//   store. Requirements: deterministic, a wrong proof is always rejected, and
//   the response depends on the nonce so old answers cannot be replayed.

class IPossessionVerifier {
 public:
  virtual ~IPossessionVerifier() = default;
  virtual bool verify(const std::string& proof, const std::string& nonce,
                      const std::string& digest) const = 0;
  virtual std::string scheme() const = 0;
};

// The data holder's side of the protocol.
class IPossessionProver {
 public:
  virtual ~IPossessionProver() = default;
  // nullopt if the holder cannot produce a response (data lost).
  virtual std::optional<std::string> respond(const std::string& digest, const std::string& nonce) = 0;
};

// Expected response for the reference scheme.
std::string possession_response(const std::string& nonce, const std::string& bytes);

class ContentPossessionVerifier : public IPossessionVerifier {
 public:
  explicit ContentPossessionVerifier(std::shared_ptr<IContentStore> content);
  bool verify(const std::string& proof, const std::string& nonce,
              const std::string& digest) const override;
  std::string scheme() const override { return "blake3-pdp-v1"; }

 private:
  std::shared_ptr<IContentStore> content_;
};

class ContentStoreProver : public IPossessionProver {
 public:
  explicit ContentStoreProver(std::shared_ptr<IContentStore> content);
  std::optional<std::string> respond(const std::string& digest, const std::string& nonce) override;

 private:
  std::shared_ptr<IContentStore> content_;
};

// ---------------------------------------------------------------------------
// PossessionStore
// ---------------------------------------------------------------------------
class PossessionStore {
 public:
  // max_size_bytes: 0 = unlimited.
  PossessionStore(std::shared_ptr<IContentStore> content,
                  std::shared_ptr<IPossessionVerifier> verifier,
                  std::shared_ptr<IClock> clock,
                  uint64_t max_size_bytes = 0);

  // Register a handle with a storage deadline of now + duration_ms.
  // already_exists | size_exceeds_limit | unknown_handle (malformed digest)
  Outcome store(const DatasetHandle& handle, uint64_t duration_ms);

  struct IngestResult {
    ErrorCode error{ErrorCode::none};
    std::string detail;
    DatasetHandle handle;
  };
  // Content-store data path: put + pin + store.
  IngestResult ingest(const std::string& bytes, const std::string& owner,
                      const std::string& encryption_meta_hash, uint64_t duration_ms);

  struct ReadResult {
    ErrorCode error{ErrorCode::none};
    std::string bytes;
  };
  ReadResult read(const std::string& digest) const;

  struct ChallengeResult {
    ErrorCode error{ErrorCode::none};
    PossessionChallenge challenge;
  };
  ChallengeResult issue_challenge(const std::string& digest);

  struct AnswerResult {
    ErrorCode error{ErrorCode::none};  // non-none: the answer was not evaluated
    bool verified{false};
  };
  AnswerResult answer_challenge(const std::string& digest, const std::string& nonce,
                                const std::string& proof);

  // Close an unanswered challenge. unknown_handle | unknown_challenge |
  // challenge_already_answered
  Outcome cancel_challenge(const std::string& digest, const std::string& nonce);

  bool is_active(const std::string& digest) const;
  Outcome renew(const std::string& digest, uint64_t extra_duration_ms);

  std::optional<DatasetHandle> handle(const std::string& digest) const;
  std::optional<StorageStats> stats(const std::string& digest) const;
  std::optional<PossessionChallenge> challenge(const std::string& digest, const std::string& nonce) const;
  std::vector<StorageStats> list() const;

  const std::shared_ptr<IContentStore>& content() const { return content_; }

 private:
  struct Entry {
    mutable std::mutex mu;
    StorageStats stats;
    std::map<std::string, PossessionChallenge> challenges;  // by nonce
  };

  std::shared_ptr<Entry> find(const std::string& digest) const;
  std::string fresh_nonce() const;

  std::shared_ptr<IContentStore> content_;
  std::shared_ptr<IPossessionVerifier> verifier_;
  std::shared_ptr<IClock> clock_;
  uint64_t max_size_bytes_;

  mutable std::shared_mutex map_mu_;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace insight
