#include "insight/possession.hpp"

#include <random>

#include "insight/hash.hpp"
#include "insight/observability.hpp"

namespace insight {

jsonlite::Object storage_stats_to_json(const StorageStats& s) {
  jsonlite::Object o;
  o["handle"] = handle_to_json(s.handle);
  o["created_at_ms"] = s.created_at_ms;
  o["deadline_ms"] = s.deadline_ms;
  o["last_verified_ms"] = s.last_verified_ms;
  o["challenges_issued"] = s.challenges_issued;
  o["challenges_passed"] = s.challenges_passed;
  o["challenges_failed"] = s.challenges_failed;
  o["active"] = s.active;
  return o;
}

// ---------------------------------------------------------------------------
// Reference possession scheme
// ---------------------------------------------------------------------------

std::string possession_response(const std::string& nonce, const std::string& bytes) {
  return hash_domain_parts(kDomainPossession, {nonce, bytes});
}

ContentPossessionVerifier::ContentPossessionVerifier(std::shared_ptr<IContentStore> content)
    : content_(std::move(content)) {}

bool ContentPossessionVerifier::verify(const std::string& proof, const std::string& nonce,
                                       const std::string& digest) const {
  if (!is_hex_digest(proof) || !is_hex_digest(nonce)) return false;
  auto bytes = content_->get(digest);
  if (!bytes) return false;
  return possession_response(nonce, *bytes) == proof;
}

ContentStoreProver::ContentStoreProver(std::shared_ptr<IContentStore> content)
    : content_(std::move(content)) {}

std::optional<std::string> ContentStoreProver::respond(const std::string& digest,
                                                       const std::string& nonce) {
  auto bytes = content_->get(digest);
  if (!bytes) return std::nullopt;
  return possession_response(nonce, *bytes);
}

// ---------------------------------------------------------------------------
// PossessionStore
// ---------------------------------------------------------------------------

PossessionStore::PossessionStore(std::shared_ptr<IContentStore> content,
                                 std::shared_ptr<IPossessionVerifier> verifier,
                                 std::shared_ptr<IClock> clock, uint64_t max_size_bytes)
    : content_(std::move(content)),
      verifier_(std::move(verifier)),
      clock_(std::move(clock)),
      max_size_bytes_(max_size_bytes) {}

std::shared_ptr<PossessionStore::Entry> PossessionStore::find(const std::string& digest) const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  auto it = entries_.find(digest);
  return it == entries_.end() ? nullptr : it->second;
}

std::string PossessionStore::fresh_nonce() const {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::string seed;
  for (int i = 0; i < 4; ++i) seed += std::to_string(rng());
  seed += std::to_string(clock_->now_unix_ms());
  return blake3_hex(seed);
}

Outcome PossessionStore::store(const DatasetHandle& handle, uint64_t duration_ms) {
  if (!is_hex_digest(handle.digest)) {
    return Outcome::fail(ErrorCode::unknown_handle, "malformed digest");
  }
  if (max_size_bytes_ > 0 && handle.size_bytes > max_size_bytes_) {
    return Outcome::fail(ErrorCode::size_exceeds_limit,
                         std::to_string(handle.size_bytes) + " > " + std::to_string(max_size_bytes_));
  }
  const uint64_t now = clock_->now_unix_ms();
  auto entry = std::make_shared<Entry>();
  entry->stats.handle = handle;
  entry->stats.created_at_ms = now;
  entry->stats.deadline_ms = now + duration_ms;

  std::unique_lock<std::shared_mutex> lk(map_mu_);
  if (entries_.contains(handle.digest)) {
    return Outcome::fail(ErrorCode::already_exists, handle.digest);
  }
  entries_.emplace(handle.digest, std::move(entry));
  return Outcome::success();
}

PossessionStore::IngestResult PossessionStore::ingest(const std::string& bytes, const std::string& owner,
                                                      const std::string& encryption_meta_hash,
                                                      uint64_t duration_ms) {
  IngestResult r;
  if (max_size_bytes_ > 0 && bytes.size() > max_size_bytes_) {
    r.error = ErrorCode::size_exceeds_limit;
    r.detail = std::to_string(bytes.size()) + " > " + std::to_string(max_size_bytes_);
    return r;
  }
  const std::string digest = content_->put(bytes);
  if (digest.empty()) {
    r.error = ErrorCode::persistence_failed;
    r.detail = "content store rejected put";
    return r;
  }
  if (!content_->pin(digest)) {
    r.error = ErrorCode::persistence_failed;
    r.detail = "content store could not pin " + digest;
    return r;
  }

  r.handle.digest = digest;
  r.handle.owner = owner;
  r.handle.size_bytes = bytes.size();
  r.handle.encryption_meta_hash = encryption_meta_hash;
  auto st = store(r.handle, duration_ms);
  r.error = st.error;
  r.detail = st.detail;
  return r;
}

PossessionStore::ReadResult PossessionStore::read(const std::string& digest) const {
  ReadResult r;
  auto entry = find(digest);
  if (!entry) {
    r.error = ErrorCode::unknown_handle;
    return r;
  }
  {
    std::lock_guard<std::mutex> lk(entry->mu);
    if (clock_->now_unix_ms() >= entry->stats.deadline_ms) {
      r.error = ErrorCode::storage_expired;
      return r;
    }
  }
  auto bytes = content_->get(digest);
  if (!bytes) {
    r.error = ErrorCode::unknown_handle;
    return r;
  }
  r.bytes = std::move(*bytes);
  return r;
}

PossessionStore::ChallengeResult PossessionStore::issue_challenge(const std::string& digest) {
  ChallengeResult r;
  auto entry = find(digest);
  if (!entry) {
    r.error = ErrorCode::unknown_handle;
    return r;
  }
  std::lock_guard<std::mutex> lk(entry->mu);
  const uint64_t now = clock_->now_unix_ms();
  if (now >= entry->stats.deadline_ms) {
    r.error = ErrorCode::storage_expired;
    return r;
  }
  PossessionChallenge ch;
  ch.digest = digest;
  do {
    ch.nonce = fresh_nonce();
  } while (entry->challenges.contains(ch.nonce));
  ch.issued_at_ms = now;
  entry->challenges.emplace(ch.nonce, ch);
  ++entry->stats.challenges_issued;
  global_pipeline_stats().challenges_issued.fetch_add(1, std::memory_order_relaxed);
  r.challenge = std::move(ch);
  return r;
}

PossessionStore::AnswerResult PossessionStore::answer_challenge(const std::string& digest,
                                                               const std::string& nonce,
                                                               const std::string& proof) {
  AnswerResult r;
  auto entry = find(digest);
  if (!entry) {
    r.error = ErrorCode::unknown_handle;
    return r;
  }
  std::lock_guard<std::mutex> lk(entry->mu);
  auto it = entry->challenges.find(nonce);
  if (it == entry->challenges.end()) {
    r.error = ErrorCode::unknown_challenge;
    return r;
  }
  PossessionChallenge& ch = it->second;
  if (ch.answered || ch.cancelled) {
    r.error = ErrorCode::challenge_already_answered;
    return r;
  }

  // Invalidate before anything else can observe the nonce.
  ch.answered = true;
  ch.proof = proof;

  const uint64_t now = clock_->now_unix_ms();
  if (now >= entry->stats.deadline_ms) {
    ch.verified = false;
    ++entry->stats.challenges_failed;
    global_pipeline_stats().challenges_failed.fetch_add(1, std::memory_order_relaxed);
    r.error = ErrorCode::storage_expired;
    return r;
  }

  const bool ok = verifier_->verify(proof, nonce, digest);
  ch.verified = ok;
  r.verified = ok;
  if (ok) {
    ++entry->stats.challenges_passed;
    entry->stats.last_verified_ms = now;
    global_pipeline_stats().challenges_passed.fetch_add(1, std::memory_order_relaxed);
  } else {
    ++entry->stats.challenges_failed;
    global_pipeline_stats().challenges_failed.fetch_add(1, std::memory_order_relaxed);
  }
  return r;
}

Outcome PossessionStore::cancel_challenge(const std::string& digest, const std::string& nonce) {
  auto entry = find(digest);
  if (!entry) return Outcome::fail(ErrorCode::unknown_handle, digest);
  std::lock_guard<std::mutex> lk(entry->mu);
  auto it = entry->challenges.find(nonce);
  if (it == entry->challenges.end()) return Outcome::fail(ErrorCode::unknown_challenge, nonce);
  if (it->second.answered || it->second.cancelled) {
    return Outcome::fail(ErrorCode::challenge_already_answered, nonce);
  }
  it->second.cancelled = true;
  return Outcome::success();
}

bool PossessionStore::is_active(const std::string& digest) const {
  auto entry = find(digest);
  if (!entry) return false;
  std::lock_guard<std::mutex> lk(entry->mu);
  return clock_->now_unix_ms() < entry->stats.deadline_ms;
}

Outcome PossessionStore::renew(const std::string& digest, uint64_t extra_duration_ms) {
  auto entry = find(digest);
  if (!entry) return Outcome::fail(ErrorCode::unknown_handle, digest);
  std::lock_guard<std::mutex> lk(entry->mu);
  const uint64_t now = clock_->now_unix_ms();
  // An expired handle is renewed from now, not from its stale deadline.
  const uint64_t base = entry->stats.deadline_ms > now ? entry->stats.deadline_ms : now;
  entry->stats.deadline_ms = base + extra_duration_ms;
  return Outcome::success();
}

std::optional<DatasetHandle> PossessionStore::handle(const std::string& digest) const {
  auto entry = find(digest);
  if (!entry) return std::nullopt;
  std::lock_guard<std::mutex> lk(entry->mu);
  return entry->stats.handle;
}

std::optional<StorageStats> PossessionStore::stats(const std::string& digest) const {
  auto entry = find(digest);
  if (!entry) return std::nullopt;
  std::lock_guard<std::mutex> lk(entry->mu);
  StorageStats s = entry->stats;
  s.active = clock_->now_unix_ms() < s.deadline_ms;
  return s;
}

std::optional<PossessionChallenge> PossessionStore::challenge(const std::string& digest,
                                                              const std::string& nonce) const {
  auto entry = find(digest);
  if (!entry) return std::nullopt;
  std::lock_guard<std::mutex> lk(entry->mu);
  auto it = entry->challenges.find(nonce);
  if (it == entry->challenges.end()) return std::nullopt;
  return it->second;
}

std::vector<StorageStats> PossessionStore::list() const {
  std::vector<std::shared_ptr<Entry>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    for (const auto& [digest, e] : entries_) snapshot.push_back(e);
  }
  std::vector<StorageStats> out;
  const uint64_t now = clock_->now_unix_ms();
  for (const auto& e : snapshot) {
    std::lock_guard<std::mutex> lk(e->mu);
    StorageStats s = e->stats;
    s.active = now < s.deadline_ms;
    out.push_back(std::move(s));
  }
  return out;
}

}  // namespace insight
