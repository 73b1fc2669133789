#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "insight/audit.hpp"
#include "insight/backend.hpp"
#include "insight/cas.hpp"
#include "insight/clock.hpp"
#include "insight/compliance.hpp"
#include "insight/config.hpp"
#include "insight/coordinator.hpp"
#include "insight/hash.hpp"
#include "insight/jsonlite.hpp"
#include "insight/ledger_client.hpp"
#include "insight/observability.hpp"
#include "insight/pipeline.hpp"
#include "insight/policy.hpp"
#include "insight/possession.hpp"
#include "insight/privacy_ledger.hpp"
#include "insight/proof_verifier.hpp"
#include "insight/types.hpp"
#include "insight/version.hpp"
#include "insight/watchdog.hpp"

namespace fs = std::filesystem;
using namespace insight;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("insight_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

Epsilon eps(const char* text) { return Epsilon::parse(text).value(); }

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

jsonlite::Object hipaa_metadata() {
  jsonlite::Object md;
  md["encryptionInTransit"] = true;
  md["encryptionAtRest"] = true;
  md["accessControl"] = true;
  md["auditLogging"] = true;
  md["minimumNecessary"] = true;
  return md;
}

jsonlite::Object financial_metadata() {
  jsonlite::Object md;
  md["cardDataEncrypted"] = true;
  md["secureNetwork"] = true;
  md["auditTrail"] = true;
  md["internalControls"] = true;
  return md;
}

// Backend whose results the test releases by hand.
class ManualBackend : public IComputationBackend {
 public:
  std::future<ComputationOutput> dispatch(uint64_t job_id, const DatasetHandle&, const std::string&) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto& p = promises_[job_id];
    p = std::promise<ComputationOutput>();
    return p.get_future();
  }
  std::string backend_id() const override { return "manual"; }

  bool deliver(uint64_t job_id, ComputationOutput out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = promises_.find(job_id);
    if (it == promises_.end()) return false;
    it->second.set_value(std::move(out));
    promises_.erase(it);
    return true;
  }

  bool crash(uint64_t job_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = promises_.find(job_id);
    if (it == promises_.end()) return false;
    it->second.set_exception(std::make_exception_ptr(std::runtime_error("worker crashed")));
    promises_.erase(it);
    return true;
  }

 private:
  std::mutex mu_;
  std::map<uint64_t, std::promise<ComputationOutput>> promises_;
};

// A holder that lost its data and answers with garbage.
class LyingProver : public IPossessionProver {
 public:
  std::optional<std::string> respond(const std::string&, const std::string& nonce) override {
    return possession_response(nonce, "not the dataset");
  }
};

// Journal whose budget snapshots never become durable. With strip_embedded
// set it also drops the snapshot a verified job record carries.
class LossyBudgetJournal : public ILedgerClient {
 public:
  explicit LossyBudgetJournal(bool strip_embedded) : strip_embedded_(strip_embedded) {}

  Outcome persist(const LedgerEvent& ev) override {
    if (ev.kind == kKindBudget) return Outcome::fail(ErrorCode::persistence_failed, "budget write lost");
    if (!strip_embedded_) return inner_.persist(ev);
    LedgerEvent copy = ev;
    copy.payload.erase(kKindBudget);
    return inner_.persist(copy);
  }
  std::optional<jsonlite::Object> read(const std::string& kind, const std::string& key) const override {
    return inner_.read(kind, key);
  }
  Outcome replay(std::vector<LedgerEvent>* out) const override { return inner_.replay(out); }

 private:
  bool strip_embedded_;
  MemoryLedgerClient inner_;
};

const VerifyingKey kTestKey{"test-verifying-key", 2};
const char* const kCircuit = "mean-v1";

struct Fixture {
  fs::path dir;
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::shared_ptr<CasStore> content;
  std::shared_ptr<PossessionStore> possession;
  std::shared_ptr<PrivacyLedger> ledger;
  std::shared_ptr<ComplianceEngine> compliance;
  std::shared_ptr<CommitmentProofVerifier> verifier;
  std::shared_ptr<ManualBackend> backend = std::make_shared<ManualBackend>();
  std::shared_ptr<ILedgerClient> journal;
  std::shared_ptr<JobCoordinator> coord;
  DatasetHandle handle;
  std::string bytes{"age,income\n34,52000\n41,61000\n"};

  // fresh: wipe the directory, register circuit and policies.
  // otherwise: replay the journal found in the directory.
  Fixture(const std::string& name, bool fresh = true, bool file_journal = false,
          std::shared_ptr<IPossessionProver> prover = nullptr, std::shared_ptr<ILedgerClient> shared_journal = nullptr) {
    dir = fs::temp_directory_path() / ("insight_test_" + name);
    if (fresh) {
      fs::remove_all(dir);
      fs::create_directories(dir);
    }
    content = std::make_shared<CasStore>((dir / "cas").string(), "off", clock);
    possession = std::make_shared<PossessionStore>(
        content, std::make_shared<ContentPossessionVerifier>(content), clock);
    ledger = std::make_shared<PrivacyLedger>(clock);
    compliance = std::make_shared<ComplianceEngine>();
    for (auto& f : builtin_frameworks()) expect(compliance->register_framework(std::move(f)).ok(), "builtin");
    verifier = std::make_shared<CommitmentProofVerifier>();
    if (shared_journal) {
      journal = std::move(shared_journal);
    } else if (file_journal) {
      journal = std::make_shared<FileLedgerClient>((dir / "ledger.ndjson").string(), clock);
    } else {
      journal = std::make_shared<MemoryLedgerClient>();
    }

    CoordinatorDeps deps;
    deps.ledger = ledger;
    deps.compliance = compliance;
    deps.possession = possession;
    deps.prover = prover;
    if (!deps.prover) deps.prover = std::make_shared<ContentStoreProver>(content);
    deps.verifier = verifier;
    deps.backend = backend;
    deps.journal = journal;
    deps.clock = clock;
    CoordinatorOptions opts;
    opts.processing_deadline_ms = 60'000;
    opts.pending_deadline_ms = 120'000;
    opts.budget_period_ms = 30 * kMsPerDay;
    coord = std::make_shared<JobCoordinator>(deps, opts);

    if (fresh) {
      expect(coord->register_circuit(kCircuit, kTestKey).ok(), "register circuit");
      PrivacyPolicy health;
      health.category = "healthcare";
      health.encryption = EncryptionMethod::aes256;
      health.privacy_level = 9;
      health.tee_required = true;
      health.frameworks = {"HIPAA"};
      health.epsilon_limit = Epsilon::whole(10);
      expect(coord->set_policy(health).ok(), "healthcare policy");
      PrivacyPolicy fin = health;
      fin.category = "financial";
      fin.privacy_level = 10;
      fin.frameworks = {"PCI_DSS", "SOX"};
      expect(coord->set_policy(fin).ok(), "financial policy");
    }

    auto ing = possession->ingest(bytes, "alice", blake3_hex("aes256-gcm"), kMsPerDay);
    expect(ing.error == ErrorCode::none, "ingest dataset");
    handle = ing.handle;
  }

  SubmitRequest request(const std::string& category, const char* epsilon) const {
    SubmitRequest r;
    r.requester = "analyst";
    r.dataset = handle;
    r.category = category;
    r.circuit_id = kCircuit;
    r.epsilon = eps(epsilon);
    r.metadata = category == "financial" ? financial_metadata() : hipaa_metadata();
    return r;
  }

  ComputationOutput valid_output(uint64_t job_id) const {
    ComputationOutput out;
    out.result_hash = reference_result_hash(kCircuit, bytes);
    out.proof.circuit_id = kCircuit;
    out.proof.public_inputs = reference_public_inputs(job_id, handle);
    out.proof.result_hash = out.result_hash;
    out.proof.proof_bytes = commit_proof(kTestKey, kCircuit, out.proof.public_inputs, out.result_hash);
    return out;
  }

  JobState state(uint64_t id) const { return coord->job(id).value().state; }
  Epsilon consumed(const std::string& cat) const { return ledger->entry(cat).value().consumed; }
  Epsilon reserved(const std::string& cat) const { return ledger->entry(cat).value().reserved; }

  // submit + begin_processing, returning the job id.
  uint64_t start_job(const std::string& category, const char* epsilon) {
    auto sub = coord->submit(request(category, epsilon));
    expect(sub.ok(), "submit should be admitted: " + to_string(sub.error) + " " + sub.detail);
    expect(coord->begin_processing(sub.job_id).ok(), "begin_processing");
    expect(state(sub.job_id) == JobState::processing, "job should be processing");
    return sub.job_id;
  }
};

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(hash_runtime_info().primitive == "blake3", "primitive must be blake3");
  expect(version::manifest_to_json(version::current_manifest()).find("\"proof_commitment\":1") != std::string::npos,
         "manifest carries the proof commitment version");
}

void test_domain_separation() {
  const std::string payload = "dataset-bytes";
  const auto a = hash_domain(kDomainContent, payload);
  const auto b = hash_domain(kDomainPossession, payload);
  const auto c = hash_domain(kDomainProof, payload);
  expect(a != b && b != c && a != c, "domains must separate digests");
  expect(is_hex_digest(a), "domain digest is 64 hex");
  expect(hash_domain_parts(kDomainContent, {"dataset", "-bytes"}) == a, "parts hash as one stream");
  expect(!is_hex_digest("ABC"), "short digest rejected");
  expect(!is_hex_digest(std::string(64, 'G')), "non-hex rejected");
}

// ============================================================================
// Types
// ============================================================================

void test_epsilon_parsing() {
  expect(eps("0.05").micros() == 50'000, "0.05 -> 50000 micros");
  expect(eps("10") == Epsilon::whole(10), "10 whole units");
  expect(eps("6.000000").to_string() == "6", "canonical rendering drops zeros");
  expect(eps("0.05").to_string() == "0.05", "canonical fraction");
  expect(!Epsilon::parse("1.2345678"), "more than 6 fractional digits rejected");
  expect(!Epsilon::parse("-1"), "negative rejected");
  expect(!Epsilon::parse(""), "empty rejected");
  expect(!Epsilon::parse("1e3"), "exponent rejected");
  expect(!Epsilon::parse("1."), "dangling point rejected");
  expect(!Epsilon::parse("99999999999999999999"), "overflow rejected");
  expect(eps("6") + eps("5") > eps("10"), "6 + 5 > 10");
}

void test_error_classes() {
  expect(error_class(ErrorCode::insufficient_budget) == ErrorClass::admission, "budget is admission");
  expect(error_class(ErrorCode::storage_expired) == ErrorClass::possession, "expiry is possession");
  expect(error_class(ErrorCode::timeout) == ErrorClass::computation, "timeout is computation");
  expect(error_class(ErrorCode::proof_rejected) == ErrorClass::proof, "proof class is distinct");
  expect(error_code_from_string("reset_not_due") == ErrorCode::reset_not_due, "code round trip");
  expect(!error_code_from_string("no_such_code"), "unknown code rejected");
}

void test_job_json() {
  AnalyticsJob j;
  j.id = 7;
  j.requester = "bob";
  j.category = "general";
  j.circuit_id = kCircuit;
  j.epsilon = eps("0.25");
  j.state = JobState::failed;
  j.failure = ErrorCode::proof_rejected;
  const auto o = job_to_json(j);
  expect(jsonlite::get_string(o, "failure_class") == "proof", "failure class serialized");
  auto back = job_from_json(o);
  expect(back && back->epsilon == j.epsilon && back->failure == ErrorCode::proof_rejected, "job JSON");

  auto bad = o;
  bad["state"] = "exploded";
  expect(!job_from_json(bad), "unknown state rejected");
}

// ============================================================================
// jsonlite
// ============================================================================

void test_json_strictness() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  err.reset();
  jsonlite::parse("{\"a\":NaN}", &err);
  expect(err.has_value(), "NaN rejected");
  expect(jsonlite::canonicalize_json("{\"b\":1,\"a\":true}") == "{\"a\":true,\"b\":1}", "sorted keys");

  err.reset();
  auto emoji = jsonlite::parse("{\"s\":\"\\uD83D\\uDE00\"}", &err);
  expect(!err && jsonlite::get_string(emoji, "s") == "\xF0\x9F\x98\x80", "surrogate pair decodes to 4-byte UTF-8");
  auto accent = jsonlite::parse("{\"s\":\"\\u00e9\"}", &err);
  expect(!err && jsonlite::get_string(accent, "s") == "\xC3\xA9", "BMP escape");
  jsonlite::parse("{\"s\":\"\\uD83D\"}", &err);
  expect(err.has_value(), "lone high surrogate rejected");
  err.reset();
  jsonlite::parse("{\"s\":\"\\uDE00x\"}", &err);
  expect(err.has_value(), "lone low surrogate rejected");
  err.reset();
  jsonlite::parse("{\"s\":\"\\uD83D\\u0041\"}", &err);
  expect(err.has_value(), "high surrogate followed by a non-surrogate rejected");
}

// ============================================================================
// Content store
// ============================================================================

void test_cas_put_get_integrity() {
  const auto dir = fresh_dir("cas_integrity");
  auto clock = std::make_shared<ManualClock>();
  CasStore cas(dir.string(), "off", clock);
  const auto d = cas.put("payload");
  expect(d == cas_content_hash("payload"), "digest is the content hash");
  expect(cas.get(d).value_or("") == "payload", "round trip");
  expect(cas.put("payload") == d, "put is idempotent");
  expect(cas.size() == 1, "dedup");

  // Corrupt the blob on disk: reads must fail closed.
  {
    std::ofstream ofs(cas.object_path(d), std::ios::binary | std::ios::trunc);
    ofs << "tampered";
  }
  expect(!cas.get(d), "corrupted object must not be returned");
  expect(!cas.get("nothex"), "malformed digest");
}

void test_cas_pins_and_gc() {
  const auto dir = fresh_dir("cas_gc");
  auto clock = std::make_shared<ManualClock>();
  auto cas = std::make_shared<CasStore>(dir.string(), "off", clock);
  const auto keep = cas->put("keep me");
  const auto drop = cas->put("drop me");
  expect(cas->pin(keep), "pin");
  expect(!cas->remove(keep), "pinned objects are not removable");

  clock->advance(2 * kMsPerDay);
  CasGarbageCollector gc(cas, clock);
  auto dry = gc.prune(std::chrono::hours(24), true);
  expect(dry.removed == 1 && dry.skipped_pinned == 1, "dry run counts");
  expect(cas->contains(drop), "dry run deletes nothing");

  auto real = gc.prune(std::chrono::hours(24));
  expect(real.removed == 1, "unpinned old object removed");
  expect(!cas->contains(drop) && cas->contains(keep), "only the unpinned object is gone");

  // Pins survive reopening.
  CasStore reopened(dir.string(), "off", clock);
  expect(reopened.is_pinned(keep), "pins persisted");
}

// ============================================================================
// Audit journal
// ============================================================================

void test_audit_chain_and_tamper() {
  const auto dir = fresh_dir("audit");
  const std::string path = (dir / "journal.ndjson").string();
  auto clock = std::make_shared<ManualClock>();
  {
    ImmutableAuditLog log(path, clock);
    for (int i = 0; i < 3; ++i) {
      AuditRecord r;
      r.kind = "job";
      r.key = std::to_string(i + 1);
      r.payload["state"] = "pending";
      expect(log.append(r), "append");
      expect(r.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
  }
  auto ok = verify_audit_chain(path);
  expect(ok.ok && ok.entries == 3, "intact chain verifies");

  // Reopen continues the chain.
  {
    ImmutableAuditLog log(path, clock);
    AuditRecord r;
    r.kind = "budget";
    r.key = "general";
    expect(log.append(r) && r.sequence == 4, "sequence continues after reopen");
  }

  std::ifstream ifs(path);
  std::vector<std::string> lines;
  for (std::string l; std::getline(ifs, l);) lines.push_back(l);
  ifs.close();
  const auto pos = lines[1].find("pending");
  expect(pos != std::string::npos, "payload present");
  lines[1].replace(pos, 7, "verifie");
  {
    std::ofstream ofs(path, std::ios::trunc);
    for (const auto& l : lines) ofs << l << "\n";
  }
  auto bad = verify_audit_chain(path);
  expect(!bad.ok, "tampered journal must fail verification");

  FileLedgerClient client(path, clock);
  expect(!client.status().ok(), "tampered journal opens read-only");
  expect(!client.persist(LedgerEvent{kKindJob, "9", {}}).ok(), "no appends to a tampered journal");
}

// ============================================================================
// Privacy ledger
// ============================================================================

void test_ledger_reserve_commit_release() {
  auto clock = std::make_shared<ManualClock>();
  PrivacyLedger ledger(clock);
  expect(ledger.open_category("general", eps("1"), kMsPerDay).ok(), "open");
  expect(ledger.open_category("general", eps("1"), kMsPerDay).error == ErrorCode::already_registered, "dup");

  auto a = ledger.check_and_reserve("general", eps("0.6"));
  expect(a.error == ErrorCode::none, "reserve 0.6");
  auto b = ledger.check_and_reserve("general", eps("0.5"));
  expect(b.error == ErrorCode::insufficient_budget, "0.6 + 0.5 > 1");
  expect(ledger.entry("general")->consumed.is_zero(), "nothing consumed before commit");

  expect(ledger.release(a.reservation_id).ok(), "release");
  expect(ledger.release(a.reservation_id).error == ErrorCode::unknown_reservation, "release is single use");
  expect(ledger.entry("general")->reserved.is_zero(), "release returns the budget");

  auto c = ledger.check_and_reserve("general", eps("0.5"));
  auto cr = ledger.commit(c.reservation_id);
  expect(cr.error == ErrorCode::none && cr.entry.consumed == eps("0.5"), "commit consumes");
  expect(ledger.commit(c.reservation_id).error == ErrorCode::unknown_reservation, "commit is single use");

  expect(ledger.check_and_reserve("nope", eps("1")).error == ErrorCode::unknown_category, "unknown category");
  expect(ledger.check_and_reserve("general", Epsilon{}).error == ErrorCode::invalid_epsilon, "zero epsilon");
}

void test_ledger_concurrent_never_overspends() {
  auto clock = std::make_shared<ManualClock>();
  PrivacyLedger ledger(clock);
  expect(ledger.open_category("general", Epsilon::whole(10), kMsPerDay).ok(), "open");

  std::atomic<int> granted{0};
  std::vector<std::string> ids;
  std::mutex ids_mu;
  std::vector<std::thread> threads;
  for (int t = 0; t < 16; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 4; ++i) {
        auto r = ledger.check_and_reserve("general", Epsilon::whole(1));
        if (r.error == ErrorCode::none) {
          granted.fetch_add(1);
          std::lock_guard<std::mutex> lk(ids_mu);
          ids.push_back(r.reservation_id);
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(granted.load() == 10, "exactly the limit is granted");
  for (const auto& id : ids) expect(ledger.commit(id).error == ErrorCode::none, "commit");
  const auto e = ledger.entry("general").value();
  expect(e.consumed <= e.limit, "consumed <= limit");
  expect(e.consumed == e.limit, "fully consumed");
}

void test_ledger_reset_period() {
  auto clock = std::make_shared<ManualClock>();
  PrivacyLedger ledger(clock);
  expect(ledger.open_category("general", Epsilon::whole(2), kMsPerDay).ok(), "open");
  auto r = ledger.check_and_reserve("general", Epsilon::whole(1));
  expect(ledger.commit(r.reservation_id).error == ErrorCode::none, "commit");
  const uint64_t due = ledger.entry("general")->reset_at_ms;

  clock->set(due - 1);
  expect(ledger.reset_period("general").error == ErrorCode::reset_not_due, "reset before due");
  expect(ledger.entry("general")->consumed == Epsilon::whole(1), "failed reset changes nothing");

  // Three periods late: reset_at lands in the future, aligned to the period.
  clock->set(due + 2 * kMsPerDay + 5);
  auto done = ledger.reset_period("general");
  expect(done.error == ErrorCode::none, "reset after due");
  expect(done.entry.consumed.is_zero(), "consumed becomes exactly 0");
  expect(done.entry.reset_at_ms == due + 3 * kMsPerDay, "reset_at advances by whole periods");
  expect(done.entry.reset_at_ms > clock->now_unix_ms(), "next reset is in the future");
}

void test_ledger_limit_conflict() {
  auto clock = std::make_shared<ManualClock>();
  PrivacyLedger ledger(clock);
  expect(ledger.open_category("general", Epsilon::whole(5), kMsPerDay).ok(), "open");
  auto r = ledger.check_and_reserve("general", Epsilon::whole(3));
  expect(r.error == ErrorCode::none, "reserve");
  expect(ledger.set_limit("general", Epsilon::whole(2)).error == ErrorCode::budget_limit_conflict,
         "limit below consumed + reserved");
  expect(ledger.set_limit("general", Epsilon::whole(3)).ok(), "limit equal to usage");
  auto st = ledger.status("general").value();
  expect(st.remaining.is_zero() && st.reserved == Epsilon::whole(3), "status");
}

// ============================================================================
// Compliance
// ============================================================================

void test_hipaa_example() {
  ComplianceEngine engine;
  for (auto& f : builtin_frameworks()) expect(engine.register_framework(std::move(f)).ok(), "register");
  auto md = hipaa_metadata();
  md["auditLogging"] = false;
  auto r = engine.evaluate("HIPAA", md);
  expect(r.error == ErrorCode::none, "HIPAA known");
  expect(r.result.is_compliant, "one high violation is tolerated");
  expect(r.result.violations.size() == 1, "one violation");
  expect(r.result.count(Severity::high) == 1 && r.result.count(Severity::critical) == 0, "severity");
  expect(r.result.score == 85, "score = round(100 * 110 / 130)");
  expect(!r.result.recommendations.empty(), "violation produces a recommendation");

  md["minimumNecessary"] = false;
  auto two = engine.evaluate("HIPAA", md);
  expect(!two.result.is_compliant, "two high violations fail");

  md = hipaa_metadata();
  md["encryptionAtRest"] = false;
  expect(!engine.evaluate("HIPAA", md).result.is_compliant, "any critical violation fails");

  auto perfect = engine.evaluate("HIPAA", hipaa_metadata());
  expect(perfect.result.score == 100 && perfect.result.violations.empty(), "full score");
}

void test_compliance_unknown_and_many() {
  ComplianceEngine engine;
  for (auto& f : builtin_frameworks()) expect(engine.register_framework(std::move(f)).ok(), "register");
  expect(engine.evaluate("FERPA", {}).error == ErrorCode::unknown_framework, "unknown framework");

  auto many = engine.evaluate_many({"GDPR", "CCPA"}, {});
  expect(many.error == ErrorCode::none && many.results.size() == 2, "both evaluated");
  expect(!many.results[0].is_compliant && !many.results[1].is_compliant, "no short circuit");

  auto mixed = engine.evaluate_many({"GDPR", "FERPA", "HIPAA"}, {});
  expect(mixed.error == ErrorCode::unknown_framework && mixed.detail == "FERPA", "unknown id reported");
  expect(mixed.results.size() == 3, "known frameworks still evaluated around an unknown one");
  expect(mixed.results[0].framework == "GDPR" && !mixed.results[0].violations.empty(), "GDPR evaluated");
  expect(mixed.results[1].framework == "FERPA" && mixed.results[1].score == 0 && !mixed.results[1].is_compliant,
         "unknown id is a failed entry");
  expect(mixed.results[2].framework == "HIPAA" && mixed.results[2].violations.size() == 5, "HIPAA evaluated");
  expect(mixed.unknown == std::vector<std::string>{"FERPA"} && !mixed.all_compliant(), "unknown list");

  jsonlite::Object md;
  md["hasConsent"] = true;
  md["pseudonymized"] = true;
  md["purpose"] = "fraud analytics";
  auto gdpr = engine.evaluate("GDPR", md);
  expect(gdpr.result.is_compliant, "any_true and non_empty satisfied");
  expect(gdpr.result.violations.size() == 1 && gdpr.result.violations[0].rule_id == "gdpr_data_minimization",
         "only minimization is missing");

  Framework dup;
  dup.id = "GDPR";
  expect(engine.register_framework(dup).error == ErrorCode::already_registered, "frameworks are immutable");
}

void test_compliance_report() {
  ComplianceEngine engine;
  for (auto& f : builtin_frameworks()) expect(engine.register_framework(std::move(f)).ok(), "register");
  auto md = hipaa_metadata();
  md["hasConsent"] = true;
  auto rep = engine.report({"HIPAA", "GDPR"}, md);
  expect(!rep.overall_compliance, "GDPR fails");
  expect(rep.results.size() == 2 && rep.unknown_frameworks.empty(), "two results");
  expect(rep.critical_issues.empty(), "consent given, no critical issue");
  expect(rep.summary == "Compliance validation completed for 2 frameworks. 1/2 frameworks compliant.",
         "summary");
  std::set<std::string> unique(rep.recommendations.begin(), rep.recommendations.end());
  expect(unique.size() == rep.recommendations.size(), "recommendations de-duplicated");

  auto partial = engine.report({"HIPAA", "FERPA"}, hipaa_metadata());
  expect(partial.results.size() == 2 && partial.results[0].is_compliant, "HIPAA result kept");
  expect(partial.unknown_frameworks.size() == 1 && !partial.overall_compliance, "unknown framework fails the report");
  expect(partial.critical_issues.size() == 1 && partial.critical_issues[0].rfind("FERPA: ", 0) == 0,
         "unknown framework is a critical issue");

  auto req = engine.requirements("SOX");
  expect(req && req->requirements.size() == 2 && !req->best_practices.empty(), "requirements listing");
}

void test_framework_json() {
  const auto frameworks = builtin_frameworks();
  for (const auto& f : frameworks) {
    std::string why;
    auto back = framework_from_json(framework_to_json(f), &why);
    expect(back.has_value(), "framework parses back: " + why);
    expect(back->rules.size() == f.rules.size() && back->advisories.size() == f.advisories.size(),
           "rules preserved for " + f.id);
  }
  jsonlite::Object bad;
  bad["id"] = "X";
  expect(!framework_from_json(bad), "rules are required");
}

// ============================================================================
// Policies
// ============================================================================

void test_policy_validation() {
  ComplianceEngine engine;
  for (auto& f : builtin_frameworks()) expect(engine.register_framework(std::move(f)).ok(), "register");
  for (const auto& p : default_policies()) expect(validate_policy(p, engine).ok(), "default " + p.category);

  PrivacyPolicy p = default_policies().front();
  p.privacy_level = 11;
  expect(validate_policy(p, engine).error == ErrorCode::invalid_policy, "level out of range");
  p.privacy_level = 9;
  p.frameworks = {"FERPA"};
  expect(validate_policy(p, engine).error == ErrorCode::unknown_framework, "unregistered framework");
  p.frameworks.clear();
  expect(validate_policy(p, engine).error == ErrorCode::invalid_policy, "at least one framework");

  p.frameworks = {"HIPAA"};
  p.tee_required = false;
  const uint64_t before = global_pipeline_stats().warnings.load();
  expect(validate_policy(p, engine).ok(), "high level without TEE is only a warning");
  expect(global_pipeline_stats().warnings.load() == before + 1, "warning logged");

  const auto fin = default_policies()[1];
  expect(fin.category == "financial" && fin.epsilon_limit == eps("0.05"), "financial default");
  auto back = policy_from_json(policy_to_json(fin));
  expect(back && back->frameworks == fin.frameworks && back->encryption == EncryptionMethod::rsa4096,
         "policy JSON");
}

// ============================================================================
// Possession store
// ============================================================================

void test_possession_challenge_single_use() {
  const auto dir = fresh_dir("possession");
  auto clock = std::make_shared<ManualClock>();
  auto cas = std::make_shared<CasStore>(dir.string(), "off", clock);
  PossessionStore store(cas, std::make_shared<ContentPossessionVerifier>(cas), clock);
  auto ing = store.ingest("genome-batch", "lab", blake3_hex("meta"), kMsPerDay);
  expect(ing.error == ErrorCode::none, "ingest");
  expect(cas->is_pinned(ing.handle.digest), "ingest pins");
  expect(store.store(ing.handle, kMsPerDay).error == ErrorCode::already_exists, "store twice");

  auto ch = store.issue_challenge(ing.handle.digest);
  expect(ch.error == ErrorCode::none && is_hex_digest(ch.challenge.nonce), "challenge");
  ContentStoreProver prover(cas);
  auto proof = prover.respond(ing.handle.digest, ch.challenge.nonce);
  expect(proof.has_value(), "holder responds");

  auto first = store.answer_challenge(ing.handle.digest, ch.challenge.nonce, *proof);
  expect(first.error == ErrorCode::none && first.verified, "correct proof verifies");
  auto replay = store.answer_challenge(ing.handle.digest, ch.challenge.nonce, *proof);
  expect(replay.error == ErrorCode::challenge_already_answered, "replayed nonce rejected");

  auto ch2 = store.issue_challenge(ing.handle.digest);
  expect(ch2.challenge.nonce != ch.challenge.nonce, "fresh nonce");
  auto stale = store.answer_challenge(ing.handle.digest, ch2.challenge.nonce, *proof);
  expect(stale.error == ErrorCode::none && !stale.verified, "old response does not satisfy a new nonce");

  auto ch3 = store.issue_challenge(ing.handle.digest);
  expect(store.cancel_challenge(ing.handle.digest, ch3.challenge.nonce).ok(), "cancel");
  auto late = store.answer_challenge(ing.handle.digest, ch3.challenge.nonce,
                                     possession_response(ch3.challenge.nonce, "genome-batch"));
  expect(late.error == ErrorCode::challenge_already_answered, "cancelled challenge cannot be answered");

  auto st = store.stats(ing.handle.digest).value();
  expect(st.challenges_issued == 3 && st.challenges_passed == 1 && st.challenges_failed == 1, "counters");
}

void test_possession_expiry_and_renew() {
  const auto dir = fresh_dir("possession_expiry");
  auto clock = std::make_shared<ManualClock>();
  auto cas = std::make_shared<CasStore>(dir.string(), "off", clock);
  PossessionStore store(cas, std::make_shared<ContentPossessionVerifier>(cas), clock, 16);
  expect(store.ingest(std::string(17, 'x'), "o", "", kMsPerDay).error == ErrorCode::size_exceeds_limit,
         "size limit");

  auto ing = store.ingest("small", "o", "", 1000);
  auto ch = store.issue_challenge(ing.handle.digest);
  expect(store.answer_challenge(ing.handle.digest, ch.challenge.nonce,
                                possession_response(ch.challenge.nonce, "small")).verified,
         "verified while active");
  clock->advance(1000);
  expect(!store.is_active(ing.handle.digest), "expired at deadline");
  expect(store.issue_challenge(ing.handle.digest).error == ErrorCode::storage_expired, "challenge after expiry");
  expect(store.read(ing.handle.digest).error == ErrorCode::storage_expired, "read after expiry");

  expect(store.renew(ing.handle.digest, 5000).ok(), "renew");
  expect(store.is_active(ing.handle.digest), "active after renew");
  expect(store.read(ing.handle.digest).bytes == "small", "read after renew");
  expect(store.stats(ing.handle.digest)->challenges_passed == 1, "renew keeps history");
  expect(store.renew(std::string(64, 'a'), 1).error == ErrorCode::unknown_handle, "renew unknown");
}

// ============================================================================
// Proof verifier
// ============================================================================

void test_proof_verifier_fail_closed() {
  CommitmentProofVerifier v;
  expect(v.register_circuit(kCircuit, kTestKey).ok(), "register");
  expect(v.register_circuit(kCircuit, kTestKey).error == ErrorCode::already_registered, "duplicate");

  Proof p;
  p.circuit_id = kCircuit;
  p.public_inputs = {std::string(64, 'a'), "1"};
  p.result_hash = blake3_hex("result");
  p.proof_bytes = commit_proof(kTestKey, kCircuit, p.public_inputs, p.result_hash);
  expect(v.verify(p, p.public_inputs, kCircuit), "valid proof");
  expect(v.verify(p, p.public_inputs, kCircuit), "verification is repeatable");

  expect(!v.verify(p, {p.public_inputs[0]}, kCircuit), "arity mismatch");
  expect(!v.verify(p, {p.public_inputs[0], "2"}, kCircuit), "different public input");
  expect(!v.verify(p, p.public_inputs, "other-circuit"), "unknown circuit");
  Proof tampered = p;
  tampered.result_hash = blake3_hex("forged");
  expect(!v.verify(tampered, tampered.public_inputs, kCircuit), "result hash bound");
  Proof malformed = p;
  malformed.proof_bytes = "zz";
  expect(!v.verify(malformed, malformed.public_inputs, kCircuit), "malformed bytes");
  VerifyingKey other{"another-key", 2};
  Proof wrong_key = p;
  wrong_key.proof_bytes = commit_proof(other, kCircuit, p.public_inputs, p.result_hash);
  expect(!v.verify(wrong_key, wrong_key.public_inputs, kCircuit), "wrong key");
}

void test_reference_backend() {
  const auto dir = fresh_dir("backend");
  auto cas = std::make_shared<CasStore>(dir.string());
  const std::string bytes = "1,2,3";
  DatasetHandle h;
  h.digest = cas->put(bytes);
  ReferenceBackend backend(cas);
  expect(backend.add_circuit(kCircuit, kTestKey).ok(), "proving key");

  auto out = backend.dispatch(42, h, kCircuit).get();
  expect(out.error == ErrorCode::none, "reference computation");
  CommitmentProofVerifier v;
  expect(v.register_circuit(kCircuit, kTestKey).ok(), "register");
  expect(v.verify(out.proof, out.proof.public_inputs, kCircuit), "backend proof verifies");
  expect(out.proof.public_inputs[1] == "42", "job id is a public input");

  auto missing = backend.dispatch(1, h, "unknown").get();
  expect(missing.error == ErrorCode::backend_failure, "no proving key");
}

// ============================================================================
// Coordinator
// ============================================================================

void test_job_happy_path() {
  Fixture fx("happy");
  const uint64_t id = fx.start_job("healthcare", "2.5");
  expect(fx.reserved("healthcare") == eps("2.5"), "reserved while processing");
  expect(fx.coord->inflight() == 1, "dispatched");

  expect(fx.backend->deliver(id, fx.valid_output(id)), "deliver");
  auto rep = fx.coord->poll_inflight();
  expect(rep.drained == 1 && rep.finalized == 1, "drained and finalized");
  auto job = fx.coord->job(id).value();
  expect(job.state == JobState::verified, "verified");
  expect(job.proof && job.result_hash == job.proof->result_hash, "proof attached");
  expect(fx.consumed("healthcare") == eps("2.5") && fx.reserved("healthcare").is_zero(), "budget committed");
  expect(fx.coord->finalize(id).error == ErrorCode::invalid_transition, "verified is terminal");
}

void test_financial_example() {
  Fixture fx("financial");
  auto a = fx.coord->submit(fx.request("financial", "6"));
  expect(a.ok(), "job A admitted");
  expect(fx.reserved("financial") == Epsilon::whole(6), "A reserved 6");

  auto b = fx.coord->submit(fx.request("financial", "5"));
  expect(b.error == ErrorCode::insufficient_budget, "job B rejected: 6 + 5 > 10");
  expect(fx.coord->jobs().size() == 1, "no record for B");

  expect(fx.coord->begin_processing(a.job_id).ok(), "A processing");
  auto bad = fx.valid_output(a.job_id);
  bad.proof.proof_bytes = blake3_hex("forged");
  auto res = fx.coord->submit_result(a.job_id, bad.result_hash, bad.proof);
  expect(res.error == ErrorCode::proof_rejected, "A fails proof verification");
  auto job = fx.coord->job(a.job_id).value();
  expect(job.state == JobState::failed && job.failure == ErrorCode::proof_rejected, "A failed");
  expect(fx.consumed("financial").is_zero() && fx.reserved("financial").is_zero(), "A refunded");

  auto b2 = fx.coord->submit(fx.request("financial", "5"));
  expect(b2.ok(), "B admitted after refund");
}

void test_concurrent_submit_exactly_one() {
  Fixture fx("concurrent");
  std::vector<SubmitResult> results(2);
  std::thread t1([&] { results[0] = fx.coord->submit(fx.request("financial", "6")); });
  std::thread t2([&] { results[1] = fx.coord->submit(fx.request("financial", "5")); });
  t1.join();
  t2.join();
  const int ok = (results[0].ok() ? 1 : 0) + (results[1].ok() ? 1 : 0);
  expect(ok == 1, "exactly one of two over-budget submissions succeeds");
  const auto& loser = results[0].ok() ? results[1] : results[0];
  expect(loser.error == ErrorCode::insufficient_budget, "loser sees insufficient_budget");
  expect(fx.ledger->open_reservations() == 1, "one reservation");
}

void test_compliance_failure_creates_nothing() {
  Fixture fx("noncompliant");
  auto req = fx.request("healthcare", "1");
  req.metadata["encryptionAtRest"] = false;
  auto r = fx.coord->submit(req);
  expect(r.error == ErrorCode::compliance_violation, "rejected");
  expect(r.compliance.size() == 1 && !r.compliance[0].is_compliant, "violations returned");
  expect(r.detail.find("hipaa_encryption_at_rest") != std::string::npos, "failing rule named");
  expect(fx.coord->jobs().empty(), "no job record");
  expect(fx.ledger->open_reservations() == 0, "no reservation");
  expect(fx.reserved("healthcare").is_zero(), "nothing reserved");

  expect(fx.coord->submit(fx.request("unknown", "1")).error == ErrorCode::unknown_category, "unknown category");
  auto zero = fx.request("healthcare", "1");
  zero.epsilon = Epsilon{};
  expect(fx.coord->submit(zero).error == ErrorCode::invalid_epsilon, "zero epsilon");
  auto circuit = fx.request("healthcare", "1");
  circuit.circuit_id = "nope";
  expect(fx.coord->submit(circuit).error == ErrorCode::unknown_circuit, "unknown circuit");
}

void test_invalid_transitions() {
  Fixture fx("transitions");
  auto sub = fx.coord->submit(fx.request("healthcare", "1"));
  expect(sub.ok(), "submit");
  auto out = fx.valid_output(sub.job_id);
  expect(fx.coord->submit_result(sub.job_id, out.result_hash, out.proof).error == ErrorCode::invalid_transition,
         "submit_result on pending");
  expect(fx.coord->finalize(sub.job_id).error == ErrorCode::invalid_transition, "finalize on pending");
  expect(fx.state(sub.job_id) == JobState::pending, "state unchanged");
  expect(fx.coord->begin_processing(999).error == ErrorCode::unknown_job, "unknown job");

  expect(fx.coord->begin_processing(sub.job_id).ok(), "begin");
  expect(fx.coord->begin_processing(sub.job_id).error == ErrorCode::invalid_transition, "begin twice");
}

void test_cancel() {
  Fixture fx("cancel");
  auto pending = fx.coord->submit(fx.request("healthcare", "1"));
  expect(fx.coord->cancel(pending.job_id, "requester withdrew").ok(), "cancel pending");
  auto job = fx.coord->job(pending.job_id).value();
  expect(job.failure == ErrorCode::cancelled && job.failure_detail == "requester withdrew", "cancel reason");

  const uint64_t running = fx.start_job("healthcare", "2");
  expect(fx.coord->cancel(running).ok(), "cancel processing");
  expect(fx.coord->inflight() == 0, "future parked");
  expect(fx.reserved("healthcare").is_zero(), "reservations released");
  expect(fx.coord->cancel(running).error == ErrorCode::invalid_transition, "cancel terminal");

  // A late result for a cancelled job is dropped.
  expect(fx.backend->deliver(running, fx.valid_output(running)), "late deliver");
  fx.coord->poll_inflight();
  expect(fx.state(running) == JobState::failed, "stays failed");

  const uint64_t done = fx.start_job("healthcare", "1");
  auto out = fx.valid_output(done);
  expect(fx.coord->submit_result(done, out.result_hash, out.proof).ok(), "completed");
  expect(fx.coord->cancel(done).error == ErrorCode::cancel_not_permitted, "completed cannot be cancelled");
  expect(fx.coord->finalize(done).ok(), "finalize");
  expect(fx.consumed("healthcare") == Epsilon::whole(1), "only the finished job consumed");
}

void test_timeouts() {
  Fixture fx("timeouts");
  const uint64_t slow = fx.start_job("healthcare", "3");
  auto idle = fx.coord->submit(fx.request("healthcare", "2"));
  expect(idle.ok(), "idle pending job");

  fx.clock->advance(59'999);
  expect(fx.coord->poll_inflight().timed_out == 0, "before deadline");
  fx.clock->advance(1);
  auto rep = fx.coord->poll_inflight();
  expect(rep.timed_out == 1, "processing deadline");
  expect(fx.coord->job(slow)->failure == ErrorCode::timeout, "timeout recorded");
  expect(fx.reserved("healthcare") == Epsilon::whole(2), "slow job released its 3");

  fx.clock->advance(60'000);
  expect(fx.coord->poll_inflight().timed_out == 1, "pending deadline");
  expect(fx.coord->job(idle.job_id)->failure == ErrorCode::timeout, "pending timed out");
  expect(fx.reserved("healthcare").is_zero(), "no reservation held forever");
}

void test_possession_failures_release_budget() {
  Fixture fx("possession_fail", true, false, std::make_shared<LyingProver>());
  auto sub = fx.coord->submit(fx.request("healthcare", "1"));
  auto r = fx.coord->begin_processing(sub.job_id);
  expect(r.error == ErrorCode::challenge_failed, "wrong response fails the challenge");
  expect(fx.state(sub.job_id) == JobState::failed, "job failed");
  expect(fx.reserved("healthcare").is_zero(), "reservation released");

  Fixture ex("possession_expired");
  auto s2 = ex.coord->submit(ex.request("healthcare", "1"));
  ex.clock->advance(kMsPerDay);
  expect(ex.coord->begin_processing(s2.job_id).error == ErrorCode::storage_expired, "expired dataset");
  expect(ex.coord->job(s2.job_id)->failure == ErrorCode::storage_expired, "failure recorded");
  expect(ex.reserved("healthcare").is_zero(), "reservation released");
}

void test_backend_failures() {
  Fixture fx("backend_fail");
  const uint64_t crashed = fx.start_job("healthcare", "1");
  expect(fx.backend->crash(crashed), "crash");
  fx.coord->poll_inflight();
  expect(fx.coord->job(crashed)->failure == ErrorCode::backend_failure, "exception becomes backend_failure");

  const uint64_t reported = fx.start_job("healthcare", "1");
  ComputationOutput out;
  out.error = ErrorCode::backend_failure;
  out.detail = "enclave attestation failed";
  expect(fx.backend->deliver(reported, out), "deliver failure");
  fx.coord->poll_inflight();
  auto job = fx.coord->job(reported).value();
  expect(job.failure == ErrorCode::backend_failure && job.failure_detail == out.detail, "detail kept");
  expect(fx.reserved("healthcare").is_zero(), "released");
}

void test_submit_persist_failure() {
  Fixture fx("persist_fail");
  auto mem = std::static_pointer_cast<MemoryLedgerClient>(fx.journal);
  mem->set_fail_persist(true);
  auto r = fx.coord->submit(fx.request("healthcare", "1"));
  expect(r.error == ErrorCode::persistence_failed, "journal failure rejects submit");
  expect(fx.ledger->open_reservations() == 0 && fx.coord->jobs().empty(), "nothing left behind");
  mem->set_fail_persist(false);
  expect(fx.coord->submit(fx.request("healthcare", "1")).ok(), "recovers");
}

std::mutex g_events_mu;
std::vector<PipelineEvent> g_events;
void capture_event(const PipelineEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

void test_events_and_stats() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  const uint64_t rejections_before = global_pipeline_stats().proof_rejections.load();
  set_pipeline_event_hook(capture_event);
  {
    Fixture fx("events");
    const uint64_t id = fx.start_job("healthcare", "1");
    auto bad = fx.valid_output(id);
    bad.proof.public_inputs[1] = "999";
    expect(fx.coord->submit_result(id, bad.result_hash, bad.proof).error == ErrorCode::proof_rejected,
           "proof bound to its job");
  }
  set_pipeline_event_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_events_mu);
  expect(g_events.size() == 3, "submit, begin_processing, submit_result");
  expect(g_events[0].transition == "submit" && g_events[0].ok(), "submit event");
  expect(g_events[2].error == ErrorCode::proof_rejected && g_events[2].state == JobState::failed,
         "proof error is distinct");
  expect(global_pipeline_stats().proof_rejections.load() == rejections_before + 1, "stats counter");
  const std::string json = global_pipeline_stats().to_json();
  expect(json.find("\"proof_rejections\"") != std::string::npos, "stats JSON");
  expect(json.find("\"job_latency\"") != std::string::npos, "latency histogram");
  expect(event_to_json(g_events[2]).find("\"error_class\":\"proof\"") != std::string::npos, "event JSON");
}

void test_restore_after_restart() {
  uint64_t verified_id = 0;
  uint64_t pending_id = 0;
  uint64_t completed_id = 0;
  {
    Fixture fx("restore", true, true);
    verified_id = fx.start_job("healthcare", "1");
    expect(fx.backend->deliver(verified_id, fx.valid_output(verified_id)), "deliver");
    fx.coord->poll_inflight();
    expect(fx.state(verified_id) == JobState::verified, "first job verified");

    pending_id = fx.coord->submit(fx.request("healthcare", "2")).job_id;
    completed_id = fx.start_job("healthcare", "3");
    auto out = fx.valid_output(completed_id);
    expect(fx.coord->submit_result(completed_id, out.result_hash, out.proof).ok(), "completed");
    expect(fx.reserved("healthcare") == Epsilon::whole(5), "2 + 3 reserved at crash");
  }
  expect(verify_audit_chain((fs::temp_directory_path() / "insight_test_restore" / "ledger.ndjson").string()).ok,
         "journal intact");

  Fixture fx("restore", false, true);
  auto rep = fx.coord->restore();
  expect(rep.error == ErrorCode::none, "restore: " + rep.detail);
  expect(rep.jobs == 3 && rep.interrupted == 1 && rep.finalized == 1, "job reconciliation");
  expect(rep.policies == 2 && rep.budgets == 2, "policies and budgets");
  expect(rep.circuits.size() == 1 && fx.verifier->has_circuit(kCircuit), "circuit restored");

  expect(fx.state(verified_id) == JobState::verified, "verified stays verified");
  expect(fx.coord->job(pending_id)->failure == ErrorCode::interrupted, "pending interrupted");
  expect(fx.state(completed_id) == JobState::verified, "completed finalized, never left unbilled");
  expect(fx.consumed("healthcare") == Epsilon::whole(4), "1 + 3 consumed");
  expect(fx.reserved("healthcare").is_zero(), "no reservation survives");

  auto next = fx.coord->submit(fx.request("healthcare", "1"));
  expect(next.ok() && next.job_id == completed_id + 1, "ids continue after the last persisted id");
}

void test_watchdog_drives_jobs() {
  Fixture fx("watchdog");
  auto wd = std::make_unique<JobWatchdog>(fx.coord, std::chrono::milliseconds(2));
  wd->start();
  expect(wd->running(), "running");
  const uint64_t id = fx.start_job("healthcare", "1");
  expect(fx.backend->deliver(id, fx.valid_output(id)), "deliver");
  expect(wait_until([&] { return fx.state(id) == JobState::verified; }), "watchdog finalized the job");
  wd->stop();
  expect(!wd->running() && wd->ticks() > 0, "stopped after ticking");
}

void test_proof_bound_to_its_job() {
  Fixture fx("proof_binding");
  const uint64_t a = fx.start_job("healthcare", "1");
  const uint64_t b = fx.start_job("healthcare", "1");
  const auto out_a = fx.valid_output(a);

  auto r = fx.coord->submit_result(b, out_a.result_hash, out_a.proof);
  expect(r.error == ErrorCode::proof_rejected, "job A's proof must not complete job B");
  expect(fx.state(b) == JobState::failed && fx.coord->job(b)->failure == ErrorCode::proof_rejected, "B failed");

  // Claiming B's inputs does not help: the commitment was made over A's.
  const uint64_t c = fx.start_job("healthcare", "1");
  auto relabelled = out_a.proof;
  relabelled.public_inputs = reference_public_inputs(c, fx.handle);
  expect(fx.coord->submit_result(c, out_a.result_hash, relabelled).error == ErrorCode::proof_rejected,
         "relabelled proof rejected");

  expect(fx.coord->submit_result(a, out_a.result_hash, out_a.proof).ok(), "A's proof still completes A");
  expect(fx.coord->finalize(a).ok(), "finalize A");
  expect(fx.consumed("healthcare") == Epsilon::whole(1) && fx.reserved("healthcare").is_zero(),
         "only A consumed budget");
}

void test_verified_budget_survives_lost_snapshot() {
  // The verified record carries its own budget snapshot.
  {
    auto journal = std::make_shared<LossyBudgetJournal>(false);
    uint64_t id = 0;
    {
      Fixture fx("lost_budget", true, false, nullptr, journal);
      id = fx.start_job("healthcare", "6");
      expect(fx.backend->deliver(id, fx.valid_output(id)), "deliver");
      expect(fx.coord->poll_inflight().finalized == 1, "finalized");
    }
    Fixture fx("lost_budget", false, false, nullptr, journal);
    auto rep = fx.coord->restore();
    expect(rep.error == ErrorCode::none, "restore");
    expect(fx.state(id) == JobState::verified, "job verified after restart");
    expect(fx.consumed("healthcare") == Epsilon::whole(6), "verified epsilon survives restart");
    expect(fx.coord->submit(fx.request("healthcare", "5")).error == ErrorCode::insufficient_budget,
           "6 + 5 > 10 after restart");
  }

  // No snapshot at all: consumed is rebuilt from the verified jobs.
  {
    auto journal = std::make_shared<LossyBudgetJournal>(true);
    {
      Fixture fx("lost_budget_all", true, false, nullptr, journal);
      for (const char* e : {"3", "4"}) {
        const uint64_t id = fx.start_job("healthcare", e);
        auto out = fx.valid_output(id);
        expect(fx.coord->submit_result(id, out.result_hash, out.proof).ok(), "completed");
        expect(fx.coord->finalize(id).ok(), "finalize");
      }
    }
    Fixture fx("lost_budget_all", false, false, nullptr, journal);
    auto rep = fx.coord->restore();
    expect(rep.error == ErrorCode::none && rep.budgets == 0, "no budget snapshot survived");
    expect(rep.reconciled == 1, "healthcare reconciled");
    expect(fx.consumed("healthcare") == Epsilon::whole(7), "3 + 4 rebuilt from verified jobs");
    expect(fx.coord->submit(fx.request("healthcare", "4")).error == ErrorCode::insufficient_budget,
           "7 + 4 > 10 after restart");
  }
}

void test_cancel_racing_dispatch() {
  Fixture fx("cancel_race");
  for (int i = 0; i < 50; ++i) {
    auto sub = fx.coord->submit(fx.request("healthcare", "0.01"));
    expect(sub.ok(), "submit");
    std::thread begin([&] { (void)fx.coord->begin_processing(sub.job_id); });
    std::thread cancel([&] {
      while (!fx.coord->cancel(sub.job_id, "race").ok()) {
        if (is_terminal(fx.state(sub.job_id))) break;
        std::this_thread::yield();
      }
    });
    begin.join();
    cancel.join();
    expect(fx.state(sub.job_id) == JobState::failed, "cancelled");
    expect(fx.coord->inflight() == 0, "no future of a cancelled job stays in flight");
  }
  expect(fx.reserved("healthcare").is_zero(), "every reservation released");
}

void test_possession_sweep() {
  Fixture fx("sweep");
  auto ok = fx.coord->sweep_possession();
  expect(ok.checked == 1 && ok.passed == 1 && ok.failed == 0, "holder passes the sweep");

  Fixture liar("sweep_liar", true, false, std::make_shared<LyingProver>());
  auto bad = liar.coord->sweep_possession();
  expect(bad.checked == 1 && bad.failed == 1, "lying holder fails the sweep");
  expect(liar.possession->stats(liar.handle.digest)->challenges_failed == 1, "failure recorded on the handle");
  expect(liar.coord->jobs().empty(), "a sweep touches no job");

  liar.clock->advance(kMsPerDay);
  expect(liar.coord->sweep_possession().checked == 0, "expired datasets are skipped");

  auto wd = std::make_unique<JobWatchdog>(fx.coord, std::chrono::milliseconds(2), std::chrono::milliseconds(2));
  wd->start();
  expect(wait_until([&] { return wd->sweeps() > 0; }), "watchdog sweeps periodically");
  wd->stop();
  expect(fx.possession->stats(fx.handle.digest)->challenges_passed >= 2, "sweeps challenge the dataset");
}

void test_privacy_audit_report() {
  const auto m = privacy_metrics(default_policies());
  expect(m.encryption_strength == 94.5, "mean encryption strength");
  expect(m.tee_verification_level == 67.5, "TEE level");
  expect(m.data_leakage_risk == 17.5 && m.compliance_score == 30.0, "leakage and compliance");
  expect(privacy_metrics({}).encryption_strength == 0.0, "empty policy set");
  expect(compliance_status(81) == "Good" && compliance_status(61) == "Adequate" &&
             compliance_status(60) == "Needs Improvement",
         "status bands");

  Fixture fx("audit_report", true, false, std::make_shared<LyingProver>());
  expect(fx.coord->sweep_possession().failed == 1, "one failed challenge");
  auto rep = fx.coord->audit_report();
  expect(rep.policies == 2 && rep.active_budgets == 2 && rep.budgets.size() == 2, "policies and budgets");
  expect(rep.metrics.encryption_strength == 95.0 && rep.metrics.tee_verification_level == 95.0, "metrics");
  expect(rep.metrics.compliance_score == 30.0 && rep.compliance_status == "Needs Improvement", "compliance band");
  expect(rep.datasets == 1 && rep.active_datasets == 1 && rep.challenges_failed == 1, "possession summary");
  expect(rep.recommendations.size() == 1 && rep.recommendations[0].find("possession") != std::string::npos,
         "failed challenge recommended for re-verification");
  expect(rep.summary == "Privacy audit completed for 2 policies and 2 active budgets", "summary");

  PrivacyPolicy weak;
  weak.category = "telemetry";
  weak.encryption = EncryptionMethod::rsa2048;
  weak.privacy_level = 3;
  weak.frameworks = {"ISO27001"};
  weak.epsilon_limit = Epsilon::whole(1);
  expect(fx.coord->set_policy(weak).ok(), "weak policy");
  auto weaker = fx.coord->audit_report();
  expect(weaker.policies == 3 && weaker.metrics.tee_verification_level < 70, "TEE level drops");
  expect(std::find(weaker.recommendations.begin(), weaker.recommendations.end(),
                   "Enable TEE for more sensitive data categories") != weaker.recommendations.end(),
         "TEE recommendation");

  Fixture busy("audit_budget");
  const uint64_t id = busy.start_job("healthcare", "8");
  expect(busy.backend->deliver(id, busy.valid_output(id)), "deliver");
  busy.coord->poll_inflight();
  auto hot = busy.coord->audit_report();
  expect(hot.recommendations.size() == 1 && hot.recommendations[0].find("'healthcare' is 80%") != std::string::npos,
         "budget at 80% is flagged");
  const std::string json = jsonlite::to_json(audit_report_to_json(hot));
  expect(json.find("\"compliance_status\":\"Needs Improvement\"") != std::string::npos, "report JSON");
}

// ============================================================================
// Config + pipeline
// ============================================================================

void test_config_parsing() {
  const std::string text = R"({
    "storage_root": "/tmp/insight-cfg",
    "budget_period_days": 7,
    "processing_deadline_ms": 5000,
    "cas_compression": "zstd",
    "frameworks": [{"id": "INTERNAL", "name": "Internal review",
                    "rules": [{"id": "signed_off", "description": "Review board sign-off",
                               "severity": "critical", "remedy": "Obtain sign-off", "penalty": "",
                               "condition": {"op": "equals", "keys": ["review"], "value": "approved"}}]}],
    "policies": [{"category": "research", "encryption": "ChaCha20", "privacy_level": 5,
                  "tee_required": false, "frameworks": ["INTERNAL"], "epsilon_limit": "1.5"}],
    "circuits": [{"circuit_id": "histogram-v1", "key_material": "k", "public_input_arity": 2}]
  })";
  auto r = parse_config(text);
  expect(r.error == ErrorCode::none, "valid config: " + r.detail);
  expect(r.config.budget_period_ms() == 7 * kMsPerDay, "period");
  expect(r.config.resolved_ledger_path() == "/tmp/insight-cfg/ledger.ndjson", "default ledger path");
  expect(r.config.frameworks.size() == 1 && r.config.policies.size() == 1 && r.config.circuits.size() == 1,
         "extras");
  expect(r.config.policies[0].epsilon_limit == eps("1.5"), "policy limit");

  jsonlite::Object md;
  md["review"] = "approved";
  expect(evaluate_condition(r.config.frameworks[0].rules[0].condition, md), "equals condition");

  expect(parse_config("{\"cas_compression\":\"lz4\"}").error == ErrorCode::config_invalid, "bad compression");
  expect(parse_config("{\"budget_period_days\":0}").error == ErrorCode::config_invalid, "zero period");
  expect(parse_config("{not json").error == ErrorCode::config_invalid, "malformed");
  expect(load_config_file("/nonexistent/insight.json").error == ErrorCode::config_invalid, "missing file");
}

void test_config_env_overrides() {
  PipelineConfig c;
  setenv("INSIGHT_PENDING_DEADLINE_MS", "2500", 1);
  setenv("INSIGHT_CAS_COMPRESSION", "zstd", 1);
  expect(apply_env_overrides(c).ok(), "overrides");
  expect(c.pending_deadline_ms == 2500 && c.cas_compression == "zstd", "applied");

  setenv("INSIGHT_PENDING_DEADLINE_MS", "soon", 1);
  expect(apply_env_overrides(c).error == ErrorCode::config_invalid, "non-numeric override");
  unsetenv("INSIGHT_PENDING_DEADLINE_MS");
  unsetenv("INSIGHT_CAS_COMPRESSION");
}

void test_pipeline_end_to_end() {
  const auto dir = fresh_dir("pipeline");
  PipelineConfig cfg;
  cfg.storage_root = dir.string();
  uint64_t job_id = 0;
  {
    auto opened = Pipeline::open(cfg);
    expect(opened.error == ErrorCode::none, "open: " + opened.detail);
    Pipeline& p = *opened.pipeline;
    expect(p.coordinator()->policies().size() == 4, "default policies");
    expect(p.register_circuit(kCircuit, kTestKey).ok(), "circuit");

    auto ing = p.possession()->ingest("a,b\n1,2\n", "carol", blake3_hex("meta"), kMsPerDay);
    SubmitRequest req;
    req.requester = "carol";
    req.dataset = ing.handle;
    req.category = "general";
    req.circuit_id = kCircuit;
    req.epsilon = eps("0.1");
    req.metadata["riskAssessment"] = true;
    req.metadata["securityControls"] = true;
    auto sub = p.coordinator()->submit(req);
    expect(sub.ok(), "submit: " + sub.detail);
    job_id = sub.job_id;
    expect(p.coordinator()->begin_processing(job_id).ok(), "begin");
    expect(wait_until([&] {
             p.coordinator()->poll_inflight();
             return p.coordinator()->job(job_id)->state == JobState::verified;
           }),
           "reference backend job verified");
    expect(p.coordinator()->budget_status("general")->consumed == eps("0.1"), "budget consumed");
  }

  auto reopened = Pipeline::open(cfg);
  expect(reopened.error == ErrorCode::none, "reopen");
  auto& p2 = *reopened.pipeline;
  expect(p2.coordinator()->job(job_id)->state == JobState::verified, "job survives restart");
  expect(p2.coordinator()->budget_status("general")->consumed == eps("0.1"), "ledger survives restart");
  expect(p2.backend() && p2.verifier()->has_circuit(kCircuit), "circuit survives restart");
}

}  // namespace

int main() {
  std::cout << "=== Insight Pipeline Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing & Domain Separation\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[Phase 2] Value Types & Strict JSON\n";
  run_test("epsilon parsing", test_epsilon_parsing);
  run_test("error classes", test_error_classes);
  run_test("job JSON", test_job_json);
  run_test("JSON strictness", test_json_strictness);

  std::cout << "\n[Phase 3] Content-Addressed Storage\n";
  run_test("CAS put/get integrity", test_cas_put_get_integrity);
  run_test("CAS pins and GC", test_cas_pins_and_gc);

  std::cout << "\n[Phase 4] Hash-Chained Journal\n";
  run_test("audit chain and tamper detection", test_audit_chain_and_tamper);

  std::cout << "\n[Phase 5] Privacy Budget Ledger\n";
  run_test("reserve / commit / release", test_ledger_reserve_commit_release);
  run_test("concurrent reservations never overspend", test_ledger_concurrent_never_overspends);
  run_test("reset period", test_ledger_reset_period);
  run_test("limit conflict", test_ledger_limit_conflict);

  std::cout << "\n[Phase 6] Compliance Engine\n";
  run_test("HIPAA example", test_hipaa_example);
  run_test("unknown framework and evaluate_many", test_compliance_unknown_and_many);
  run_test("compliance report", test_compliance_report);
  run_test("framework JSON", test_framework_json);

  std::cout << "\n[Phase 7] Privacy Policies\n";
  run_test("policy validation", test_policy_validation);

  std::cout << "\n[Phase 8] Proof-of-Possession Storage\n";
  run_test("challenge single use", test_possession_challenge_single_use);
  run_test("expiry and renew", test_possession_expiry_and_renew);

  std::cout << "\n[Phase 9] Proof Verification & Reference Backend\n";
  run_test("proof verifier fails closed", test_proof_verifier_fail_closed);
  run_test("reference backend", test_reference_backend);

  std::cout << "\n[Phase 10] Job Coordinator\n";
  run_test("happy path", test_job_happy_path);
  run_test("financial 10/6/5 example", test_financial_example);
  run_test("concurrent submit: exactly one", test_concurrent_submit_exactly_one);
  run_test("compliance failure creates nothing", test_compliance_failure_creates_nothing);
  run_test("invalid transitions", test_invalid_transitions);
  run_test("cancel", test_cancel);
  run_test("timeouts", test_timeouts);
  run_test("possession failures release budget", test_possession_failures_release_budget);
  run_test("backend failures", test_backend_failures);
  run_test("submit persist failure", test_submit_persist_failure);
  run_test("events and stats", test_events_and_stats);
  run_test("restore after restart", test_restore_after_restart);
  run_test("watchdog drives jobs", test_watchdog_drives_jobs);
  run_test("proof bound to its job", test_proof_bound_to_its_job);
  run_test("verified budget survives a lost snapshot", test_verified_budget_survives_lost_snapshot);
  run_test("cancel racing dispatch", test_cancel_racing_dispatch);
  run_test("possession sweep", test_possession_sweep);
  run_test("privacy audit report", test_privacy_audit_report);

  std::cout << "\n[Phase 11] Configuration & Pipeline Assembly\n";
  run_test("config parsing", test_config_parsing);
  run_test("config env overrides", test_config_env_overrides);
  run_test("pipeline end to end", test_pipeline_end_to_end);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
