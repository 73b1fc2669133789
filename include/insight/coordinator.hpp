#pragma once

// insight/coordinator.hpp — Analytics job state machine.
//
// STATES:
//   pending -> processing -> completed -> verified
//          \            \-> failed
//           \-> failed
//   Terminal: failed, verified. completed is a checkpoint awaiting finalize().
//
// INVARIANTS:
//   1. A rejected submit() creates no job and holds no reservation.
//   2. Budget is reserved at submit() and committed only by finalize().
//      Every path into failed releases the reservation first.
//   3. States are never skipped. A transition requested from the wrong state
//      fails with invalid_transition and changes nothing.
//   4. A completed job cannot be cancelled. poll_inflight() and restore()
//      drive it to verified so no completed-but-unbilled job persists.
//   5. Pipeline events are emitted after every lock has been released.
//
// CONCURRENCY:
//   Each job lives in its own slot with its own mutex. Distinct jobs never
//   contend beyond the brief map lookup. Per-category budget atomicity is
//   provided by PrivacyLedger::check_and_reserve().
//   Lock order: job slot -> ledger / possession store / inflight map. The
//   inflight map is never held while a slot mutex is acquired.
//
// ASYNC:
//   begin_processing() dispatches to the backend and returns. The backend's
//   future is parked in the inflight map; poll_inflight() (driven by the
//   JobWatchdog or by the caller) drains ready futures into submit_result().
//   Futures of timed-out or cancelled jobs are parked until they resolve;
//   destroying the coordinator waits for them.
//
// PERSISTENCE:
//   submit() fails with persistence_failed (and releases its reservation)
//   when the new job cannot be journaled. Later transitions are applied in
//   memory first; a journal failure there is logged and counted under
//   persistence_failed, and restore() reconciles from the last durable
//   snapshot.
//   finalize() journals the verified job and its category's budget snapshot
//   as one record. restore() also raises consumed to the epsilon of the jobs
//   verified in the current period, so committed budget is never lost.

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "insight/backend.hpp"
#include "insight/clock.hpp"
#include "insight/compliance.hpp"
#include "insight/ledger_client.hpp"
#include "insight/observability.hpp"
#include "insight/policy.hpp"
#include "insight/possession.hpp"
#include "insight/privacy_ledger.hpp"
#include "insight/proof_verifier.hpp"
#include "insight/types.hpp"

namespace insight {

struct CoordinatorDeps {
  std::shared_ptr<PrivacyLedger> ledger;
  std::shared_ptr<ComplianceEngine> compliance;
  std::shared_ptr<PossessionStore> possession;
  std::shared_ptr<IPossessionProver> prover;
  std::shared_ptr<IProofVerifier> verifier;
  std::shared_ptr<IComputationBackend> backend;
  std::shared_ptr<ILedgerClient> journal;
  std::shared_ptr<IClock> clock;
};

struct CoordinatorOptions {
  uint64_t processing_deadline_ms{10 * 60 * 1000};
  uint64_t pending_deadline_ms{60 * 60 * 1000};
  uint64_t budget_period_ms{30 * kMsPerDay};
};

struct SubmitRequest {
  std::string requester;
  DatasetHandle dataset;
  std::string category;
  std::string circuit_id;
  Epsilon epsilon;
  jsonlite::Object metadata;
};

struct SubmitResult {
  ErrorCode error{ErrorCode::none};
  std::string detail;
  uint64_t job_id{0};
  std::string reservation_id;
  // Populated whenever compliance was evaluated, including on rejection.
  std::vector<ComplianceResult> compliance;

  bool ok() const { return error == ErrorCode::none; }
};

struct PollReport {
  size_t drained{0};    // backend outputs consumed
  size_t timed_out{0};
  size_t finalized{0};
};

struct RestoreReport {
  ErrorCode error{ErrorCode::none};
  std::string detail;
  size_t frameworks{0};
  size_t policies{0};
  size_t budgets{0};
  size_t jobs{0};
  size_t interrupted{0};  // pending/processing jobs failed on restart
  size_t finalized{0};    // completed jobs driven to verified
  size_t reconciled{0};   // budgets raised to their verified jobs' total
  std::vector<std::pair<std::string, VerifyingKey>> circuits;
};

struct PossessionSweep {
  size_t checked{0};
  size_t passed{0};
  size_t failed{0};
};

// Point-in-time privacy posture across policies, budgets and datasets.
struct PrivacyAuditReport {
  size_t policies{0};
  size_t active_budgets{0};
  PrivacyMetrics metrics;
  std::string compliance_status;
  std::vector<std::string> recommendations;
  std::vector<BudgetStatus> budgets;
  size_t datasets{0};
  size_t active_datasets{0};
  uint64_t challenges_passed{0};
  uint64_t challenges_failed{0};
  std::string summary;
};

jsonlite::Object audit_report_to_json(const PrivacyAuditReport& r);

class JobCoordinator {
 public:
  JobCoordinator(CoordinatorDeps deps, CoordinatorOptions opts);
  ~JobCoordinator();

  JobCoordinator(const JobCoordinator&) = delete;
  JobCoordinator& operator=(const JobCoordinator&) = delete;

  // -------------------------------------------------------------------------
  // Registries (persisted through the journal)
  // -------------------------------------------------------------------------
  Outcome register_framework(Framework f);
  Outcome register_circuit(const std::string& circuit_id, const VerifyingKey& vk);

  // New category: opens a ledger account with the policy's limit.
  // Existing category: replaces the policy and moves the limit
  // (budget_limit_conflict if below consumed + reserved).
  Outcome set_policy(const PrivacyPolicy& policy);
  std::optional<PrivacyPolicy> policy(const std::string& category) const;
  std::vector<PrivacyPolicy> policies() const;

  std::optional<BudgetStatus> budget_status(const std::string& category) const;
  PrivacyLedger::CommitResult reset_period(const std::string& category);

  // -------------------------------------------------------------------------
  // Transitions
  // -------------------------------------------------------------------------
  SubmitResult submit(const SubmitRequest& req);
  Outcome begin_processing(uint64_t job_id);
  Outcome submit_result(uint64_t job_id, const std::string& result_hash, const Proof& proof);
  Outcome finalize(uint64_t job_id);
  Outcome cancel(uint64_t job_id, const std::string& reason = "");

  PollReport poll_inflight();

  // Replay the journal. Must run before the first submit().
  RestoreReport restore();

  // Challenge every active dataset once through the prover. Failures are
  // logged and recorded in the handle's counters; no job changes state.
  PossessionSweep sweep_possession();

  PrivacyAuditReport audit_report() const;

  std::optional<AnalyticsJob> job(uint64_t job_id) const;
  std::vector<AnalyticsJob> jobs() const;
  size_t inflight() const;

 private:
  struct Slot {
    std::mutex mu;
    AnalyticsJob job;
    uint64_t processing_deadline_ms{0};
    std::string open_challenge;  // nonce while the possession check runs
  };

  std::shared_ptr<Slot> find(uint64_t job_id) const;

  // Requires slot.mu. Moves the job to failed and, unless the reservation
  // died with a previous process, releases it.
  void fail_locked(Slot& slot, ErrorCode code, const std::string& detail, bool release = true);
  // Fails the job if it is still in `expected`. False if it had moved on.
  bool fail_if(uint64_t job_id, JobState expected, ErrorCode code, const std::string& detail,
               const std::string& transition);
  // Requires slot.mu.
  void persist_job_locked(const AnalyticsJob& job);
  void persist_budget(const std::string& category);
  void persist_or_warn(const LedgerEvent& ev);

  void park_abandoned(uint64_t job_id);
  PipelineEvent event_for(const AnalyticsJob& job, const std::string& transition) const;

  CoordinatorDeps deps_;
  CoordinatorOptions opts_;

  mutable std::shared_mutex policies_mu_;
  std::map<std::string, PrivacyPolicy> policies_;

  mutable std::mutex jobs_mu_;
  std::map<uint64_t, std::shared_ptr<Slot>> jobs_;
  std::atomic<uint64_t> next_id_{1};

  mutable std::mutex inflight_mu_;
  std::map<uint64_t, std::future<ComputationOutput>> inflight_;
  std::vector<std::future<ComputationOutput>> abandoned_;
};

}  // namespace insight
