#include "insight/coordinator.hpp"

#include <algorithm>
#include <chrono>

#include "insight/hash.hpp"

namespace insight {

namespace {

constexpr uint64_t kNsPerMs = 1'000'000ULL;

std::string job_key(uint64_t id) { return std::to_string(id); }

std::string describe_violations(const std::vector<ComplianceResult>& results) {
  std::string out;
  for (const auto& r : results) {
    if (r.is_compliant) continue;
    if (!out.empty()) out += "; ";
    out += r.framework + ":";
    for (const auto& v : r.violations) {
      if (v.severity == Severity::critical || v.severity == Severity::high) out += " " + v.rule_id;
    }
  }
  return out;
}

}  // namespace

JobCoordinator::JobCoordinator(CoordinatorDeps deps, CoordinatorOptions opts)
    : deps_(std::move(deps)), opts_(opts) {
  if (!deps_.clock) deps_.clock = std::make_shared<SystemClock>();
}

JobCoordinator::~JobCoordinator() = default;

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

std::shared_ptr<JobCoordinator::Slot> JobCoordinator::find(uint64_t job_id) const {
  std::lock_guard<std::mutex> lk(jobs_mu_);
  auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

PipelineEvent JobCoordinator::event_for(const AnalyticsJob& job, const std::string& transition) const {
  PipelineEvent ev;
  ev.job_id = job.id;
  ev.category = job.category;
  ev.transition = transition;
  ev.state = job.state;
  ev.error = job.state == JobState::failed ? job.failure : ErrorCode::none;
  ev.epsilon = job.epsilon;
  return ev;
}

void JobCoordinator::persist_or_warn(const LedgerEvent& ev) {
  Outcome o = deps_.journal->persist(ev);
  if (o.ok()) return;
  global_pipeline_stats().record_failure(ErrorCode::persistence_failed);
  log_warning("coordinator", "journal write " + ev.kind + "/" + ev.key + " failed: " + o.detail);
}

void JobCoordinator::persist_job_locked(const AnalyticsJob& job) {
  persist_or_warn(LedgerEvent{kKindJob, job_key(job.id), job_to_json(job)});
}

void JobCoordinator::persist_budget(const std::string& category) {
  auto entry = deps_.ledger->entry(category);
  if (!entry) return;
  persist_or_warn(LedgerEvent{kKindBudget, category, ledger_entry_to_json(*entry)});
}

void JobCoordinator::fail_locked(Slot& slot, ErrorCode code, const std::string& detail, bool release) {
  AnalyticsJob& job = slot.job;
  job.state = JobState::failed;
  job.failure = code;
  job.failure_detail = detail;
  job.updated_at_ms = deps_.clock->now_unix_ms();
  slot.processing_deadline_ms = 0;
  if (release && !job.reservation_id.empty()) {
    Outcome rel = deps_.ledger->release(job.reservation_id);
    if (!rel.ok()) {
      log_warning("coordinator", "job " + job_key(job.id) + ": release " + job.reservation_id +
                                     " failed: " + to_string(rel.error));
    }
  }
  persist_job_locked(job);
}

bool JobCoordinator::fail_if(uint64_t job_id, JobState expected, ErrorCode code, const std::string& detail,
                             const std::string& transition) {
  auto slot = find(job_id);
  if (!slot) return false;
  PipelineEvent ev;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->job.state != expected) return false;
    fail_locked(*slot, code, detail);
    ev = event_for(slot->job, transition);
  }
  park_abandoned(job_id);
  emit_pipeline_event(ev);
  return true;
}

void JobCoordinator::park_abandoned(uint64_t job_id) {
  std::lock_guard<std::mutex> lk(inflight_mu_);
  auto it = inflight_.find(job_id);
  if (it == inflight_.end()) return;
  abandoned_.push_back(std::move(it->second));
  inflight_.erase(it);
}

// ---------------------------------------------------------------------------
// Registries
// ---------------------------------------------------------------------------

Outcome JobCoordinator::register_framework(Framework f) {
  LedgerEvent ev{kKindFramework, f.id, framework_to_json(f)};
  Outcome o = deps_.compliance->register_framework(std::move(f));
  if (!o.ok()) return o;
  return deps_.journal->persist(ev);
}

Outcome JobCoordinator::register_circuit(const std::string& circuit_id, const VerifyingKey& vk) {
  Outcome o = deps_.verifier->register_circuit(circuit_id, vk);
  if (!o.ok()) return o;
  return deps_.journal->persist(LedgerEvent{kKindCircuit, circuit_id, verifying_key_to_json(circuit_id, vk)});
}

Outcome JobCoordinator::set_policy(const PrivacyPolicy& p) {
  Outcome v = validate_policy(p, *deps_.compliance);
  if (!v.ok()) return v;

  bool existed = false;
  {
    std::shared_lock<std::shared_mutex> lk(policies_mu_);
    existed = policies_.contains(p.category);
  }
  Outcome lo = existed ? deps_.ledger->set_limit(p.category, p.epsilon_limit)
                       : deps_.ledger->open_category(p.category, p.epsilon_limit, opts_.budget_period_ms);
  // A restored budget entry can precede its policy.
  if (!existed && lo.error == ErrorCode::already_registered) {
    lo = deps_.ledger->set_limit(p.category, p.epsilon_limit);
  }
  if (!lo.ok()) return lo;

  {
    std::unique_lock<std::shared_mutex> lk(policies_mu_);
    policies_[p.category] = p;
  }
  Outcome o = deps_.journal->persist(LedgerEvent{kKindPolicy, p.category, policy_to_json(p)});
  persist_budget(p.category);
  return o;
}

std::optional<PrivacyPolicy> JobCoordinator::policy(const std::string& category) const {
  std::shared_lock<std::shared_mutex> lk(policies_mu_);
  auto it = policies_.find(category);
  if (it == policies_.end()) return std::nullopt;
  return it->second;
}

std::vector<PrivacyPolicy> JobCoordinator::policies() const {
  std::shared_lock<std::shared_mutex> lk(policies_mu_);
  std::vector<PrivacyPolicy> out;
  for (const auto& [cat, p] : policies_) out.push_back(p);
  return out;
}

std::optional<BudgetStatus> JobCoordinator::budget_status(const std::string& category) const {
  return deps_.ledger->status(category);
}

PrivacyLedger::CommitResult JobCoordinator::reset_period(const std::string& category) {
  auto r = deps_.ledger->reset_period(category);
  if (r.error == ErrorCode::none) {
    persist_budget(category);
    log_info("coordinator", "budget period reset for '" + category + "'");
  }
  return r;
}

// ---------------------------------------------------------------------------
// submit
// ---------------------------------------------------------------------------

SubmitResult JobCoordinator::submit(const SubmitRequest& req) {
  SubmitResult r;
  PipelineEvent ev;
  ev.category = req.category;
  ev.transition = "submit";
  ev.epsilon = req.epsilon;

  auto reject = [&](ErrorCode code, std::string detail) {
    r.error = code;
    r.detail = std::move(detail);
    ev.state = JobState::failed;
    ev.error = code;
    emit_pipeline_event(ev);
    return r;
  };

  if (req.epsilon.is_zero()) return reject(ErrorCode::invalid_epsilon, "epsilon must be positive");

  auto pol = policy(req.category);
  if (!pol) return reject(ErrorCode::unknown_category, req.category);

  if (!deps_.verifier->has_circuit(req.circuit_id)) {
    return reject(ErrorCode::unknown_circuit, req.circuit_id);
  }

  const std::vector<std::string> frameworks(pol->frameworks.begin(), pol->frameworks.end());
  auto many = deps_.compliance->evaluate_many(frameworks, req.metadata);
  r.compliance = many.results;
  if (many.error != ErrorCode::none) return reject(many.error, many.detail);
  if (!many.all_compliant()) {
    return reject(ErrorCode::compliance_violation, describe_violations(many.results));
  }

  auto rsv = deps_.ledger->check_and_reserve(req.category, req.epsilon);
  if (rsv.error != ErrorCode::none) return reject(rsv.error, rsv.detail);

  auto slot = std::make_shared<Slot>();
  AnalyticsJob& job = slot->job;
  job.id = next_id_.fetch_add(1);
  job.requester = req.requester;
  job.dataset = req.dataset;
  job.category = req.category;
  job.circuit_id = req.circuit_id;
  job.epsilon = req.epsilon;
  job.created_at_ms = deps_.clock->now_unix_ms();
  job.updated_at_ms = job.created_at_ms;
  job.state = JobState::pending;
  job.reservation_id = rsv.reservation_id;

  Outcome persisted = deps_.journal->persist(LedgerEvent{kKindJob, job_key(job.id), job_to_json(job)});
  if (!persisted.ok()) {
    Outcome rel = deps_.ledger->release(rsv.reservation_id);
    if (!rel.ok()) log_warning("coordinator", "release after failed journal write: " + to_string(rel.error));
    return reject(ErrorCode::persistence_failed, persisted.detail);
  }

  r.job_id = job.id;
  r.reservation_id = job.reservation_id;
  ev = event_for(job, "submit");
  {
    std::lock_guard<std::mutex> lk(jobs_mu_);
    jobs_.emplace(job.id, slot);
  }
  emit_pipeline_event(ev);
  return r;
}

// ---------------------------------------------------------------------------
// begin_processing
// ---------------------------------------------------------------------------
// The possession round trip runs in two locked phases so the holder's
// response (disk or network I/O) is never computed under the job mutex.
// open_challenge marks the window; cancel() closes the challenge if it fires
// inside it.

Outcome JobCoordinator::begin_processing(uint64_t job_id) {
  auto slot = find(job_id);
  if (!slot) return Outcome::fail(ErrorCode::unknown_job, job_key(job_id));

  std::string digest;
  std::string nonce;
  std::optional<PipelineEvent> early;
  Outcome early_result;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    AnalyticsJob& job = slot->job;
    if (job.state != JobState::pending) {
      return Outcome::fail(ErrorCode::invalid_transition, "job is " + to_string(job.state));
    }
    if (!slot->open_challenge.empty()) {
      return Outcome::fail(ErrorCode::invalid_transition, "possession check already in progress");
    }
    digest = job.dataset.digest;

    ErrorCode failure = ErrorCode::none;
    if (!deps_.possession->is_active(digest)) {
      failure = deps_.possession->handle(digest) ? ErrorCode::storage_expired : ErrorCode::unknown_handle;
    } else {
      auto ch = deps_.possession->issue_challenge(digest);
      if (ch.error != ErrorCode::none) {
        failure = ch.error;
      } else {
        nonce = ch.challenge.nonce;
        slot->open_challenge = nonce;
      }
    }
    if (failure != ErrorCode::none) {
      fail_locked(*slot, failure, "possession check could not start");
      early = event_for(job, "begin_processing");
      early_result = Outcome::fail(failure, job.failure_detail);
    }
  }
  if (early) {
    emit_pipeline_event(*early);
    return early_result;
  }

  const std::optional<std::string> response = deps_.prover->respond(digest, nonce);

  PipelineEvent ev;
  std::future<ComputationOutput> fut;
  Outcome result;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    AnalyticsJob& job = slot->job;
    const bool still_ours = slot->open_challenge == nonce;
    slot->open_challenge.clear();
    if (!still_ours || job.state != JobState::pending) {
      return Outcome::fail(ErrorCode::invalid_transition, "job left pending during possession check");
    }

    // An absent response is answered as empty so the nonce is consumed.
    auto ans = deps_.possession->answer_challenge(digest, nonce, response.value_or(""));
    ErrorCode failure = ErrorCode::none;
    std::string detail;
    if (ans.error == ErrorCode::storage_expired) {
      failure = ErrorCode::storage_expired;
      detail = "storage expired during possession check";
    } else if (ans.error != ErrorCode::none) {
      failure = ErrorCode::challenge_failed;
      detail = "challenge not evaluated: " + to_string(ans.error);
    } else if (!ans.verified) {
      failure = ErrorCode::challenge_failed;
      detail = response ? "possession proof rejected" : "holder produced no response";
    }

    if (failure == ErrorCode::none) {
      try {
        fut = deps_.backend->dispatch(job.id, job.dataset, job.circuit_id);
      } catch (const std::exception& e) {
        failure = ErrorCode::backend_failure;
        detail = std::string("dispatch failed: ") + e.what();
      }
    }

    if (failure != ErrorCode::none) {
      fail_locked(*slot, failure, detail);
      result = Outcome::fail(failure, detail);
    } else {
      const uint64_t now = deps_.clock->now_unix_ms();
      job.state = JobState::processing;
      job.updated_at_ms = now;
      slot->processing_deadline_ms = now + opts_.processing_deadline_ms;
      persist_job_locked(job);
      // Registered before the slot unlocks so a cancel or timeout always
      // finds the future to park.
      std::lock_guard<std::mutex> ilk(inflight_mu_);
      inflight_[job_id] = std::move(fut);
    }
    ev = event_for(job, "begin_processing");
  }

  emit_pipeline_event(ev);
  return result;
}

// ---------------------------------------------------------------------------
// submit_result / finalize / cancel
// ---------------------------------------------------------------------------

Outcome JobCoordinator::submit_result(uint64_t job_id, const std::string& result_hash, const Proof& proof) {
  auto slot = find(job_id);
  if (!slot) return Outcome::fail(ErrorCode::unknown_job, job_key(job_id));

  PipelineEvent ev;
  Outcome result;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    AnalyticsJob& job = slot->job;
    if (job.state != JobState::processing) {
      return Outcome::fail(ErrorCode::invalid_transition, "job is " + to_string(job.state));
    }

    // The public inputs come from the job, never from the proof.
    const std::vector<std::string> expected = deps_.backend->expected_public_inputs(job.id, job.dataset);
    std::string why;
    if (proof.circuit_id != job.circuit_id) {
      why = "proof is for circuit " + proof.circuit_id;
    } else if (!is_hex_digest(result_hash) || proof.result_hash != result_hash) {
      why = "result hash does not match proof";
    } else if (proof.public_inputs != expected) {
      why = "proof is bound to another job or dataset";
    } else if (!deps_.verifier->verify(proof, expected, job.circuit_id)) {
      why = "proof verification failed";
    }

    if (!why.empty()) {
      fail_locked(*slot, ErrorCode::proof_rejected, why);
      result = Outcome::fail(ErrorCode::proof_rejected, why);
    } else {
      job.state = JobState::completed;
      job.result_hash = result_hash;
      job.proof = proof;
      job.updated_at_ms = deps_.clock->now_unix_ms();
      slot->processing_deadline_ms = 0;
      persist_job_locked(job);
    }
    ev = event_for(job, "submit_result");
  }
  park_abandoned(job_id);
  emit_pipeline_event(ev);
  return result;
}

Outcome JobCoordinator::finalize(uint64_t job_id) {
  auto slot = find(job_id);
  if (!slot) return Outcome::fail(ErrorCode::unknown_job, job_key(job_id));

  PipelineEvent ev;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    AnalyticsJob& job = slot->job;
    if (job.state != JobState::completed) {
      return Outcome::fail(ErrorCode::invalid_transition, "job is " + to_string(job.state));
    }
    auto cr = deps_.ledger->commit(job.reservation_id);
    if (cr.error != ErrorCode::none) {
      log_warning("coordinator", "job " + job_key(job_id) + ": commit failed: " + to_string(cr.error));
      return Outcome::fail(cr.error, cr.detail);
    }
    job.state = JobState::verified;
    job.updated_at_ms = deps_.clock->now_unix_ms();
    // One record carries both the verified job and the budget it consumed,
    // so the journal never holds one without the other.
    jsonlite::Object record = job_to_json(job);
    record[kKindBudget] = ledger_entry_to_json(cr.entry);
    persist_or_warn(LedgerEvent{kKindJob, job_key(job.id), std::move(record)});
    ev = event_for(job, "finalize");
    ev.duration_ns = (job.updated_at_ms - job.created_at_ms) * kNsPerMs;
  }
  emit_pipeline_event(ev);
  return Outcome::success();
}

Outcome JobCoordinator::cancel(uint64_t job_id, const std::string& reason) {
  auto slot = find(job_id);
  if (!slot) return Outcome::fail(ErrorCode::unknown_job, job_key(job_id));

  PipelineEvent ev;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    AnalyticsJob& job = slot->job;
    if (job.state == JobState::completed) {
      return Outcome::fail(ErrorCode::cancel_not_permitted, "completed jobs must be finalized");
    }
    if (is_terminal(job.state)) {
      return Outcome::fail(ErrorCode::invalid_transition, "job is " + to_string(job.state));
    }
    if (!slot->open_challenge.empty()) {
      Outcome closed = deps_.possession->cancel_challenge(job.dataset.digest, slot->open_challenge);
      if (!closed.ok()) {
        log_warning("coordinator", "job " + job_key(job_id) + ": closing challenge: " + to_string(closed.error));
      }
      slot->open_challenge.clear();
    }
    fail_locked(*slot, ErrorCode::cancelled, reason.empty() ? "cancelled" : reason);
    ev = event_for(job, "cancel");
  }
  park_abandoned(job_id);
  emit_pipeline_event(ev);
  return Outcome::success();
}

// ---------------------------------------------------------------------------
// poll_inflight
// ---------------------------------------------------------------------------

PollReport JobCoordinator::poll_inflight() {
  PollReport rep;

  std::vector<std::pair<uint64_t, std::future<ComputationOutput>>> ready;
  {
    std::lock_guard<std::mutex> lk(inflight_mu_);
    for (auto it = inflight_.begin(); it != inflight_.end();) {
      if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        ready.emplace_back(it->first, std::move(it->second));
        it = inflight_.erase(it);
      } else {
        ++it;
      }
    }
    abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                    [](std::future<ComputationOutput>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                    }),
                     abandoned_.end());
  }

  for (auto& [job_id, fut] : ready) {
    ComputationOutput out;
    try {
      out = fut.get();
    } catch (const std::exception& e) {
      out.error = ErrorCode::backend_failure;
      out.detail = e.what();
    }
    ++rep.drained;
    if (out.error != ErrorCode::none) {
      fail_if(job_id, JobState::processing, ErrorCode::backend_failure,
              out.detail.empty() ? to_string(out.error) : out.detail, "submit_result");
      continue;
    }
    Outcome o = submit_result(job_id, out.result_hash, out.proof);
    if (o.error == ErrorCode::invalid_transition) {
      log_info("coordinator", "job " + job_key(job_id) + ": late backend result dropped (" + o.detail + ")");
    }
  }

  // Deadlines.
  std::vector<std::pair<uint64_t, std::shared_ptr<Slot>>> snapshot;
  {
    std::lock_guard<std::mutex> lk(jobs_mu_);
    snapshot.assign(jobs_.begin(), jobs_.end());
  }
  const uint64_t now = deps_.clock->now_unix_ms();
  std::vector<uint64_t> completed;
  for (auto& [job_id, slot] : snapshot) {
    std::optional<PipelineEvent> ev;
    {
      std::lock_guard<std::mutex> lk(slot->mu);
      const AnalyticsJob& job = slot->job;
      if (job.state == JobState::processing && now >= slot->processing_deadline_ms) {
        fail_locked(*slot, ErrorCode::timeout, "processing deadline exceeded");
        ev = event_for(job, "timeout");
      } else if (job.state == JobState::pending && slot->open_challenge.empty() &&
                 now >= job.created_at_ms + opts_.pending_deadline_ms) {
        fail_locked(*slot, ErrorCode::timeout, "pending deadline exceeded");
        ev = event_for(job, "timeout");
      } else if (job.state == JobState::completed) {
        completed.push_back(job_id);
      }
    }
    if (ev) {
      ++rep.timed_out;
      park_abandoned(job_id);
      emit_pipeline_event(*ev);
    }
  }

  for (uint64_t job_id : completed) {
    Outcome o = finalize(job_id);
    if (o.ok()) {
      ++rep.finalized;
    } else if (o.error != ErrorCode::invalid_transition) {
      log_warning("coordinator", "job " + job_key(job_id) + ": finalize failed: " + to_string(o.error));
    }
  }
  return rep;
}

// ---------------------------------------------------------------------------
// restore
// ---------------------------------------------------------------------------

RestoreReport JobCoordinator::restore() {
  RestoreReport rep;
  {
    std::lock_guard<std::mutex> lk(jobs_mu_);
    if (!jobs_.empty()) {
      rep.error = ErrorCode::invalid_transition;
      rep.detail = "restore must run before any job is submitted";
      return rep;
    }
  }

  std::vector<LedgerEvent> events;
  Outcome replayed = deps_.journal->replay(&events);
  if (!replayed.ok()) {
    rep.error = replayed.error;
    rep.detail = replayed.detail;
    return rep;
  }

  // Latest payload per (kind, key), in first-seen order. A verified job
  // record also carries the budget snapshot taken at its commit.
  std::vector<std::pair<std::string, std::string>> order;
  std::map<std::pair<std::string, std::string>, jsonlite::Object> latest;
  for (auto& ev : events) {
    if (ev.kind == kKindJob) {
      if (const auto* budget = jsonlite::get_object(ev.payload, kKindBudget)) {
        auto key = std::make_pair(std::string(kKindBudget), jsonlite::get_string(*budget, "category"));
        if (!latest.contains(key)) order.push_back(key);
        latest[key] = *budget;
      }
    }
    auto key = std::make_pair(ev.kind, ev.key);
    if (!latest.contains(key)) order.push_back(key);
    latest[key] = std::move(ev.payload);
  }
  auto each = [&](const char* kind, auto&& fn) {
    for (const auto& key : order) {
      if (key.first == kind) fn(key.second, latest[key]);
    }
  };

  each(kKindFramework, [&](const std::string& id, const jsonlite::Object& o) {
    std::string why;
    auto f = framework_from_json(o, &why);
    if (!f) {
      log_warning("restore", "framework " + id + ": " + why);
      return;
    }
    Outcome reg = deps_.compliance->register_framework(std::move(*f));
    if (reg.ok()) {
      ++rep.frameworks;
    } else if (reg.error != ErrorCode::already_registered) {
      log_warning("restore", "framework " + id + ": " + to_string(reg.error));
    }
  });

  each(kKindCircuit, [&](const std::string& id, const jsonlite::Object& o) {
    auto vk = verifying_key_from_json(o);
    if (!vk) {
      log_warning("restore", "circuit " + id + ": malformed verifying key");
      return;
    }
    Outcome reg = deps_.verifier->register_circuit(vk->first, vk->second);
    if (!reg.ok() && reg.error != ErrorCode::already_registered) {
      log_warning("restore", "circuit " + id + ": " + to_string(reg.error));
      return;
    }
    rep.circuits.push_back(std::move(*vk));
  });

  each(kKindBudget, [&](const std::string& cat, const jsonlite::Object& o) {
    auto entry = ledger_entry_from_json(o);
    if (!entry) {
      log_warning("restore", "budget " + cat + ": malformed entry");
      return;
    }
    deps_.ledger->restore_entry(*entry);
    ++rep.budgets;
  });

  each(kKindPolicy, [&](const std::string& cat, const jsonlite::Object& o) {
    std::string why;
    auto p = policy_from_json(o, &why);
    if (!p) {
      log_warning("restore", "policy " + cat + ": " + why);
      return;
    }
    Outcome v = validate_policy(*p, *deps_.compliance);
    if (!v.ok()) {
      log_warning("restore", "policy " + cat + ": " + to_string(v.error) + " " + v.detail);
      return;
    }
    if (!deps_.ledger->entry(p->category)) {
      Outcome opened = deps_.ledger->open_category(p->category, p->epsilon_limit, opts_.budget_period_ms);
      if (!opened.ok()) {
        log_warning("restore", "policy " + cat + ": " + to_string(opened.error));
        return;
      }
    }
    std::unique_lock<std::shared_mutex> lk(policies_mu_);
    policies_[p->category] = *p;
    ++rep.policies;
  });

  // consumed is the sum of the jobs verified in the current period. A
  // snapshot that lags behind it (lost write, out-of-order commits) is
  // raised to match.
  std::map<std::string, Epsilon> verified_in_period;
  each(kKindJob, [&](const std::string&, const jsonlite::Object& o) {
    auto job = job_from_json(o);
    if (!job || job->state != JobState::verified) return;
    auto entry = deps_.ledger->entry(job->category);
    if (!entry) return;
    const uint64_t period_start = entry->reset_at_ms > entry->period_ms ? entry->reset_at_ms - entry->period_ms : 0;
    if (job->updated_at_ms >= period_start) {
      verified_in_period[job->category] = verified_in_period[job->category] + job->epsilon;
    }
  });
  for (const auto& [cat, sum] : verified_in_period) {
    auto entry = deps_.ledger->entry(cat);
    if (!entry || sum <= entry->consumed) continue;
    log_warning("restore", "budget " + cat + ": consumed " + entry->consumed.to_string() +
                               " raised to verified total " + sum.to_string());
    entry->consumed = sum < entry->limit ? sum : entry->limit;
    deps_.ledger->restore_entry(*entry);
    persist_budget(cat);
    ++rep.reconciled;
  }

  uint64_t max_id = 0;
  std::vector<PipelineEvent> emitted;
  std::vector<uint64_t> to_finalize;
  each(kKindJob, [&](const std::string& key, const jsonlite::Object& o) {
    auto job = job_from_json(o);
    if (!job) {
      log_warning("restore", "job " + key + ": malformed record");
      return;
    }
    max_id = std::max(max_id, job->id);
    auto slot = std::make_shared<Slot>();
    slot->job = std::move(*job);
    AnalyticsJob& j = slot->job;

    if (j.state == JobState::pending || j.state == JobState::processing) {
      // The provisional reservation died with the previous process.
      fail_locked(*slot, ErrorCode::interrupted, "process restarted before the job finished", false);
      emitted.push_back(event_for(j, "restore"));
      ++rep.interrupted;
    } else if (j.state == JobState::completed) {
      auto rsv = deps_.ledger->check_and_reserve(j.category, j.epsilon);
      if (rsv.error == ErrorCode::none) {
        j.reservation_id = rsv.reservation_id;
        to_finalize.push_back(j.id);
      } else {
        log_warning("restore", "job " + key + ": cannot re-reserve budget: " + to_string(rsv.error));
        fail_locked(*slot, ErrorCode::interrupted, "budget unavailable on restore: " + to_string(rsv.error),
                    false);
        emitted.push_back(event_for(j, "restore"));
        ++rep.interrupted;
      }
    }
    std::lock_guard<std::mutex> lk(jobs_mu_);
    jobs_[j.id] = slot;
    ++rep.jobs;
  });
  if (max_id >= next_id_.load()) next_id_.store(max_id + 1);

  for (const auto& ev : emitted) emit_pipeline_event(ev);
  for (uint64_t id : to_finalize) {
    Outcome o = finalize(id);
    if (o.ok()) {
      ++rep.finalized;
    } else {
      log_warning("restore", "job " + job_key(id) + ": finalize failed: " + to_string(o.error));
    }
  }
  if (rep.interrupted > 0) {
    log_warning("restore", std::to_string(rep.interrupted) + " job(s) interrupted by restart");
  }
  return rep;
}

// ---------------------------------------------------------------------------
// Possession sweep / audit report
// ---------------------------------------------------------------------------

PossessionSweep JobCoordinator::sweep_possession() {
  PossessionSweep sweep;
  for (const auto& st : deps_.possession->list()) {
    if (!st.active) continue;
    const std::string& digest = st.handle.digest;
    auto ch = deps_.possession->issue_challenge(digest);
    // Expired between list() and the challenge.
    if (ch.error != ErrorCode::none) continue;
    ++sweep.checked;
    const std::optional<std::string> response = deps_.prover->respond(digest, ch.challenge.nonce);
    auto ans = deps_.possession->answer_challenge(digest, ch.challenge.nonce, response.value_or(""));
    if (ans.error == ErrorCode::none && ans.verified) {
      ++sweep.passed;
      continue;
    }
    ++sweep.failed;
    log_warning("possession", "dataset " + digest + " failed its periodic challenge" +
                                  (ans.error != ErrorCode::none ? ": " + to_string(ans.error) : ""));
  }
  return sweep;
}

PrivacyAuditReport JobCoordinator::audit_report() const {
  PrivacyAuditReport rep;
  const auto pols = policies();
  rep.policies = pols.size();
  rep.metrics = privacy_metrics(pols);
  rep.compliance_status = compliance_status(rep.metrics.compliance_score);

  if (rep.metrics.encryption_strength < 80) {
    rep.recommendations.push_back("Consider upgrading encryption methods for better security");
  }
  if (rep.metrics.tee_verification_level < 70) {
    rep.recommendations.push_back("Enable TEE for more sensitive data categories");
  }
  if (rep.metrics.data_leakage_risk > 30) {
    rep.recommendations.push_back("Implement additional anonymization techniques");
  }

  for (const auto& e : deps_.ledger->entries()) {
    auto st = deps_.ledger->status(e.category);
    if (!st) continue;
    if (st->utilization >= kBudgetWarningRatio) {
      rep.recommendations.push_back("Privacy budget for '" + st->category + "' is " +
                                    std::to_string(static_cast<int>(st->utilization * 100)) +
                                    "% consumed; defer further queries until the period resets");
    }
    rep.budgets.push_back(std::move(*st));
  }
  rep.active_budgets = rep.budgets.size();

  for (const auto& st : deps_.possession->list()) {
    ++rep.datasets;
    if (st.active) ++rep.active_datasets;
    rep.challenges_passed += st.challenges_passed;
    rep.challenges_failed += st.challenges_failed;
  }
  if (rep.challenges_failed > 0) {
    rep.recommendations.push_back(std::to_string(rep.challenges_failed) +
                                  " possession challenge(s) failed; re-verify the affected datasets");
  }

  rep.summary = "Privacy audit completed for " + std::to_string(rep.policies) + " policies and " +
                std::to_string(rep.active_budgets) + " active budgets";
  return rep;
}

jsonlite::Object audit_report_to_json(const PrivacyAuditReport& r) {
  jsonlite::Object o;
  o["summary"] = r.summary;
  o["policies"] = static_cast<std::uint64_t>(r.policies);
  o["active_budgets"] = static_cast<std::uint64_t>(r.active_budgets);
  o["metrics"] = privacy_metrics_to_json(r.metrics);
  o["compliance_status"] = r.compliance_status;
  jsonlite::Array recs;
  for (const auto& rec : r.recommendations) recs.emplace_back(rec);
  o["recommendations"] = std::move(recs);
  jsonlite::Array budgets;
  for (const auto& b : r.budgets) budgets.emplace_back(budget_status_to_json(b));
  o["budgets"] = std::move(budgets);
  jsonlite::Object possession;
  possession["datasets"] = static_cast<std::uint64_t>(r.datasets);
  possession["active"] = static_cast<std::uint64_t>(r.active_datasets);
  possession["challenges_passed"] = r.challenges_passed;
  possession["challenges_failed"] = r.challenges_failed;
  o["possession"] = std::move(possession);
  return o;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<AnalyticsJob> JobCoordinator::job(uint64_t job_id) const {
  auto slot = find(job_id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  return slot->job;
}

std::vector<AnalyticsJob> JobCoordinator::jobs() const {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::lock_guard<std::mutex> lk(jobs_mu_);
    for (const auto& [id, s] : jobs_) slots.push_back(s);
  }
  std::vector<AnalyticsJob> out;
  out.reserve(slots.size());
  for (const auto& s : slots) {
    std::lock_guard<std::mutex> lk(s->mu);
    out.push_back(s->job);
  }
  return out;
}

size_t JobCoordinator::inflight() const {
  std::lock_guard<std::mutex> lk(inflight_mu_);
  return inflight_.size();
}

}  // namespace insight
