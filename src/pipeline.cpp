#include "insight/pipeline.hpp"

#include <filesystem>

#include "insight/observability.hpp"

namespace fs = std::filesystem;

namespace insight {

namespace {

Pipeline::OpenResult open_failed(ErrorCode code, std::string detail) {
  Pipeline::OpenResult r;
  r.error = code;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

Pipeline::OpenResult Pipeline::open(const PipelineConfig& config, std::shared_ptr<IClock> clock,
                                    std::shared_ptr<ILedgerClient> journal) {
  std::unique_ptr<Pipeline> p(new Pipeline());
  p->config_ = config;
  p->clock_ = clock ? std::move(clock) : std::make_shared<SystemClock>();

  std::error_code ec;
  fs::create_directories(config.storage_root, ec);
  if (ec) return open_failed(ErrorCode::persistence_failed, "storage root: " + ec.message());

  if (!config.event_log.empty()) set_event_log_path(config.event_log);

  p->content_ = std::make_shared<CasStore>((fs::path(config.storage_root) / "cas").string(),
                                           config.cas_compression, p->clock_);
  auto pdp_verifier = std::make_shared<ContentPossessionVerifier>(p->content_);
  p->possession_ = std::make_shared<PossessionStore>(p->content_, pdp_verifier, p->clock_,
                                                     config.max_dataset_bytes);
  p->ledger_ = std::make_shared<PrivacyLedger>(p->clock_);
  p->compliance_ = std::make_shared<ComplianceEngine>();
  for (auto& f : builtin_frameworks()) {
    Outcome o = p->compliance_->register_framework(std::move(f));
    if (!o.ok()) return open_failed(o.error, "builtin framework: " + o.detail);
  }
  p->verifier_ = std::make_shared<CommitmentProofVerifier>();
  p->backend_ = std::make_shared<ReferenceBackend>(p->content_);

  if (journal) {
    p->journal_ = std::move(journal);
  } else {
    const fs::path ledger_path(config.resolved_ledger_path());
    if (ledger_path.has_parent_path()) {
      fs::create_directories(ledger_path.parent_path(), ec);
      if (ec) return open_failed(ErrorCode::persistence_failed, "ledger directory: " + ec.message());
    }
    auto file = std::make_shared<FileLedgerClient>(ledger_path.string(), p->clock_);
    Outcome st = file->status();
    if (!st.ok()) return open_failed(st.error, st.detail);
    p->journal_ = std::move(file);
  }

  CoordinatorDeps deps;
  deps.ledger = p->ledger_;
  deps.compliance = p->compliance_;
  deps.possession = p->possession_;
  deps.prover = std::make_shared<ContentStoreProver>(p->content_);
  deps.verifier = p->verifier_;
  deps.backend = p->backend_;
  deps.journal = p->journal_;
  deps.clock = p->clock_;

  CoordinatorOptions opts;
  opts.processing_deadline_ms = config.processing_deadline_ms;
  opts.pending_deadline_ms = config.pending_deadline_ms;
  opts.budget_period_ms = config.budget_period_ms();
  p->coordinator_ = std::make_shared<JobCoordinator>(std::move(deps), opts);

  OpenResult result;
  result.restore = p->coordinator_->restore();
  if (result.restore.error != ErrorCode::none) {
    return open_failed(result.restore.error, "journal replay: " + result.restore.detail);
  }
  for (const auto& [id, vk] : result.restore.circuits) {
    Outcome o = p->backend_->add_circuit(id, vk);
    if (!o.ok() && o.error != ErrorCode::already_registered) return open_failed(o.error, o.detail);
  }

  for (const auto& f : config.frameworks) {
    if (p->compliance_->has_framework(f.id)) continue;
    Outcome o = p->coordinator_->register_framework(f);
    if (!o.ok()) return open_failed(ErrorCode::config_invalid, "framework " + f.id + ": " + to_string(o.error));
  }
  for (const auto& pol : default_policies()) {
    if (p->coordinator_->policy(pol.category)) continue;
    Outcome o = p->coordinator_->set_policy(pol);
    if (!o.ok()) return open_failed(o.error, "default policy " + pol.category + ": " + o.detail);
  }
  for (const auto& pol : config.policies) {
    auto current = p->coordinator_->policy(pol.category);
    if (current && jsonlite::to_json(policy_to_json(*current)) == jsonlite::to_json(policy_to_json(pol))) {
      continue;
    }
    Outcome o = p->coordinator_->set_policy(pol);
    if (!o.ok()) {
      return open_failed(ErrorCode::config_invalid,
                         "policy " + pol.category + ": " + to_string(o.error) + " " + o.detail);
    }
  }
  for (const auto& [id, vk] : config.circuits) {
    if (p->verifier_->has_circuit(id)) continue;
    Outcome o = p->register_circuit(id, vk);
    if (!o.ok()) return open_failed(ErrorCode::config_invalid, "circuit " + id + ": " + to_string(o.error));
  }

  p->watchdog_ = std::make_unique<JobWatchdog>(p->coordinator_,
                                               std::chrono::milliseconds(config.watchdog_interval_ms),
                                               std::chrono::milliseconds(config.possession_sweep_ms));
  result.pipeline = std::move(p);
  return result;
}

Pipeline::~Pipeline() { stop_watchdog(); }

Outcome Pipeline::register_circuit(const std::string& circuit_id, const VerifyingKey& vk) {
  Outcome o = coordinator_->register_circuit(circuit_id, vk);
  // persistence_failed still leaves the key registered with the verifier.
  if (!o.ok() && o.error != ErrorCode::persistence_failed) return o;
  Outcome added = backend_->add_circuit(circuit_id, vk);
  return o.ok() ? added : o;
}

void Pipeline::start_watchdog() {
  if (watchdog_) watchdog_->start();
}

void Pipeline::stop_watchdog() {
  if (watchdog_) watchdog_->stop();
}

}  // namespace insight
