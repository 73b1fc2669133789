#pragma once

// insight/pipeline.hpp — Assembly of the full job pipeline from a config.
//
// DESIGN:
//   Pipeline owns every component explicitly. There are no ambient
//   registries: two Pipelines in one process share nothing except the
//   process-wide PipelineStats and event sink.
//
// STARTUP ORDER:
//   1. content store, possession store, ledger, compliance engine with the
//      built-in frameworks, proof verifier, reference backend
//   2. journal replay (JobCoordinator::restore)
//   3. config frameworks, default policies, config policies, config circuits
//      (skipped when already restored)
//
// TEARDOWN:
//   The watchdog is stopped before the coordinator is destroyed.

#include <memory>
#include <string>

#include "insight/backend.hpp"
#include "insight/cas.hpp"
#include "insight/clock.hpp"
#include "insight/compliance.hpp"
#include "insight/config.hpp"
#include "insight/coordinator.hpp"
#include "insight/ledger_client.hpp"
#include "insight/possession.hpp"
#include "insight/privacy_ledger.hpp"
#include "insight/proof_verifier.hpp"
#include "insight/watchdog.hpp"

namespace insight {

class Pipeline {
 public:
  struct OpenResult {
    ErrorCode error{ErrorCode::none};
    std::string detail;
    std::unique_ptr<Pipeline> pipeline;
    RestoreReport restore;
  };

  // journal == nullptr: a FileLedgerClient at config.resolved_ledger_path().
  static OpenResult open(const PipelineConfig& config, std::shared_ptr<IClock> clock = nullptr,
                         std::shared_ptr<ILedgerClient> journal = nullptr);

  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Registers with the coordinator (verifier + journal) and the reference
  // backend's proving keys.
  Outcome register_circuit(const std::string& circuit_id, const VerifyingKey& vk);

  void start_watchdog();
  void stop_watchdog();

  const PipelineConfig& config() const { return config_; }
  const std::shared_ptr<IClock>& clock() const { return clock_; }
  const std::shared_ptr<CasStore>& content() const { return content_; }
  const std::shared_ptr<PossessionStore>& possession() const { return possession_; }
  const std::shared_ptr<PrivacyLedger>& ledger() const { return ledger_; }
  const std::shared_ptr<ComplianceEngine>& compliance() const { return compliance_; }
  const std::shared_ptr<CommitmentProofVerifier>& verifier() const { return verifier_; }
  const std::shared_ptr<ReferenceBackend>& backend() const { return backend_; }
  const std::shared_ptr<ILedgerClient>& journal() const { return journal_; }
  const std::shared_ptr<JobCoordinator>& coordinator() const { return coordinator_; }

 private:
  Pipeline() = default;

  PipelineConfig config_;
  std::shared_ptr<IClock> clock_;
  std::shared_ptr<CasStore> content_;
  std::shared_ptr<PossessionStore> possession_;
  std::shared_ptr<PrivacyLedger> ledger_;
  std::shared_ptr<ComplianceEngine> compliance_;
  std::shared_ptr<CommitmentProofVerifier> verifier_;
  std::shared_ptr<ReferenceBackend> backend_;
  std::shared_ptr<ILedgerClient> journal_;
  std::shared_ptr<JobCoordinator> coordinator_;
  std::unique_ptr<JobWatchdog> watchdog_;
};

}  // namespace insight
