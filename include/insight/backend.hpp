#pragma once

// insight/backend.hpp — Computation backend seam.
//
// DESIGN:
//   dispatch() starts the computation and returns immediately with a future.
//   The coordinator never blocks on it: poll_inflight() drains futures that
//   are ready and times out the ones that are not.
//
// CONTRACT:
//   - The future yields a ComputationOutput. A backend that fails reports
//     backend_failure in `error`; an exception escaping the future is also
//     converted to backend_failure by the coordinator.
//   - expected_public_inputs() names the inputs a proof for (job, dataset)
//     must carry. The coordinator derives them itself and never trusts the
//     inputs a proof claims. The default is {dataset digest, job id}.
//
// EXTENSION_POINT: remote_backend
//   Current: ReferenceBackend runs in-process on std::async.
//   A TEE or MPC backend implements IComputationBackend and returns a future
//   fed by its transport.

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "insight/cas.hpp"
#include "insight/proof_verifier.hpp"
#include "insight/types.hpp"

namespace insight {

struct ComputationOutput {
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::string result_hash;
  Proof proof;
};

// Public inputs the reference circuits are keyed on.
std::vector<std::string> reference_public_inputs(uint64_t job_id, const DatasetHandle& dataset);

class IComputationBackend {
 public:
  virtual ~IComputationBackend() = default;
  virtual std::future<ComputationOutput> dispatch(uint64_t job_id, const DatasetHandle& dataset,
                                                  const std::string& circuit_id) = 0;
  virtual std::string backend_id() const = 0;
  virtual std::vector<std::string> expected_public_inputs(uint64_t job_id, const DatasetHandle& dataset) const {
    return reference_public_inputs(job_id, dataset);
  }
};

// hash_domain("res:", circuit_id || 0x00 || bytes)
std::string reference_result_hash(const std::string& circuit_id, const std::string& bytes);

class ReferenceBackend : public IComputationBackend {
 public:
  explicit ReferenceBackend(std::shared_ptr<IContentStore> content);

  // Proving keys. A circuit without a key fails with backend_failure.
  Outcome add_circuit(const std::string& circuit_id, const VerifyingKey& vk);

  std::future<ComputationOutput> dispatch(uint64_t job_id, const DatasetHandle& dataset,
                                          const std::string& circuit_id) override;
  std::string backend_id() const override { return "reference"; }

 private:
  std::shared_ptr<IContentStore> content_;
  mutable std::shared_mutex mu_;
  std::map<std::string, VerifyingKey> keys_;
};

}  // namespace insight
