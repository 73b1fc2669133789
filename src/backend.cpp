#include "insight/backend.hpp"

#include <mutex>

#include "insight/hash.hpp"

namespace insight {

std::vector<std::string> reference_public_inputs(uint64_t job_id, const DatasetHandle& dataset) {
  return {dataset.digest, std::to_string(job_id)};
}

std::string reference_result_hash(const std::string& circuit_id, const std::string& bytes) {
  // NUL frames the circuit id; ids never contain one.
  return hash_domain_parts(kDomainResult, {circuit_id, std::string_view("\0", 1), bytes});
}

ReferenceBackend::ReferenceBackend(std::shared_ptr<IContentStore> content)
    : content_(std::move(content)) {}

Outcome ReferenceBackend::add_circuit(const std::string& circuit_id, const VerifyingKey& vk) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (keys_.contains(circuit_id)) return Outcome::fail(ErrorCode::already_registered, circuit_id);
  keys_.emplace(circuit_id, vk);
  return Outcome::success();
}

std::future<ComputationOutput> ReferenceBackend::dispatch(uint64_t job_id, const DatasetHandle& dataset,
                                                          const std::string& circuit_id) {
  std::optional<VerifyingKey> vk;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = keys_.find(circuit_id);
    if (it != keys_.end()) vk = it->second;
  }
  auto content = content_;
  return std::async(std::launch::async, [content, vk, job_id, dataset, circuit_id]() {
    ComputationOutput out;
    if (!vk) {
      out.error = ErrorCode::backend_failure;
      out.detail = "no proving key for circuit " + circuit_id;
      return out;
    }
    auto bytes = content->get(dataset.digest);
    if (!bytes) {
      out.error = ErrorCode::backend_failure;
      out.detail = "dataset unavailable: " + dataset.digest;
      return out;
    }
    out.result_hash = reference_result_hash(circuit_id, *bytes);
    out.proof.circuit_id = circuit_id;
    out.proof.public_inputs = reference_public_inputs(job_id, dataset);
    out.proof.result_hash = out.result_hash;
    out.proof.proof_bytes = commit_proof(*vk, circuit_id, out.proof.public_inputs, out.result_hash);
    return out;
  });
}

}  // namespace insight
