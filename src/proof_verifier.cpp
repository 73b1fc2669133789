#include "insight/proof_verifier.hpp"

#include <mutex>

#include "insight/hash.hpp"
#include "insight/version.hpp"

namespace insight {

jsonlite::Object verifying_key_to_json(const std::string& circuit_id, const VerifyingKey& vk) {
  jsonlite::Object o;
  o["circuit_id"] = circuit_id;
  o["key_material"] = vk.key_material;
  o["public_input_arity"] = static_cast<std::uint64_t>(vk.public_input_arity);
  o["commitment_version"] = static_cast<std::uint64_t>(version::PROOF_COMMITMENT_VERSION);
  return o;
}

std::optional<std::pair<std::string, VerifyingKey>> verifying_key_from_json(const jsonlite::Object& o) {
  const std::string id = jsonlite::get_string(o, "circuit_id");
  const auto arity = jsonlite::get_u64(o, "public_input_arity", 0);
  if (id.empty() || arity == 0 || arity > UINT32_MAX) return std::nullopt;
  VerifyingKey vk;
  vk.key_material = jsonlite::get_string(o, "key_material");
  vk.public_input_arity = static_cast<uint32_t>(arity);
  return std::make_pair(id, vk);
}

std::string verifying_key_fingerprint(const VerifyingKey& vk) {
  return hash_domain(kDomainVerifyKey, vk.key_material);
}

std::string commit_proof(const VerifyingKey& vk, const std::string& circuit_id,
                         const std::vector<std::string>& public_inputs,
                         const std::string& result_hash) {
  // A JSON array keeps the framing unambiguous for inputs of any content.
  jsonlite::Array framed;
  framed.emplace_back(verifying_key_fingerprint(vk));
  framed.emplace_back(circuit_id);
  for (const auto& in : public_inputs) framed.emplace_back(in);
  framed.emplace_back(result_hash);
  return hash_domain(kDomainProof, jsonlite::to_json(jsonlite::Value(std::move(framed))));
}

Outcome CommitmentProofVerifier::register_circuit(const std::string& circuit_id, const VerifyingKey& vk) {
  if (circuit_id.empty() || vk.public_input_arity == 0) {
    return Outcome::fail(ErrorCode::config_invalid, "circuit id and arity are required");
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (keys_.contains(circuit_id)) return Outcome::fail(ErrorCode::already_registered, circuit_id);
  keys_.emplace(circuit_id, vk);
  return Outcome::success();
}

bool CommitmentProofVerifier::has_circuit(const std::string& circuit_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return keys_.contains(circuit_id);
}

std::vector<std::string> CommitmentProofVerifier::circuit_ids() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& [id, vk] : keys_) out.push_back(id);
  return out;
}

bool CommitmentProofVerifier::verify(const Proof& proof, const std::vector<std::string>& public_inputs,
                                     const std::string& circuit_id) const {
  VerifyingKey vk;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = keys_.find(circuit_id);
    if (it == keys_.end()) return false;
    vk = it->second;
  }
  if (proof.circuit_id != circuit_id) return false;
  if (public_inputs.size() != vk.public_input_arity) return false;
  if (!is_hex_digest(proof.proof_bytes) || !is_hex_digest(proof.result_hash)) return false;
  return proof.proof_bytes == commit_proof(vk, circuit_id, public_inputs, proof.result_hash);
}

}  // namespace insight
