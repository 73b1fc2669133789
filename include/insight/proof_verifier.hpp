#pragma once

// insight/proof_verifier.hpp — Zero-knowledge proof verification seam.
//
// DESIGN:
//   The coordinator only ever asks "does this proof verify for these public
//   inputs under this circuit?". A real zk-SNARK verifier (Groth16, PLONK)
//   plugs in behind IProofVerifier without touching the coordinator.
//
// INVARIANTS:
//   1. verify() is a pure function of (proof, public_inputs, circuit_id) and
//      the registered verifying key. No clock, no counters, no leniency.
//   2. verify() fails closed: malformed proof, unknown circuit or an arity
//      mismatch all return false.
//   3. A registered verifying key is never replaced.
//
// EXTENSION_POINT: snark_verifier
//   Current: CommitmentProofVerifier, a hash commitment binding the verifying
//   key, circuit, public inputs and result hash. It proves nothing about the
//   computation itself and exists so the pipeline can run end to end.

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "insight/types.hpp"

namespace insight {

struct VerifyingKey {
  std::string key_material;
  uint32_t public_input_arity{0};
};

jsonlite::Object verifying_key_to_json(const std::string& circuit_id, const VerifyingKey& vk);
std::optional<std::pair<std::string, VerifyingKey>> verifying_key_from_json(const jsonlite::Object& o);

class IProofVerifier {
 public:
  virtual ~IProofVerifier() = default;

  // already_registered | config_invalid (empty id or zero arity)
  virtual Outcome register_circuit(const std::string& circuit_id, const VerifyingKey& vk) = 0;
  virtual bool has_circuit(const std::string& circuit_id) const = 0;
  virtual bool verify(const Proof& proof, const std::vector<std::string>& public_inputs,
                      const std::string& circuit_id) const = 0;
  virtual std::string scheme() const = 0;
};

// hash_domain("vk:", key_material)
std::string verifying_key_fingerprint(const VerifyingKey& vk);

// The commitment a prover holding `vk` produces for a result.
std::string commit_proof(const VerifyingKey& vk, const std::string& circuit_id,
                         const std::vector<std::string>& public_inputs,
                         const std::string& result_hash);

class CommitmentProofVerifier : public IProofVerifier {
 public:
  Outcome register_circuit(const std::string& circuit_id, const VerifyingKey& vk) override;
  bool has_circuit(const std::string& circuit_id) const override;
  bool verify(const Proof& proof, const std::vector<std::string>& public_inputs,
              const std::string& circuit_id) const override;
  std::string scheme() const override { return "blake3-commitment-v1"; }

  std::vector<std::string> circuit_ids() const;

 private:
  mutable std::shared_mutex mu_;
  std::map<std::string, VerifyingKey> keys_;
};

}  // namespace insight
