#include "insight/version.hpp"

#include <sstream>

namespace insight {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver          = "0.3.0";
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cas_format\":" << m.cas_format
    << ",\"journal_format\":" << m.journal_format
    << ",\"proof_commitment\":" << m.proof_commitment
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_journal_version(uint32_t recorded_version) {
  CompatibilityResult r;
  if (recorded_version == 0 || recorded_version > JOURNAL_FORMAT_VERSION) {
    r.ok          = false;
    r.error_code  = "journal_version_mismatch";
    r.description = "Journal record version " + std::to_string(recorded_version) +
                    " is not readable by this build (supports <= " +
                    std::to_string(JOURNAL_FORMAT_VERSION) + ").";
  }
  return r;
}

}  // namespace version
}  // namespace insight
