#pragma once

// insight/hash.hpp — Hashing authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks.
//   2. Domain separation: every digest that crosses a component boundary is
//      computed with a prefix so a possession response can never be replayed
//      as a proof commitment or a content id.
//   3. Hex digests are exactly 64 lowercase characters.

#include <initializer_list>
#include <string>
#include <string_view>

namespace insight {

// Domain prefixes. Part of the persisted format (see version.hpp).
inline constexpr std::string_view kDomainContent    = "cas:";
inline constexpr std::string_view kDomainPossession = "pdp:";
inline constexpr std::string_view kDomainProof      = "zkp:";
inline constexpr std::string_view kDomainResult     = "res:";
inline constexpr std::string_view kDomainVerifyKey  = "vk:";

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// Core BLAKE3 hashing (hex, 64 chars).
std::string blake3_hex(std::string_view payload);

// Stream-hash a file with a 64 KB buffer. Returns the hex digest, or an
// empty string if the file cannot be opened.
std::string hash_file_blake3(const std::string& path);

// Domain-separated hashing: BLAKE3(domain || payload), hex.
std::string hash_domain(std::string_view domain, std::string_view payload);

// BLAKE3(domain || parts[0] || parts[1] || ...). No separators are inserted;
// callers whose parts vary in length must frame them themselves.
std::string hash_domain_parts(std::string_view domain, std::initializer_list<std::string_view> parts);

// True iff `s` is a 64-char lowercase hex string.
bool is_hex_digest(std::string_view s);

std::string cas_content_hash(std::string_view raw_bytes);

}  // namespace insight
