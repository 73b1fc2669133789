#include "insight/hash.hpp"

// Hash authority.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Current: BLAKE3-256, domain separation via prefix.
//   Upgrade path:
//     1. Increment version::HASH_ALGORITHM_VERSION.
//     2. Accept both versions while stored digests are migrated.
//     3. Drop the old version once the content store has been rewritten.
//   Every persisted digest is tied to this version; never change it silently.

#include <array>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace insight {
namespace {

// Incremental hasher; every public entry point funnels through it so the
// hex encoding and output length live in one place.
class Blake3Hex {
 public:
  Blake3Hex() { blake3_hasher_init(&hasher_); }

  Blake3Hex& update(std::string_view bytes) {
    blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
    return *this;
  }

  std::string finish() {
    static constexpr char kHexChars[] = "0123456789abcdef";
    std::array<unsigned char, BLAKE3_OUT_LEN> out{};
    blake3_hasher_finalize(&hasher_, out.data(), out.size());
    std::string hex(out.size() * 2, '0');
    for (std::size_t i = 0; i < out.size(); ++i) {
      hex[i * 2] = kHexChars[out[i] >> 4];
      hex[i * 2 + 1] = kHexChars[out[i] & 0x0f];
    }
    return hex;
  }

 private:
  blake3_hasher hasher_;
};

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  return HashRuntimeInfo{"blake3", blake3_version()};
}

std::string blake3_hex(std::string_view payload) { return Blake3Hex().update(payload).finish(); }

std::string hash_file_blake3(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return {};

  Blake3Hex h;
  std::array<char, 64 * 1024> buffer{};
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize n = file.gcount();
    if (n > 0) h.update(std::string_view(buffer.data(), static_cast<std::size_t>(n)));
  }
  return h.finish();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Blake3Hex().update(domain).update(payload).finish();
}

std::string hash_domain_parts(std::string_view domain, std::initializer_list<std::string_view> parts) {
  Blake3Hex h;
  h.update(domain);
  for (std::string_view p : parts) h.update(p);
  return h.finish();
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!(c >= '0' && c <= '9') && !(c >= 'a' && c <= 'f')) return false;
  }
  return true;
}

std::string cas_content_hash(std::string_view raw_bytes) { return hash_domain(kDomainContent, raw_bytes); }

}  // namespace insight
