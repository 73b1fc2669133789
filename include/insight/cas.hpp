#pragma once

// insight/cas.hpp — Content store for dataset bytes.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Key = BLAKE3("cas:" || original_bytes). Content-addressed, never
//      location-addressed. The digest IS the dataset handle.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity of both the stored blob and the decoded
//      content before returning. Any mismatch returns nullopt (fail closed).
//   4. Deduplication: a second put() of the same content returns the same
//      digest without rewriting.
//   5. Pinned objects are never removed, by remove() or by the collector.
//
// Only the possession store's data path talks to the content store. The job
// coordinator never reads dataset bytes.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "insight/clock.hpp"

namespace insight {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

// ---------------------------------------------------------------------------
// IContentStore — storage collaborator interface
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
//
// EXTENSION_POINT: network_content_store
//   An IPFS- or CDN-backed store plugs in here. It must keep invariant 1 (the
//   digest scheme) so existing dataset handles stay valid.
class IContentStore {
 public:
  virtual ~IContentStore() = default;

  // Store data. Returns the content digest on success, "" on failure.
  virtual std::string put(const std::string& data) = 0;

  // Retrieve data by digest. nullopt if not found or integrity fails.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  // Pinning keeps an object alive across garbage collection. Both return
  // false if the object is unknown or the pin journal cannot be written.
  virtual bool pin(const std::string& digest) = 0;
  virtual bool unpin(const std::string& digest) = 0;
  virtual bool is_pinned(const std::string& digest) const = 0;

  // Remove data and metadata. Refuses (false) for pinned objects.
  virtual bool remove(const std::string& digest) = 0;

  virtual bool contains(const std::string& digest) const = 0;
  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;

  // Enumerate stored objects in digest order.
  // limit: max records (0 = unlimited). start_after: resume token (digest).
  virtual std::vector<CasObjectInfo> scan_objects(size_t limit = 0,
                                                  const std::string& start_after = "") const = 0;

  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore — local filesystem implementation
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/AB/CD/<digest>        blob (identity or zstd)
//   <root>/objects/AB/CD/<digest>.meta   JSON metadata
//   <root>/index.ndjson                  append-only metadata index
//   <root>/pins.ndjson                   append-only pin/unpin journal
//
// compression: "off" or "zstd". "zstd" silently degrades to identity when the
// build has no zstd support (INSIGHT_WITH_ZSTD undefined).
class CasStore : public IContentStore {
 public:
  explicit CasStore(std::string root, std::string compression = "off",
                    std::shared_ptr<IClock> clock = nullptr);

  std::string put(const std::string& data) override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool pin(const std::string& digest) override;
  bool unpin(const std::string& digest) override;
  bool is_pinned(const std::string& digest) const override;
  bool remove(const std::string& digest) override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::vector<CasObjectInfo> scan_objects(size_t limit = 0,
                                          const std::string& start_after = "") const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  // Rewrite index.ndjson and pins.ndjson to drop dead entries.
  bool compact();

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string meta_path(const std::string& digest) const;
  std::string index_path() const;
  std::string pins_path() const;
  void load_state() const;  // requires mu_
  bool append_line(const std::string& path, const std::string& line) const;

  std::string root_;
  std::string compression_;
  std::shared_ptr<IClock> clock_;
  mutable std::mutex mu_;
  mutable std::map<std::string, CasObjectInfo> index_;
  mutable std::set<std::string> pins_;
  mutable bool loaded_{false};
};

// ---------------------------------------------------------------------------
// CasGarbageCollector — retention policy enforcement
// ---------------------------------------------------------------------------
struct GcReport {
  size_t scanned{0};
  size_t removed{0};
  size_t skipped_pinned{0};
};

class CasGarbageCollector {
 public:
  CasGarbageCollector(std::shared_ptr<IContentStore> store, std::shared_ptr<IClock> clock);

  // Remove unpinned objects older than max_age. With dry_run nothing is
  // deleted; `removed` then counts what would have been.
  GcReport prune(std::chrono::seconds max_age, bool dry_run = false);

 private:
  std::shared_ptr<IContentStore> store_;
  std::shared_ptr<IClock> clock_;
};

}  // namespace insight
