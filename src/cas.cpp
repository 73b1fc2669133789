#include "insight/cas.hpp"

// Local filesystem content store.
//
// EXTENSION_POINT: append_only_journal
//   index.ndjson and pins.ndjson are append-only and may carry dead entries
//   after remove()/unpin(). objects/ is the source of truth; load_state()
//   drops index entries whose blob is gone and compact() rewrites both files.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(INSIGHT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "insight/hash.hpp"
#include "insight/jsonlite.hpp"
#include "insight/observability.hpp"

namespace fs = std::filesystem;

namespace insight {

namespace {
#if defined(INSIGHT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: temp file, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string info_to_json(const CasObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = info.digest;
  o["encoding"] = info.encoding;
  o["original_size"] = static_cast<std::uint64_t>(info.original_size);
  o["stored_size"] = static_cast<std::uint64_t>(info.stored_size);
  o["stored_blob_hash"] = info.stored_blob_hash;
  o["created_at"] = info.created_at_unix_ts;
  return jsonlite::to_json(o);
}

std::optional<CasObjectInfo> info_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  CasObjectInfo inf;
  inf.digest = jsonlite::get_string(o, "digest");
  if (!is_hex_digest(inf.digest)) return std::nullopt;
  inf.encoding = jsonlite::get_string(o, "encoding", "identity");
  inf.original_size = jsonlite::get_u64(o, "original_size");
  inf.stored_size = jsonlite::get_u64(o, "stored_size");
  inf.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(o, "created_at");
  return inf;
}

std::string read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

CasStore::CasStore(std::string root, std::string compression, std::shared_ptr<IClock> clock)
    : root_(std::move(root)), compression_(std::move(compression)), clock_(std::move(clock)) {
  if (!clock_) clock_ = std::make_shared<SystemClock>();
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
  if (ec) log_warning("cas", "cannot create " + root_ + ": " + ec.message());
#if !defined(INSIGHT_WITH_ZSTD)
  if (compression_ == "zstd") {
    log_warning("cas", "zstd requested but not compiled in; storing identity");
  }
#endif
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string CasStore::meta_path(const std::string& digest) const { return object_path(digest) + ".meta"; }

std::string CasStore::index_path() const { return (fs::path(root_) / "index.ndjson").string(); }

std::string CasStore::pins_path() const { return (fs::path(root_) / "pins.ndjson").string(); }

bool CasStore::append_line(const std::string& path, const std::string& line) const {
  std::ofstream ofs(path, std::ios::binary | std::ios::app);
  if (!ofs) return false;
  ofs << line << '\n';
  ofs.flush();
  return static_cast<bool>(ofs);
}

void CasStore::load_state() const {
  if (loaded_) return;

  std::ifstream idx(index_path());
  std::string line;
  while (std::getline(idx, line)) {
    if (line.empty()) continue;
    auto inf = info_from_json(line);
    if (!inf) {
      log_warning("cas", "skipping malformed index line");
      continue;
    }
    if (!fs::exists(object_path(inf->digest))) continue;
    index_[inf->digest] = std::move(*inf);
  }

  std::ifstream pins(pins_path());
  while (std::getline(pins, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto o = jsonlite::parse(line, &err);
    if (err) continue;
    const auto digest = jsonlite::get_string(o, "digest");
    const auto op = jsonlite::get_string(o, "op");
    if (op == "pin") pins_.insert(digest);
    else if (op == "unpin") pins_.erase(digest);
  }
  loaded_ = true;
}

std::string CasStore::put(const std::string& data) {
  const std::string digest = cas_content_hash(data);
  if (!is_hex_digest(digest)) return {};

  const fs::path target = object_path(digest);
  const fs::path meta = meta_path(digest);
  if (fs::exists(target) && fs::exists(meta)) {
    // Dedup: verify the existing object before trusting it.
    auto existing = get(digest);
    if (!existing.has_value() || *existing != data) return {};
    global_pipeline_stats().cas_hits.fetch_add(1, std::memory_order_relaxed);
    return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(INSIGHT_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  if (!atomic_write(target, stored)) return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = clock_->now_unix_ms() / kMsPerSecond;

  const std::string meta_json = info_to_json(info);
  if (!atomic_write(meta, meta_json)) {
    std::error_code ec;
    fs::remove(target, ec);
    return {};
  }

  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  index_[digest] = info;
  if (!append_line(index_path(), meta_json)) {
    log_warning("cas", "index append failed for " + digest);
  }
  global_pipeline_stats().cas_puts.fetch_add(1, std::memory_order_relaxed);
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  {
    std::lock_guard<std::mutex> lk(mu_);
    load_state();
    auto it = index_.find(digest);
    if (it != index_.end()) return it->second;
  }
  // Index may lag a crash between meta write and index append.
  const fs::path mp = meta_path(digest);
  if (!fs::exists(mp)) return std::nullopt;
  return info_from_json(read_all(mp));
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  const fs::path p = object_path(digest);
  if (!fs::exists(p)) return std::nullopt;
  std::string data = read_all(p);

  auto meta = info(digest);
  if (!meta) return std::nullopt;

  if (blake3_hex(data) != meta->stored_blob_hash) {
    log_warning("cas", "stored blob hash mismatch for " + digest);
    return std::nullopt;
  }

  if (meta->encoding == "zstd") {
#if defined(INSIGHT_WITH_ZSTD)
    auto plain = decompress_zstd(data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(*plain);
#else
    log_warning("cas", "object " + digest + " is zstd-encoded but zstd is not compiled in");
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (cas_content_hash(data) != digest) {
    log_warning("cas", "content digest mismatch for " + digest);
    return std::nullopt;
  }
  global_pipeline_stats().cas_gets.fetch_add(1, std::memory_order_relaxed);
  return data;
}

bool CasStore::pin(const std::string& digest) {
  if (!contains(digest)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  if (pins_.contains(digest)) return true;
  if (!append_line(pins_path(), "{\"digest\":\"" + digest + "\",\"op\":\"pin\"}")) return false;
  pins_.insert(digest);
  return true;
}

bool CasStore::unpin(const std::string& digest) {
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  if (!pins_.contains(digest)) return false;
  if (!append_line(pins_path(), "{\"digest\":\"" + digest + "\",\"op\":\"unpin\"}")) return false;
  pins_.erase(digest);
  return true;
}

bool CasStore::is_pinned(const std::string& digest) const {
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  return pins_.contains(digest);
}

bool CasStore::remove(const std::string& digest) {
  if (!is_hex_digest(digest)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  if (pins_.contains(digest)) return false;

  std::error_code ec;
  fs::remove(object_path(digest), ec);
  if (ec) return false;
  fs::remove(meta_path(digest), ec);
  if (ec) return false;
  index_.erase(digest);
  return true;
}

bool CasStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  return fs::exists(object_path(digest));
}

std::size_t CasStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  return index_.size();
}

std::vector<CasObjectInfo> CasStore::scan_objects(size_t limit, const std::string& start_after) const {
  std::vector<CasObjectInfo> out;
  std::lock_guard<std::mutex> lk(mu_);
  load_state();
  auto it = start_after.empty() ? index_.begin() : index_.upper_bound(start_after);
  for (; it != index_.end(); ++it) {
    if (limit > 0 && out.size() >= limit) break;
    out.push_back(it->second);
  }
  return out;
}

bool CasStore::compact() {
  std::lock_guard<std::mutex> lk(mu_);
  load_state();

  std::string index_text;
  for (const auto& [digest, inf] : index_) index_text += info_to_json(inf) + "\n";
  std::string pins_text;
  for (const auto& digest : pins_) pins_text += "{\"digest\":\"" + digest + "\",\"op\":\"pin\"}\n";

  return atomic_write(index_path(), index_text) && atomic_write(pins_path(), pins_text);
}

// ---------------------------------------------------------------------------
// CasGarbageCollector
// ---------------------------------------------------------------------------

CasGarbageCollector::CasGarbageCollector(std::shared_ptr<IContentStore> store,
                                         std::shared_ptr<IClock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

GcReport CasGarbageCollector::prune(std::chrono::seconds max_age, bool dry_run) {
  GcReport report;
  std::string start_after;
  const size_t batch_size = 1000;
  const uint64_t now = clock_->now_unix_ms() / kMsPerSecond;
  const uint64_t age = static_cast<uint64_t>(max_age.count());
  const uint64_t cutoff = now > age ? now - age : 0;

  while (true) {
    auto batch = store_->scan_objects(batch_size, start_after);
    if (batch.empty()) break;

    for (const auto& obj : batch) {
      ++report.scanned;
      start_after = obj.digest;
      // created_at == 0 means unknown age; keep it.
      if (obj.created_at_unix_ts == 0 || obj.created_at_unix_ts >= cutoff) continue;
      if (store_->is_pinned(obj.digest)) {
        ++report.skipped_pinned;
        continue;
      }
      if (dry_run || store_->remove(obj.digest)) ++report.removed;
    }

    if (batch.size() < batch_size) break;
  }
  return report;
}

}  // namespace insight
