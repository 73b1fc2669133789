#include "insight/audit.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>

#include "insight/hash.hpp"
#include "insight/observability.hpp"
#include "insight/version.hpp"

namespace insight {

// ---------------------------------------------------------------------------
// AuditRecord <-> JSON
// ---------------------------------------------------------------------------

std::string audit_record_to_json(const AuditRecord& r) {
  jsonlite::Object o;
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["ts"] = r.timestamp_unix_ms;
  o["v"] = static_cast<std::uint64_t>(r.format_version);
  o["kind"] = r.kind;
  o["key"] = r.key;
  o["payload"] = r.payload;
  return jsonlite::to_json(o);
}

std::optional<AuditRecord> audit_record_from_json(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  AuditRecord r;
  r.sequence = jsonlite::get_u64(o, "seq");
  r.previous_digest = jsonlite::get_string(o, "prev");
  r.timestamp_unix_ms = jsonlite::get_u64(o, "ts");
  r.format_version = static_cast<uint32_t>(jsonlite::get_u64(o, "v"));
  r.kind = jsonlite::get_string(o, "kind");
  r.key = jsonlite::get_string(o, "key");
  if (const auto* p = jsonlite::get_object(o, "payload")) r.payload = *p;

  auto compat = version::check_journal_version(r.format_version);
  if (!compat.ok) {
    if (error) *error = compat.description;
    return std::nullopt;
  }
  if (r.sequence == 0 || r.kind.empty()) {
    if (error) *error = "record missing seq or kind";
    return std::nullopt;
  }
  return r;
}

namespace {

// Walk a journal, verifying the chain. Calls `sink` for each good record.
template <typename Sink>
AuditChainReport walk_chain(const std::string& path, Sink&& sink) {
  AuditChainReport report;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return report;

  std::string line;
  uint64_t expected_seq = 1;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::string err;
    auto rec = audit_record_from_json(line, &err);
    if (!rec) {
      report.ok = false;
      report.first_bad_sequence = expected_seq;
      report.error = "unreadable record: " + err;
      return report;
    }
    if (rec->sequence != expected_seq) {
      report.ok = false;
      report.first_bad_sequence = expected_seq;
      report.error = "sequence gap: expected " + std::to_string(expected_seq) + ", found " +
                     std::to_string(rec->sequence);
      return report;
    }
    if (rec->previous_digest != report.last_digest) {
      report.ok = false;
      report.first_bad_sequence = rec->sequence;
      report.error = "chain broken at sequence " + std::to_string(rec->sequence);
      return report;
    }
    report.last_digest = blake3_hex(line);
    ++report.entries;
    ++expected_seq;
    sink(std::move(*rec));
  }
  return report;
}

}  // namespace

AuditChainReport verify_audit_chain(const std::string& path) {
  return walk_chain(path, [](AuditRecord&&) {});
}

bool load_audit_records(const std::string& path, std::vector<AuditRecord>* out, std::string* error) {
  std::vector<AuditRecord> records;
  auto report = walk_chain(path, [&](AuditRecord&& r) { records.push_back(std::move(r)); });
  if (!report.ok) {
    if (error) *error = report.error;
    return false;
  }
  if (out) *out = std::move(records);
  return true;
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
  std::string open_error;
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path, std::shared_ptr<IClock> clock)
    : path_(path), clock_(std::move(clock)), impl_(std::make_unique<Impl>()) {
  if (!clock_) clock_ = std::make_shared<SystemClock>();

  auto report = verify_audit_chain(path_);
  if (!report.ok) {
    impl_->open_error = report.error;
    log_warning("audit", path_ + ": " + report.error + "; journal opened read-only");
    return;
  }
  impl_->seq = report.entries;
  impl_->last_digest = report.last_digest;

  impl_->file = std::fopen(path_.c_str(), "ab");
  if (!impl_->file) {
    impl_->open_error = "cannot open " + path_ + " for append";
    log_warning("audit", impl_->open_error);
  }
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool ImmutableAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  AuditRecord stamped = record;
  stamped.sequence = impl_->seq + 1;
  stamped.previous_digest = impl_->last_digest;
  stamped.timestamp_unix_ms = clock_->now_unix_ms();
  stamped.format_version = version::JOURNAL_FORMAT_VERSION;

  const std::string line = audit_record_to_json(stamped);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  const bool flushed = std::fflush(impl_->file) == 0;

  if (!written || !flushed) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    // Truncated underneath us: append-only violation.
    ++impl_->failure_count;
    return false;
  }

  impl_->seq = stamped.sequence;
  impl_->last_digest = blake3_hex(line);
  record = std::move(stamped);
  return true;
}

const std::string& ImmutableAuditLog::open_error() const { return impl_->open_error; }

uint64_t ImmutableAuditLog::last_sequence() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seq;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

}  // namespace insight
