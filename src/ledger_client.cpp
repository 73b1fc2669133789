#include "insight/ledger_client.hpp"

namespace insight {

// ---------------------------------------------------------------------------
// MemoryLedgerClient
// ---------------------------------------------------------------------------

Outcome MemoryLedgerClient::persist(const LedgerEvent& ev) {
  if (fail_persist_.load()) {
    return Outcome::fail(ErrorCode::persistence_failed, "injected persist failure");
  }
  std::lock_guard<std::mutex> lk(mu_);
  events_.push_back(ev);
  latest_[{ev.kind, ev.key}] = ev.payload;
  return Outcome::success();
}

std::optional<jsonlite::Object> MemoryLedgerClient::read(const std::string& kind,
                                                         const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = latest_.find({kind, key});
  if (it == latest_.end()) return std::nullopt;
  return it->second;
}

Outcome MemoryLedgerClient::replay(std::vector<LedgerEvent>* out) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (out) *out = events_;
  return Outcome::success();
}

size_t MemoryLedgerClient::event_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_.size();
}

// ---------------------------------------------------------------------------
// FileLedgerClient
// ---------------------------------------------------------------------------

FileLedgerClient::FileLedgerClient(const std::string& path, std::shared_ptr<IClock> clock)
    : log_(path, std::move(clock)) {
  if (!log_.open_error().empty()) {
    status_ = Outcome::fail(ErrorCode::persistence_failed, log_.open_error());
    return;
  }
  std::vector<AuditRecord> records;
  std::string err;
  if (!load_audit_records(path, &records, &err)) {
    status_ = Outcome::fail(ErrorCode::persistence_failed, err);
    return;
  }
  for (auto& r : records) latest_[{r.kind, r.key}] = std::move(r.payload);
}

Outcome FileLedgerClient::status() const { return status_; }

Outcome FileLedgerClient::persist(const LedgerEvent& ev) {
  if (!status_.ok()) return status_;
  AuditRecord rec;
  rec.kind = ev.kind;
  rec.key = ev.key;
  rec.payload = ev.payload;

  // Hold mu_ across the append so read() never runs ahead of the journal.
  std::lock_guard<std::mutex> lk(mu_);
  if (!log_.append(rec)) {
    return Outcome::fail(ErrorCode::persistence_failed,
                         "journal append failed: " + log_.path());
  }
  latest_[{ev.kind, ev.key}] = ev.payload;
  return Outcome::success();
}

std::optional<jsonlite::Object> FileLedgerClient::read(const std::string& kind,
                                                       const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = latest_.find({kind, key});
  if (it == latest_.end()) return std::nullopt;
  return it->second;
}

Outcome FileLedgerClient::replay(std::vector<LedgerEvent>* out) const {
  if (!status_.ok()) return status_;
  std::vector<AuditRecord> records;
  std::string err;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!load_audit_records(log_.path(), &records, &err)) {
      return Outcome::fail(ErrorCode::persistence_failed, err);
    }
  }
  if (out) {
    out->clear();
    out->reserve(records.size());
    for (auto& r : records) out->push_back(LedgerEvent{r.kind, r.key, std::move(r.payload)});
  }
  return Outcome::success();
}

}  // namespace insight
