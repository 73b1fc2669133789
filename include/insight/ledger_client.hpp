#pragma once

// insight/ledger_client.hpp — Durable record of transitions and budget commits.
//
// The coordinator depends on persistence only through persist()/read()/
// replay(). A chain or transaction layer plugs in behind ILedgerClient; no
// consensus logic lives here.
//
// Records are keyed by (kind, key). A later record for the same key
// supersedes the earlier one for read(), while replay() returns the full
// history in persistence order.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "insight/audit.hpp"
#include "insight/types.hpp"

namespace insight {

inline constexpr char kKindJob[]       = "job";
inline constexpr char kKindBudget[]    = "budget";
inline constexpr char kKindPolicy[]    = "policy";
inline constexpr char kKindFramework[] = "framework";
inline constexpr char kKindCircuit[]   = "circuit";

struct LedgerEvent {
  std::string kind;
  std::string key;
  jsonlite::Object payload;
};

class ILedgerClient {
 public:
  virtual ~ILedgerClient() = default;

  // persistence_failed if the event could not be made durable.
  virtual Outcome persist(const LedgerEvent& ev) = 0;

  // Latest payload recorded for (kind, key).
  virtual std::optional<jsonlite::Object> read(const std::string& kind,
                                               const std::string& key) const = 0;

  // Full history in persistence order. persistence_failed on an unreadable
  // or tampered store.
  virtual Outcome replay(std::vector<LedgerEvent>* out) const = 0;
};

// In-process client for tests and ephemeral pipelines.
class MemoryLedgerClient : public ILedgerClient {
 public:
  Outcome persist(const LedgerEvent& ev) override;
  std::optional<jsonlite::Object> read(const std::string& kind, const std::string& key) const override;
  Outcome replay(std::vector<LedgerEvent>* out) const override;

  // Failure injection: every persist() fails while set.
  void set_fail_persist(bool fail) { fail_persist_.store(fail); }
  size_t event_count() const;

 private:
  mutable std::mutex mu_;
  std::vector<LedgerEvent> events_;
  std::map<std::pair<std::string, std::string>, jsonlite::Object> latest_;
  std::atomic<bool> fail_persist_{false};
};

// Journal-backed client. The index is rebuilt from disk on construction.
class FileLedgerClient : public ILedgerClient {
 public:
  explicit FileLedgerClient(const std::string& path, std::shared_ptr<IClock> clock = nullptr);

  Outcome persist(const LedgerEvent& ev) override;
  std::optional<jsonlite::Object> read(const std::string& kind, const std::string& key) const override;
  Outcome replay(std::vector<LedgerEvent>* out) const override;

  // Non-ok when the existing journal failed verification.
  Outcome status() const;
  const std::string& path() const { return log_.path(); }

 private:
  ImmutableAuditLog log_;
  Outcome status_;
  mutable std::mutex mu_;
  std::map<std::pair<std::string, std::string>, jsonlite::Object> latest_;
};

}  // namespace insight
