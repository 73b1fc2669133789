#pragma once

// insight/privacy_ledger.hpp — Per-category differential-privacy budget.
//
// DESIGN:
//   Budget is reserved at admission and committed only when a job is
//   finalized. A reservation that is released (failed, cancelled, timed-out
//   job) returns its epsilon to the category as if it never existed.
//
// INVARIANTS:
//   1. consumed + reserved <= limit at all times, so consumed <= limit after
//      every commit.
//   2. check_and_reserve() is atomic per category: the availability check and
//      the reservation happen under the category's mutex.
//   3. reset_at only moves through reset_period(); nothing resets implicitly.
//   4. All arithmetic is fixed point (Epsilon). Subtraction only happens
//      after the ledger has established a >= b.
//
// CONCURRENCY:
//   Accounts are looked up under a shared_mutex and mutated under their own
//   mutex, so categories never contend with each other. The reservation index
//   has its own mutex and is never held while acquiring an account mutex.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "insight/clock.hpp"
#include "insight/types.hpp"

namespace insight {

struct LedgerEntry {
  std::string category;
  Epsilon consumed;
  Epsilon reserved;
  Epsilon limit;
  uint64_t reset_at_ms{0};
  uint64_t period_ms{0};
};

jsonlite::Object ledger_entry_to_json(const LedgerEntry& e);
std::optional<LedgerEntry> ledger_entry_from_json(const jsonlite::Object& o);

struct Reservation {
  std::string id;
  std::string category;
  Epsilon amount;
  uint64_t created_at_ms{0};
};

struct BudgetStatus {
  std::string category;
  Epsilon consumed;
  Epsilon reserved;
  Epsilon limit;
  Epsilon remaining;     // limit - consumed - reserved
  double utilization{0}; // consumed / limit, reporting only
  uint64_t reset_at_ms{0};
};

jsonlite::Object budget_status_to_json(const BudgetStatus& s);

// Utilization at or above this fraction of the limit logs a warning on commit.
inline constexpr double kBudgetWarningRatio = 0.8;

class PrivacyLedger {
 public:
  explicit PrivacyLedger(std::shared_ptr<IClock> clock);

  // Create a category with consumed = 0 and reset_at = now + period_ms.
  // already_registered | invalid_epsilon (zero limit)
  Outcome open_category(const std::string& category, Epsilon limit, uint64_t period_ms);

  // Change the limit. budget_limit_conflict if limit < consumed + reserved.
  Outcome set_limit(const std::string& category, Epsilon limit);

  // Install a persisted entry (restart). Reserved is always zero afterwards:
  // provisional reservations do not survive the process.
  void restore_entry(const LedgerEntry& entry);

  struct ReserveResult {
    ErrorCode error{ErrorCode::none};
    std::string detail;
    std::string reservation_id;
    Epsilon available;  // before this reservation
  };
  ReserveResult check_and_reserve(const std::string& category, Epsilon epsilon);

  struct CommitResult {
    ErrorCode error{ErrorCode::none};
    std::string detail;
    LedgerEntry entry;  // snapshot after the change
  };
  // reserved -> consumed. unknown_reservation if already committed/released.
  CommitResult commit(const std::string& reservation_id);

  // Drop a provisional reservation. unknown_reservation if not open.
  Outcome release(const std::string& reservation_id);

  // reset_not_due if now < reset_at. Otherwise consumed = 0 and reset_at
  // advances in whole periods until it is in the future. Open reservations
  // are unaffected.
  CommitResult reset_period(const std::string& category);

  std::optional<LedgerEntry> entry(const std::string& category) const;
  std::optional<BudgetStatus> status(const std::string& category) const;
  std::vector<LedgerEntry> entries() const;

  std::optional<Reservation> reservation(const std::string& reservation_id) const;
  size_t open_reservations() const;

 private:
  struct Account {
    mutable std::mutex mu;
    LedgerEntry entry;
  };

  std::shared_ptr<Account> find(const std::string& category) const;
  std::optional<Reservation> take_reservation(const std::string& reservation_id);

  std::shared_ptr<IClock> clock_;

  mutable std::shared_mutex accounts_mu_;
  std::map<std::string, std::shared_ptr<Account>> accounts_;

  mutable std::mutex resv_mu_;
  std::map<std::string, Reservation> reservations_;
  std::atomic<uint64_t> next_reservation_{1};
};

}  // namespace insight
