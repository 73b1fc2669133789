#include "insight/privacy_ledger.hpp"

#include "insight/observability.hpp"

namespace insight {

jsonlite::Object ledger_entry_to_json(const LedgerEntry& e) {
  jsonlite::Object o;
  o["category"] = e.category;
  o["consumed"] = epsilon_to_json(e.consumed);
  o["limit"] = epsilon_to_json(e.limit);
  o["reset_at_ms"] = e.reset_at_ms;
  o["period_ms"] = e.period_ms;
  return o;
}

std::optional<LedgerEntry> ledger_entry_from_json(const jsonlite::Object& o) {
  LedgerEntry e;
  e.category = jsonlite::get_string(o, "category");
  auto consumed = epsilon_from_json(o, "consumed");
  auto limit = epsilon_from_json(o, "limit");
  if (e.category.empty() || !consumed || !limit || limit->is_zero()) return std::nullopt;
  if (*consumed > *limit) return std::nullopt;
  e.consumed = *consumed;
  e.limit = *limit;
  e.reset_at_ms = jsonlite::get_u64(o, "reset_at_ms");
  e.period_ms = jsonlite::get_u64(o, "period_ms");
  return e;
}

jsonlite::Object budget_status_to_json(const BudgetStatus& s) {
  jsonlite::Object o;
  o["category"] = s.category;
  o["consumed"] = epsilon_to_json(s.consumed);
  o["reserved"] = epsilon_to_json(s.reserved);
  o["limit"] = epsilon_to_json(s.limit);
  o["remaining"] = epsilon_to_json(s.remaining);
  o["utilization"] = s.utilization;
  o["reset_at_ms"] = s.reset_at_ms;
  return o;
}

PrivacyLedger::PrivacyLedger(std::shared_ptr<IClock> clock) : clock_(std::move(clock)) {}

std::shared_ptr<PrivacyLedger::Account> PrivacyLedger::find(const std::string& category) const {
  std::shared_lock<std::shared_mutex> lk(accounts_mu_);
  auto it = accounts_.find(category);
  return it == accounts_.end() ? nullptr : it->second;
}

Outcome PrivacyLedger::open_category(const std::string& category, Epsilon limit, uint64_t period_ms) {
  if (limit.is_zero()) return Outcome::fail(ErrorCode::invalid_epsilon, "limit must be > 0");
  auto acct = std::make_shared<Account>();
  acct->entry.category = category;
  acct->entry.limit = limit;
  acct->entry.period_ms = period_ms;
  acct->entry.reset_at_ms = clock_->now_unix_ms() + period_ms;

  std::unique_lock<std::shared_mutex> lk(accounts_mu_);
  if (accounts_.contains(category)) return Outcome::fail(ErrorCode::already_registered, category);
  accounts_.emplace(category, std::move(acct));
  return Outcome::success();
}

Outcome PrivacyLedger::set_limit(const std::string& category, Epsilon limit) {
  if (limit.is_zero()) return Outcome::fail(ErrorCode::invalid_epsilon, "limit must be > 0");
  auto acct = find(category);
  if (!acct) return Outcome::fail(ErrorCode::unknown_category, category);
  std::lock_guard<std::mutex> lk(acct->mu);
  const Epsilon committed = acct->entry.consumed + acct->entry.reserved;
  if (limit < committed) {
    return Outcome::fail(ErrorCode::budget_limit_conflict,
                         "limit " + limit.to_string() + " < consumed+reserved " + committed.to_string());
  }
  acct->entry.limit = limit;
  return Outcome::success();
}

void PrivacyLedger::restore_entry(const LedgerEntry& entry) {
  auto acct = find(entry.category);
  if (!acct) {
    auto fresh = std::make_shared<Account>();
    fresh->entry.category = entry.category;
    std::unique_lock<std::shared_mutex> lk(accounts_mu_);
    acct = accounts_.emplace(entry.category, std::move(fresh)).first->second;
  }
  std::lock_guard<std::mutex> lk(acct->mu);
  acct->entry.consumed = entry.consumed;
  acct->entry.reserved = Epsilon{};
  acct->entry.limit = entry.limit;
  acct->entry.reset_at_ms = entry.reset_at_ms;
  acct->entry.period_ms = entry.period_ms;
}

PrivacyLedger::ReserveResult PrivacyLedger::check_and_reserve(const std::string& category, Epsilon epsilon) {
  ReserveResult r;
  if (epsilon.is_zero()) {
    r.error = ErrorCode::invalid_epsilon;
    r.detail = "epsilon must be > 0";
    return r;
  }
  auto acct = find(category);
  if (!acct) {
    r.error = ErrorCode::unknown_category;
    r.detail = category;
    return r;
  }

  std::lock_guard<std::mutex> lk(acct->mu);
  LedgerEntry& e = acct->entry;
  const Epsilon used = e.consumed + e.reserved;
  r.available = used < e.limit ? e.limit - used : Epsilon{};
  if (epsilon > r.available) {
    r.error = ErrorCode::insufficient_budget;
    r.detail = "requested " + epsilon.to_string() + ", available " + r.available.to_string();
    return r;
  }
  e.reserved = e.reserved + epsilon;

  Reservation res;
  res.id = "rsv-" + std::to_string(next_reservation_.fetch_add(1));
  res.category = category;
  res.amount = epsilon;
  res.created_at_ms = clock_->now_unix_ms();
  r.reservation_id = res.id;
  {
    std::lock_guard<std::mutex> rlk(resv_mu_);
    reservations_.emplace(res.id, std::move(res));
  }
  return r;
}

std::optional<Reservation> PrivacyLedger::take_reservation(const std::string& reservation_id) {
  std::lock_guard<std::mutex> lk(resv_mu_);
  auto it = reservations_.find(reservation_id);
  if (it == reservations_.end()) return std::nullopt;
  Reservation res = std::move(it->second);
  reservations_.erase(it);
  return res;
}

PrivacyLedger::CommitResult PrivacyLedger::commit(const std::string& reservation_id) {
  CommitResult r;
  auto res = take_reservation(reservation_id);
  if (!res) {
    r.error = ErrorCode::unknown_reservation;
    r.detail = reservation_id;
    return r;
  }
  auto acct = find(res->category);
  if (!acct) {
    r.error = ErrorCode::unknown_category;
    r.detail = res->category;
    return r;
  }
  double utilization = 0;
  {
    std::lock_guard<std::mutex> lk(acct->mu);
    LedgerEntry& e = acct->entry;
    e.reserved = e.reserved - res->amount;
    e.consumed = e.consumed + res->amount;
    r.entry = e;
    utilization = e.consumed.ratio_of(e.limit);
  }
  if (utilization >= kBudgetWarningRatio) {
    log_warning("ledger", "category '" + res->category + "' has consumed " + r.entry.consumed.to_string() +
                              " of " + r.entry.limit.to_string() + " epsilon");
  }
  return r;
}

Outcome PrivacyLedger::release(const std::string& reservation_id) {
  auto res = take_reservation(reservation_id);
  if (!res) return Outcome::fail(ErrorCode::unknown_reservation, reservation_id);
  auto acct = find(res->category);
  if (!acct) return Outcome::fail(ErrorCode::unknown_category, res->category);
  std::lock_guard<std::mutex> lk(acct->mu);
  acct->entry.reserved = acct->entry.reserved - res->amount;
  return Outcome::success();
}

PrivacyLedger::CommitResult PrivacyLedger::reset_period(const std::string& category) {
  CommitResult r;
  auto acct = find(category);
  if (!acct) {
    r.error = ErrorCode::unknown_category;
    r.detail = category;
    return r;
  }
  const uint64_t now = clock_->now_unix_ms();
  std::lock_guard<std::mutex> lk(acct->mu);
  LedgerEntry& e = acct->entry;
  if (now < e.reset_at_ms) {
    r.error = ErrorCode::reset_not_due;
    r.detail = "reset due at " + std::to_string(e.reset_at_ms);
    r.entry = e;
    return r;
  }
  e.consumed = Epsilon{};
  if (e.period_ms == 0) {
    e.reset_at_ms = now;
  } else {
    const uint64_t behind = (now - e.reset_at_ms) / e.period_ms + 1;
    e.reset_at_ms += behind * e.period_ms;
  }
  r.entry = e;
  return r;
}

std::optional<LedgerEntry> PrivacyLedger::entry(const std::string& category) const {
  auto acct = find(category);
  if (!acct) return std::nullopt;
  std::lock_guard<std::mutex> lk(acct->mu);
  return acct->entry;
}

std::optional<BudgetStatus> PrivacyLedger::status(const std::string& category) const {
  auto e = entry(category);
  if (!e) return std::nullopt;
  BudgetStatus s;
  s.category = e->category;
  s.consumed = e->consumed;
  s.reserved = e->reserved;
  s.limit = e->limit;
  const Epsilon used = e->consumed + e->reserved;
  s.remaining = used < e->limit ? e->limit - used : Epsilon{};
  s.utilization = e->consumed.ratio_of(e->limit);
  s.reset_at_ms = e->reset_at_ms;
  return s;
}

std::vector<LedgerEntry> PrivacyLedger::entries() const {
  std::vector<std::shared_ptr<Account>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lk(accounts_mu_);
    for (const auto& [cat, a] : accounts_) snapshot.push_back(a);
  }
  std::vector<LedgerEntry> out;
  for (const auto& a : snapshot) {
    std::lock_guard<std::mutex> lk(a->mu);
    out.push_back(a->entry);
  }
  return out;
}

std::optional<Reservation> PrivacyLedger::reservation(const std::string& reservation_id) const {
  std::lock_guard<std::mutex> lk(resv_mu_);
  auto it = reservations_.find(reservation_id);
  if (it == reservations_.end()) return std::nullopt;
  return it->second;
}

size_t PrivacyLedger::open_reservations() const {
  std::lock_guard<std::mutex> lk(resv_mu_);
  return reservations_.size();
}

}  // namespace insight
