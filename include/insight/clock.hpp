#pragma once

// insight/clock.hpp — Time source for deadlines, resets and timeouts.
//
// Every component that compares against "now" takes an IClock so tests can
// step time deterministically (ManualClock) instead of sleeping.

#include <atomic>
#include <cstdint>

namespace insight {

class IClock {
 public:
  virtual ~IClock() = default;
  virtual std::uint64_t now_unix_ms() const = 0;
};

class SystemClock : public IClock {
 public:
  std::uint64_t now_unix_ms() const override;
};

class ManualClock : public IClock {
 public:
  explicit ManualClock(std::uint64_t start_ms = 1'700'000'000'000ULL) : now_(start_ms) {}

  std::uint64_t now_unix_ms() const override { return now_.load(std::memory_order_acquire); }
  void set(std::uint64_t ms) { now_.store(ms, std::memory_order_release); }
  void advance(std::uint64_t ms) { now_.fetch_add(ms, std::memory_order_acq_rel); }

 private:
  std::atomic<std::uint64_t> now_;
};

constexpr std::uint64_t kMsPerSecond = 1000ULL;
constexpr std::uint64_t kMsPerDay = 24ULL * 60 * 60 * kMsPerSecond;

}  // namespace insight
