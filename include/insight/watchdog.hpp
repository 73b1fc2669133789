#pragma once

// insight/watchdog.hpp — Background driver for JobCoordinator::poll_inflight().
//
// Every interval the watchdog drains finished backend futures, times out
// jobs past their deadlines and finalizes completed jobs. Without it the
// caller must call poll_inflight() itself.
//
// With a non-zero possession_interval it also runs
// JobCoordinator::sweep_possession() at that cadence (checked once per tick).
//
// The thread starts in start() and is joined by stop() or the destructor.
// The coordinator must outlive the watchdog.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "insight/coordinator.hpp"

namespace insight {

class JobWatchdog {
 public:
  JobWatchdog(std::shared_ptr<JobCoordinator> coordinator, std::chrono::milliseconds interval,
              std::chrono::milliseconds possession_interval = std::chrono::milliseconds(0));
  ~JobWatchdog();

  JobWatchdog(const JobWatchdog&) = delete;
  JobWatchdog& operator=(const JobWatchdog&) = delete;

  void start();
  void stop();
  bool running() const;

  uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  uint64_t sweeps() const { return sweeps_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  std::shared_ptr<JobCoordinator> coordinator_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds possession_interval_;
  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> sweeps_{0};
};

}  // namespace insight
