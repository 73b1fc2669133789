#include "insight/watchdog.hpp"

namespace insight {

JobWatchdog::JobWatchdog(std::shared_ptr<JobCoordinator> coordinator, std::chrono::milliseconds interval,
                         std::chrono::milliseconds possession_interval)
    : coordinator_(std::move(coordinator)), interval_(interval), possession_interval_(possession_interval) {}

JobWatchdog::~JobWatchdog() { stop(); }

void JobWatchdog::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void JobWatchdog::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool JobWatchdog::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_;
}

void JobWatchdog::worker_loop() {
  auto last_sweep = std::chrono::steady_clock::now();
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    const PollReport rep = coordinator_->poll_inflight();
    ticks_.fetch_add(1, std::memory_order_relaxed);
    if (rep.timed_out > 0) {
      log_info("watchdog", std::to_string(rep.timed_out) + " job(s) timed out");
    }

    if (possession_interval_.count() == 0) continue;
    const auto now = std::chrono::steady_clock::now();
    if (now - last_sweep < possession_interval_) continue;
    last_sweep = now;
    const PossessionSweep sweep = coordinator_->sweep_possession();
    sweeps_.fetch_add(1, std::memory_order_relaxed);
    if (sweep.failed > 0) {
      log_info("watchdog", std::to_string(sweep.failed) + "/" + std::to_string(sweep.checked) +
                               " dataset(s) failed the possession sweep");
    }
  }
}

}  // namespace insight
