#include "insight/clock.hpp"

#include <chrono>

namespace insight {

std::uint64_t SystemClock::now_unix_ms() const {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace insight
